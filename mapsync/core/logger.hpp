#pragma once

#include "config.hpp"
#include "types.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace mapsync {

class Logger {
public:
    static Logger& instance();

    // Applies logging settings (level, optional file sink).
    void init(const LoggingConfig& cfg);
    void shutdown();

    bool enabled(LogLevel level) const;

    void vlog(LogLevel level, const char* tag, const char* fmt, va_list args);

private:
    Logger();

    void write_line(std::FILE* sink, double t, const char* level_str, const char* tag,
                    const char* fmt, va_list args);

    std::mutex mutex_;
    LoggingConfig cfg_{};
    std::FILE* file_{nullptr};
    std::chrono::steady_clock::time_point start_;
};

const char* to_string(LogLevel level);

/// Formats one line as "[seconds][LEVEL][tag] message".
void logf(LogLevel level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace mapsync
