#include "logger.hpp"

namespace mapsync {

const char* to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:   return "DEBUG";
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

Logger& Logger::instance() {
    static Logger inst;
    return inst;
}

Logger::Logger()
    : start_(std::chrono::steady_clock::now())
{
}

void Logger::init(const LoggingConfig& cfg) {
    shutdown();

    std::lock_guard lock(mutex_);
    cfg_ = cfg;

    if (cfg_.enabled && !cfg_.file.empty()) {
        file_ = std::fopen(cfg_.file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "[logger] failed to open log file %s\n", cfg_.file.c_str());
        }
    }
}

void Logger::shutdown() {
    std::lock_guard lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}

bool Logger::enabled(LogLevel level) const {
    return cfg_.enabled && level >= cfg_.level;
}

void Logger::vlog(LogLevel level, const char* tag, const char* fmt, va_list args) {
    if (!enabled(level)) return;

    std::lock_guard lock(mutex_);

    const double t = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    const char* level_str = to_string(level);

    if (file_) {
        va_list args_copy;
        va_copy(args_copy, args);
        write_line(file_, t, level_str, tag, fmt, args_copy);
        va_end(args_copy);
        std::fflush(file_);
    }

    write_line(stderr, t, level_str, tag, fmt, args);
}

void Logger::write_line(std::FILE* sink, double t, const char* level_str, const char* tag,
                        const char* fmt, va_list args) {
    std::fprintf(sink, "[%.3f][%s][%s] ", t, level_str, tag);
    std::vfprintf(sink, fmt, args);
    std::fputc('\n', sink);
}

void logf(LogLevel level, const char* tag, const char* fmt, ...) {
    Logger& logger = Logger::instance();
    if (!logger.enabled(level)) return;

    va_list args;
    va_start(args, fmt);
    logger.vlog(level, tag, fmt, args);
    va_end(args);
}

} // namespace mapsync
