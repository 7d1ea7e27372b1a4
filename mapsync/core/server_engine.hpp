#pragma once

#include "app_interface.hpp"
#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace mapsync {

// ============================================================================
// ServerEngine - Runs IServerApp with a fixed tick loop
// ============================================================================

class ServerEngine : public IEngineServices {
public:
    struct Config {
        float tickRate = 30.0f;
    };

    ServerEngine();
    explicit ServerEngine(const Config& config);
    ~ServerEngine();

    /// Runs the tick loop on the current thread until stop() is called.
    void run(IServerApp& app);

    /// Request shutdown (can be called from another thread).
    void stop();

    bool is_running() const { return running_; }

    // --- IEngineServices implementation ---

    Tick current_tick() const override { return tick_; }
    float tick_rate() const override { return config_.tickRate; }
    float tick_dt() const override { return tickDt_; }

private:
    void tick_loop(IServerApp& app);

    Config config_;
    float tickDt_;

    std::atomic<bool> running_{false};
    std::atomic<Tick> tick_{0};
};

// ============================================================================
// Implementation (header-only for simplicity)
// ============================================================================

inline ServerEngine::ServerEngine()
    : ServerEngine(Config{})
{
}

inline ServerEngine::ServerEngine(const Config& config)
    : config_(config)
    , tickDt_(1.0f / (config.tickRate > 0.0f ? config.tickRate : 30.0f))
{
    if (config_.tickRate <= 0.0f) {
        config_.tickRate = 30.0f;
    }
}

inline ServerEngine::~ServerEngine() {
    stop();
}

inline void ServerEngine::run(IServerApp& app) {
    running_ = true;

    app.on_init(*this);
    logf(LogLevel::Info, "server", "engine started at %.1f TPS", config_.tickRate);

    tick_loop(app);

    app.on_shutdown();
    logf(LogLevel::Info, "server", "engine stopped after %llu ticks",
         static_cast<unsigned long long>(tick_.load()));
}

inline void ServerEngine::stop() {
    running_ = false;
}

inline void ServerEngine::tick_loop(IServerApp& app) {
    using Clock = std::chrono::steady_clock;
    using Duration = std::chrono::duration<double>;

    const Duration tickDuration(tickDt_);
    auto nextTick = Clock::now();

    while (running_) {
        auto now = Clock::now();

        if (now >= nextTick) {
            app.on_tick(tickDt_);
            ++tick_;

            nextTick += std::chrono::duration_cast<Clock::duration>(tickDuration);

            // If we're behind, catch up (but don't spiral)
            if (now > nextTick) {
                nextTick = now + std::chrono::duration_cast<Clock::duration>(tickDuration);
            }
        } else {
            std::this_thread::sleep_until(nextTick);
        }
    }
}

} // namespace mapsync
