/**
 * @file test_server_engine.cpp
 * @brief Tests for the fixed tick loop driving an IServerApp.
 */

#include <catch2/catch.hpp>

#include <mapsync/core/server_engine.hpp>

#include <vector>

using namespace mapsync;

namespace {

/** @brief Records the engine calls and stops the engine after a few ticks. */
class CountingApp final : public IServerApp {
public:
    CountingApp(ServerEngine& engine, int stopAfter) : engine_(engine), stopAfter_(stopAfter) {}

    void on_init(IEngineServices& services) override {
        calls.push_back("init");
        initDt = services.tick_dt();
    }

    void on_tick(float dt) override {
        ++ticks;
        lastDt = dt;
        if (ticks >= stopAfter_) engine_.stop();
    }

    void on_shutdown() override { calls.push_back("shutdown"); }

    std::vector<const char*> calls;
    int ticks{0};
    float initDt{0.0f};
    float lastDt{0.0f};

private:
    ServerEngine& engine_;
    int stopAfter_;
};

} // namespace

TEST_CASE("Engine ticks the app until stopped", "[core][engine]") {
    ServerEngine::Config cfg;
    cfg.tickRate = 1000.0f;
    ServerEngine engine(cfg);
    CountingApp app(engine, 5);

    engine.run(app);

    REQUIRE(app.ticks == 5);
    REQUIRE(engine.current_tick() == 5);
    REQUIRE(app.lastDt == engine.tick_dt());
    REQUIRE(app.initDt == engine.tick_dt());
    REQUIRE(app.calls.size() == 2);
    REQUIRE_FALSE(engine.is_running());
}

TEST_CASE("Engine replaces a non-positive tick rate", "[core][engine]") {
    ServerEngine::Config cfg;
    cfg.tickRate = 0.0f;
    ServerEngine engine(cfg);

    REQUIRE(engine.tick_rate() == 30.0f);
    REQUIRE(engine.tick_dt() == 1.0f / 30.0f);
}
