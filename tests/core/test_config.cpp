/**
 * @file test_config.cpp
 * @brief Unit tests for the INI-style configuration loader.
 */

#include <catch2/catch.hpp>

#include <mapsync/core/config.hpp>

#include <sstream>

using namespace mapsync;

namespace {

/** @brief Loads text into the singleton after resetting it to defaults. */
Config& load(const std::string& text) {
    Config& cfg = Config::instance();
    cfg.reset();
    std::istringstream in(text);
    cfg.load_from_stream(in);
    return cfg;
}

} // namespace

// =============================================================================
// Defaults
// =============================================================================

TEST_CASE("Transfer defaults", "[core][config]") {
    TransferConfig t;
    REQUIRE(t.chunk_size == 8192);
    REQUIRE(t.max_chunks_per_tick == 500);
    REQUIRE(t.bulk_buffer_size == 65536);
    REQUIRE(t.backpressure_threshold == 57344);
    REQUIRE(t.gameplay_buffer_size == 8192);
    REQUIRE_FALSE(t.gameplay_fallback);
}

TEST_CASE("Gameplay threshold is 88% of the gameplay buffer", "[core][config]") {
    TransferConfig t;
    REQUIRE(t.gameplay_backpressure_threshold() == 7208);

    t.gameplay_buffer_size = 1000;
    REQUIRE(t.gameplay_backpressure_threshold() == 880);
}

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("Sections and keys are applied", "[core][config]") {
    Config& cfg = load(
        "# comment\n"
        "[transfer]\n"
        "chunk_size = 4096\n"
        "max_chunks_per_tick = 10 ; trailing comment\n"
        "gameplay_fallback = yes\n"
        "stall_timeout = 2.5\n"
        "\n"
        "[network]\n"
        "host = \"10.0.0.2\"\n"
        "bulk_port = 9000\n"
        "\n"
        "[logging]\n"
        "level = warn\n");

    REQUIRE(cfg.transfer().chunk_size == 4096);
    REQUIRE(cfg.transfer().max_chunks_per_tick == 10);
    REQUIRE(cfg.transfer().gameplay_fallback);
    REQUIRE(cfg.transfer().stall_timeout == 2.5f);
    REQUIRE(cfg.network().host == "10.0.0.2");
    REQUIRE(cfg.network().bulk_port == 9000);
    REQUIRE(cfg.logging().level == LogLevel::Warning);

    cfg.reset();
}

TEST_CASE("Invalid values keep the defaults", "[core][config]") {
    Config& cfg = load(
        "[transfer]\n"
        "chunk_size = -1\n"
        "max_chunks_per_tick = lots\n"
        "gameplay_fallback = maybe\n");

    REQUIRE(cfg.transfer().chunk_size == 8192);
    REQUIRE(cfg.transfer().max_chunks_per_tick == 500);
    REQUIRE_FALSE(cfg.transfer().gameplay_fallback);

    cfg.reset();
}

TEST_CASE("Keys are case-insensitive and unknown keys are ignored", "[core][config]") {
    Config& cfg = load(
        "[Transfer]\n"
        "CHUNK_SIZE = 1024\n"
        "no_such_key = 1\n"
        "[nowhere]\n"
        "x = y\n");

    REQUIRE(cfg.transfer().chunk_size == 1024);

    cfg.reset();
}

TEST_CASE("Chunk size has a floor and the world size a limit", "[core][config]") {
    Config& cfg = load(
        "[transfer]\n"
        "chunk_size = 16\n"
        "max_world_size = 1048576\n");

    REQUIRE(cfg.transfer().chunk_size == kMinChunkSize);
    REQUIRE(cfg.transfer().max_world_size == 1048576);

    cfg.reset();
    REQUIRE(cfg.transfer().max_world_size == 256u * 1024u * 1024u);
}

TEST_CASE("Missing file leaves defaults in effect", "[core][config]") {
    Config& cfg = Config::instance();
    cfg.reset();

    REQUIRE_FALSE(cfg.load_from_file("/nonexistent/mapsync.conf"));
    REQUIRE(cfg.loaded_from_path().empty());
    REQUIRE(cfg.transfer().chunk_size == 8192);
}

TEST_CASE("Log level parsing", "[core][config]") {
    REQUIRE(Config::log_level_from_string("debug", LogLevel::Info) == LogLevel::Debug);
    REQUIRE(Config::log_level_from_string("ERROR", LogLevel::Info) == LogLevel::Error);
    REQUIRE(Config::log_level_from_string("2", LogLevel::Info) == LogLevel::Warning);
    REQUIRE(Config::log_level_from_string("loud", LogLevel::Info) == LogLevel::Info);
}
