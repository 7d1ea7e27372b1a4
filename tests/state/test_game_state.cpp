/**
 * @file test_game_state.cpp
 * @brief Unit tests for GameState names and classification.
 */

#include <catch2/catch.hpp>

#include <mapsync/state/game_state.hpp>

#include <string>

using namespace mapsync::state;

TEST_CASE("GameState names parse back", "[state][game_state]") {
    for (int i = 0; i <= static_cast<int>(GameState::Error); ++i) {
        const auto s = static_cast<GameState>(i);
        auto parsed = parse_game_state(to_string(s));
        REQUIRE(parsed.has_value());
        REQUIRE(*parsed == s);
    }
}

TEST_CASE("Wire names are stable", "[state][game_state]") {
    REQUIRE(std::string(to_string(GameState::MapTransferTransferring)) == "MapTransferTransferring");
    REQUIRE(std::string(to_string(GameState::MapRegenerationDownloading)) == "MapRegenerationDownloading");
    REQUIRE(std::string(to_string(GameState::MapTransferComplete)) == "MapTransferComplete");
}

TEST_CASE("Unknown names do not parse", "[state][game_state]") {
    REQUIRE_FALSE(parse_game_state("").has_value());
    REQUIRE_FALSE(parse_game_state("playing").has_value());
    REQUIRE_FALSE(parse_game_state("Downloading").has_value());
}

TEST_CASE("Receiving states", "[state][game_state]") {
    REQUIRE(is_receiving_state(GameState::MapTransferTransferring));
    REQUIRE(is_receiving_state(GameState::MapRegenerationDownloading));
    REQUIRE_FALSE(is_receiving_state(GameState::MapTransferInitiated));
    REQUIRE_FALSE(is_receiving_state(GameState::Playing));
}

TEST_CASE("Complete states", "[state][game_state]") {
    REQUIRE(is_transfer_complete_state(GameState::MapTransferComplete));
    REQUIRE(is_transfer_complete_state(GameState::MapRegenerationComplete));
    REQUIRE_FALSE(is_transfer_complete_state(GameState::Playing));
}

TEST_CASE("State groups", "[state][game_state]") {
    REQUIRE(is_map_transfer_in_progress(GameState::MapTransferInitiated));
    REQUIRE(is_map_transfer_in_progress(GameState::MapTransferBuildingAssets));
    REQUIRE_FALSE(is_map_transfer_in_progress(GameState::MapTransferComplete));

    REQUIRE(is_map_regeneration_state(GameState::MapRegenerationCleanup));
    REQUIRE_FALSE(is_map_regeneration_state(GameState::Playing));

    REQUIRE(is_error_state(GameState::Error));
    REQUIRE(is_error_state(GameState::ConnectionLost));
    REQUIRE_FALSE(is_error_state(GameState::Lobby));
}

TEST_CASE("Every state has a description", "[state][game_state]") {
    for (int i = 0; i <= static_cast<int>(GameState::Error); ++i) {
        const auto s = static_cast<GameState>(i);
        REQUIRE_FALSE(std::string(default_description(s)).empty());
        REQUIRE_FALSE(std::string(display_name(s)).empty());
    }
}
