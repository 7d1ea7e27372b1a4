#include "game_state.hpp"

#include <array>

namespace mapsync::state {

namespace {

struct StateInfo {
    GameState state;
    const char* name;
    const char* displayName;
    const char* description;
};

constexpr std::array<StateInfo, 15> kStates{{
    {GameState::Lobby, "Lobby", "In Lobby", "Waiting for connection"},
    {GameState::Connecting, "Connecting", "Connecting", "Connecting to server..."},
    {GameState::Connected, "Connected", "Connected", "Connected to server"},
    {GameState::MapTransferInitiated, "MapTransferInitiated", "Preparing Transfer", "Opening bulk connection..."},
    {GameState::MapTransferTransferring, "MapTransferTransferring", "Downloading", "Receiving map data..."},
    {GameState::MapTransferReassembling, "MapTransferReassembling", "Reassembling", "Reassembling map data..."},
    {GameState::MapTransferBuildingAssets, "MapTransferBuildingAssets", "Building", "Building world assets..."},
    {GameState::MapTransferComplete, "MapTransferComplete", "Ready", "Waiting for other players"},
    {GameState::MapRegenerationCleanup, "MapRegenerationCleanup", "Cleaning Up", "Cleaning up current resources..."},
    {GameState::MapRegenerationDownloading, "MapRegenerationDownloading", "Downloading", "Downloading new map data..."},
    {GameState::MapRegenerationRebuilding, "MapRegenerationRebuilding", "Rebuilding", "Rebuilding world from new map..."},
    {GameState::MapRegenerationComplete, "MapRegenerationComplete", "Complete", "Map regeneration complete"},
    {GameState::Playing, "Playing", "Playing", "In game"},
    {GameState::ConnectionLost, "ConnectionLost", "Disconnected", "Connection to server lost"},
    {GameState::Error, "Error", "Error", "An error occurred"},
}};

const StateInfo& info(GameState s) {
    return kStates[static_cast<std::size_t>(s)];
}

} // namespace

const char* to_string(GameState s) { return info(s).name; }
const char* display_name(GameState s) { return info(s).displayName; }
const char* default_description(GameState s) { return info(s).description; }

std::optional<GameState> parse_game_state(std::string_view name) {
    for (const auto& entry : kStates) {
        if (name == entry.name) return entry.state;
    }
    return std::nullopt;
}

bool is_map_transfer_in_progress(GameState s) {
    return s == GameState::MapTransferInitiated ||
           s == GameState::MapTransferTransferring ||
           s == GameState::MapTransferReassembling ||
           s == GameState::MapTransferBuildingAssets;
}

bool is_map_regeneration_state(GameState s) {
    return s == GameState::MapRegenerationCleanup ||
           s == GameState::MapRegenerationDownloading ||
           s == GameState::MapRegenerationRebuilding ||
           s == GameState::MapRegenerationComplete;
}

bool is_error_state(GameState s) {
    return s == GameState::ConnectionLost || s == GameState::Error;
}

bool is_receiving_state(GameState s) {
    return s == GameState::MapTransferTransferring || s == GameState::MapRegenerationDownloading;
}

bool is_transfer_complete_state(GameState s) {
    return s == GameState::MapTransferComplete || s == GameState::MapRegenerationComplete;
}

} // namespace mapsync::state
