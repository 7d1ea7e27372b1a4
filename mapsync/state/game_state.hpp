#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace mapsync::state {

// ============================================================================
// GameState - Client lifecycle states
// ============================================================================

/// Names returned by to_string() travel on the wire in ClientStateChange and
/// are what the server gates transfers on. Never rename them.
enum class GameState : std::uint8_t {
    // Connection and lobby
    Lobby,
    Connecting,
    Connected,

    // First map delivery
    MapTransferInitiated,
    MapTransferTransferring,
    MapTransferReassembling,
    MapTransferBuildingAssets,
    MapTransferComplete,

    // Replacing the map during play
    MapRegenerationCleanup,
    MapRegenerationDownloading,
    MapRegenerationRebuilding,
    MapRegenerationComplete,

    Playing,

    ConnectionLost,
    Error,
};

const char* to_string(GameState s);
const char* display_name(GameState s);
const char* default_description(GameState s);
std::optional<GameState> parse_game_state(std::string_view name);

/// Initiated through BuildingAssets.
bool is_map_transfer_in_progress(GameState s);
bool is_map_regeneration_state(GameState s);
bool is_error_state(GameState s);

/// The client is ready to accept chunks.
bool is_receiving_state(GameState s);

/// The client holds the current world and waits for the server's go.
bool is_transfer_complete_state(GameState s);

} // namespace mapsync::state
