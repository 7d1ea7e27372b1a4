#pragma once

// Map transfer protocol messages.
// Encoded with ByteWriter/ByteReader, see serialization.hpp.

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace mapsync::proto {

// ============================================================================
// Message Types (for serialization)
// ============================================================================

// Wire tags. Never renumber.
enum class MessageType : std::uint8_t {
    // Identity and client state (client -> server)
    ClientIdentification = 0,
    ClientStateChange = 1,

    // Transfer (server -> client)
    TransferBegin = 2,
    MapChunk = 3,
    TransferComplete = 4,
    AllClientProgress = 5,

    // Regeneration (server -> client)
    MapRegenerationStart = 6,
};

// ============================================================================
// Messages - Identity
// ============================================================================

/// Sent on both the gameplay and the bulk connection, each time that
/// connection is established.
struct ClientIdentification {
    std::string clientUniqueId;
    std::string preferredName;
};

/// Client state names as produced by mapsync::state::to_string(GameState).
struct ClientStateChange {
    std::string oldState;
    std::string newState;
};

// ============================================================================
// Messages - Transfer
// ============================================================================

/// Gameplay channel.
struct TransferBegin {
    std::string mapId;
    std::int32_t totalChunks{0};
    std::int64_t totalSize{0};
};

/// Bulk channel (gameplay channel in degraded mode).
struct MapChunk {
    std::string mapId;
    std::int32_t chunkIndex{0};
    std::int32_t totalChunks{0};
    std::vector<std::uint8_t> payload;
};

/// Gameplay channel. Tells clients holding the world to start playing.
struct TransferComplete {
    std::string mapId;
};

/// Gameplay channel, periodic. clientUniqueId -> chunks sent so far.
struct AllClientProgress {
    std::map<std::string, std::int32_t> clientToChunkProgress;
};

// ============================================================================
// Messages - Regeneration
// ============================================================================

struct MapRegenerationStart {
    std::uint64_t newMapSeed{0};
    std::string reason;
    std::int64_t timestamp{0};  // ms since epoch
};

// ============================================================================
// Message Variant
// ============================================================================

using Message = std::variant<
    ClientIdentification,
    ClientStateChange,
    TransferBegin,
    MapChunk,
    TransferComplete,
    AllClientProgress,
    MapRegenerationStart
>;

const char* message_name(const Message& msg);

} // namespace mapsync::proto
