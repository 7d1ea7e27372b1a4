#pragma once

#include <cstdint>
#include <string>

namespace mapsync {

// ============================================================================
// Core Types
// ============================================================================

using Tick = std::uint64_t;

/// Connection handle assigned by a server transport. Gameplay and bulk
/// transports number their connections independently.
using ClientId = std::uint32_t;
static constexpr ClientId kInvalidClientId = 0;

// ============================================================================
// Logging
// ============================================================================

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
};

// ============================================================================
// Connection State
// ============================================================================

enum class ConnectionState : std::uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2,
};

} // namespace mapsync
