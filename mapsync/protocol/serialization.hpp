#pragma once

#include "messages.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace mapsync::proto {

// ============================================================================
// Serialization
// ============================================================================

/// Serialize a message to bytes.
std::vector<std::uint8_t> serialize(const Message& msg);

/// Deserialize bytes to a message.
/// Returns std::nullopt on an empty buffer, unknown tag, truncated fields or trailing bytes.
std::optional<Message> deserialize(std::span<const std::uint8_t> data);

} // namespace mapsync::proto
