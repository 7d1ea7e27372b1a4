#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace mapsync::transfer {

// ============================================================================
// WorldBlob - One serialized world snapshot, immutable once published
// ============================================================================

struct WorldBlob {
    std::string mapId;
    std::vector<std::uint8_t> bytes;

    std::size_t total_size() const { return bytes.size(); }
    std::span<const std::uint8_t> view() const { return bytes; }
};

/// Shared read-only across every worker of a session.
using WorldBlobPtr = std::shared_ptr<const WorldBlob>;

inline WorldBlobPtr make_world_blob(std::string mapId, std::vector<std::uint8_t> bytes) {
    return std::make_shared<const WorldBlob>(WorldBlob{std::move(mapId), std::move(bytes)});
}

} // namespace mapsync::transfer
