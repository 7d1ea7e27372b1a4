#pragma once

#include <mapsync/transfer/world_blob.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace mapsync::world {

// ============================================================================
// WorldSnapshot - A tile grid plus the id it is published under
// ============================================================================

struct WorldSnapshot {
    std::string mapId;
    std::uint64_t seed{0};

    std::int32_t width{0};
    std::int32_t height{0};
    std::int32_t depth{0};

    // x fastest, then z, then y.
    std::vector<std::uint8_t> tiles;

    std::size_t tile_count() const {
        return static_cast<std::size_t>(width) * static_cast<std::size_t>(height) *
               static_cast<std::size_t>(depth);
    }

    std::uint8_t tile_at(std::int32_t x, std::int32_t y, std::int32_t z) const {
        return tiles[static_cast<std::size_t>(y) * static_cast<std::size_t>(width) * static_cast<std::size_t>(depth) +
                     static_cast<std::size_t>(z) * static_cast<std::size_t>(width) +
                     static_cast<std::size_t>(x)];
    }
};

// Encoded layout (little-endian):
//   magic "MSWD", u32 version, string mapId, u64 seed,
//   i32 width, i32 height, i32 depth, u32-prefixed tile bytes.
std::vector<std::uint8_t> encode_world(const WorldSnapshot& world);

// On failure returns false and fills outError (if provided).
bool decode_world(std::span<const std::uint8_t> bytes, WorldSnapshot* out, std::string* outError);

// Deterministic fixture for a given seed. Tiles are 0 (air) or 1..7.
WorldSnapshot make_test_world(std::string mapId, std::uint64_t seed,
                              std::int32_t width, std::int32_t height, std::int32_t depth);

transfer::WorldBlobPtr make_world_blob(const WorldSnapshot& world);

} // namespace mapsync::world
