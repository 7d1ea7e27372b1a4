#include "world_snapshot.hpp"

#include <mapsync/core/byte_buffer.hpp>

#include <array>
#include <random>
#include <stdexcept>

namespace mapsync::world {

namespace {

constexpr std::array<std::uint8_t, 4> kMagic{{'M', 'S', 'W', 'D'}};
constexpr std::uint32_t kFormatVersion = 1;

// 1024^3 tiles.
constexpr std::size_t kMaxTiles = std::size_t{1} << 30;

bool set_error(std::string* outError, std::string msg) {
    if (outError) *outError = std::move(msg);
    return false;
}

bool valid_dimensions(std::int32_t w, std::int32_t h, std::int32_t d) {
    if (w < 0 || h < 0 || d < 0) return false;
    if (w == 0 || h == 0 || d == 0) return true;
    const std::size_t wh = static_cast<std::size_t>(w) * static_cast<std::size_t>(h);
    if (wh > kMaxTiles) return false;
    return wh * static_cast<std::size_t>(d) <= kMaxTiles;
}

} // namespace

std::vector<std::uint8_t> encode_world(const WorldSnapshot& world) {
    if (!valid_dimensions(world.width, world.height, world.depth)) {
        throw std::invalid_argument("world dimensions out of range");
    }
    if (world.tiles.size() != world.tile_count()) {
        throw std::invalid_argument("world has " + std::to_string(world.tiles.size()) +
                                    " tiles, dimensions need " + std::to_string(world.tile_count()));
    }

    ByteWriter w;
    w.write_bytes(kMagic);
    w.write_u32(kFormatVersion);
    w.write_string(world.mapId);
    w.write_u64(world.seed);
    w.write_i32(world.width);
    w.write_i32(world.height);
    w.write_i32(world.depth);
    w.write_blob(world.tiles);
    return w.take();
}

bool decode_world(std::span<const std::uint8_t> bytes, WorldSnapshot* out, std::string* outError) {
    if (!out) {
        return set_error(outError, "no output snapshot");
    }

    try {
        ByteReader r(bytes);

        const auto magic = r.read_bytes(kMagic.size());
        for (std::size_t i = 0; i < kMagic.size(); ++i) {
            if (magic[i] != kMagic[i]) {
                return set_error(outError, "bad magic");
            }
        }

        const std::uint32_t version = r.read_u32();
        if (version != kFormatVersion) {
            return set_error(outError, "unsupported format version " + std::to_string(version));
        }

        WorldSnapshot world;
        world.mapId = r.read_string();
        world.seed = r.read_u64();
        world.width = r.read_i32();
        world.height = r.read_i32();
        world.depth = r.read_i32();

        if (!valid_dimensions(world.width, world.height, world.depth)) {
            return set_error(outError, "invalid dimensions " + std::to_string(world.width) + "x" +
                                       std::to_string(world.height) + "x" + std::to_string(world.depth));
        }

        world.tiles = r.read_blob();
        if (world.tiles.size() != world.tile_count()) {
            return set_error(outError, "tile data is " + std::to_string(world.tiles.size()) +
                                       " bytes, expected " + std::to_string(world.tile_count()));
        }
        if (!r.at_end()) {
            return set_error(outError, std::to_string(r.remaining()) + " trailing bytes");
        }

        *out = std::move(world);
        return true;
    } catch (const std::runtime_error& e) {
        return set_error(outError, std::string("truncated world data: ") + e.what());
    }
}

WorldSnapshot make_test_world(std::string mapId, std::uint64_t seed,
                              std::int32_t width, std::int32_t height, std::int32_t depth) {
    if (!valid_dimensions(width, height, depth)) {
        throw std::invalid_argument("world dimensions out of range");
    }

    WorldSnapshot world;
    world.mapId = std::move(mapId);
    world.seed = seed;
    world.width = width;
    world.height = height;
    world.depth = depth;
    world.tiles.resize(world.tile_count());

    // mt19937_64 output is fixed by the standard, so the same seed gives the same bytes everywhere.
    std::mt19937_64 rng(seed);
    for (std::int32_t y = 0; y < height; ++y) {
        const bool solidLayer = y < height / 2;
        for (std::size_t i = 0; i < static_cast<std::size_t>(width) * static_cast<std::size_t>(depth); ++i) {
            const std::uint64_t r = rng();
            const std::size_t idx = static_cast<std::size_t>(y) * static_cast<std::size_t>(width) *
                                        static_cast<std::size_t>(depth) + i;
            if (solidLayer || (r & 0xF) == 0) {
                world.tiles[idx] = static_cast<std::uint8_t>(1 + (r >> 8) % 7);
            }
        }
    }
    return world;
}

transfer::WorldBlobPtr make_world_blob(const WorldSnapshot& world) {
    return transfer::make_world_blob(world.mapId, encode_world(world));
}

} // namespace mapsync::world
