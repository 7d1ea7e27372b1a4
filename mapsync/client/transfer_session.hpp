#pragma once

#include <mapsync/protocol/messages.hpp>
#include <mapsync/transfer/reassembly_buffer.hpp>
#include <mapsync/world/world_snapshot.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace mapsync::client {

// ============================================================================
// TransferSession - Client-side state of the transfer in flight
// ============================================================================

/// Owned by MapClient and shared with the state handlers by reference.
/// Reset on every accepted TransferBegin and when the connection is lost.
struct TransferSession {
    struct Expected {
        std::string mapId;
        std::int32_t totalChunks{0};
        std::int64_t totalSize{0};
    };

    std::optional<Expected> expected;
    transfer::ReassemblyBuffer buffer;

    // Set by the reassembling/rebuilding step, consumed when applied.
    std::shared_ptr<const world::WorldSnapshot> decoded;
    bool worldApplied{false};

    // Seconds.
    float bulkWait{0.0f};
    float stallTime{0.0f};

    // Latest AllClientProgress from the server.
    std::map<std::string, std::int32_t> peerProgress;

    // Last MapRegenerationStart.
    std::uint64_t regenerationSeed{0};
    std::string regenerationReason;

    /// Accepts a TransferBegin: drops any previous chunks and sizes the buffer.
    void begin(const proto::TransferBegin& msg) {
        expected = Expected{msg.mapId, msg.totalChunks, msg.totalSize};
        buffer.reset(msg.totalChunks,
                     msg.totalSize >= 0 ? std::optional<std::size_t>(static_cast<std::size_t>(msg.totalSize))
                                        : std::nullopt);
        decoded.reset();
        worldApplied = false;
        bulkWait = 0.0f;
        stallTime = 0.0f;
    }

    bool has_transfer() const { return expected.has_value(); }

    bool expects(const std::string& mapId, std::int32_t totalChunks) const {
        return expected && expected->mapId == mapId && expected->totalChunks == totalChunks;
    }

    /// Frees chunk memory once the world is applied; the expected map stays known.
    void release_chunks() {
        buffer.clear();
        decoded.reset();
    }

    void clear() {
        expected.reset();
        buffer.clear();
        decoded.reset();
        worldApplied = false;
        bulkWait = 0.0f;
        stallTime = 0.0f;
    }
};

} // namespace mapsync::client
