#pragma once

#include "chunker.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace mapsync::transfer {

// ============================================================================
// ReassemblyBuffer - Client-side chunk slots, duplicate safe
// ============================================================================

/// chunks_received() always equals the number of filled slots; the buffer is
/// complete exactly when every slot is filled.
class ReassemblyBuffer {
public:
    enum class ApplyResult : std::uint8_t {
        Stored,
        Duplicate,   // slot already filled, content kept
        OutOfRange,  // index outside [0, totalChunks)
    };

    ReassemblyBuffer() = default;
    ReassemblyBuffer(std::int32_t totalChunks, std::optional<std::size_t> expectedSize);

    /// Drops all slots and prepares for a new transfer.
    void reset(std::int32_t totalChunks, std::optional<std::size_t> expectedSize);
    void clear();

    ApplyResult apply(std::int32_t index, std::span<const std::uint8_t> payload);

    bool has_chunk(std::int32_t index) const;
    bool is_complete() const { return received_ == slots_.size(); }

    std::int32_t total_chunks() const { return static_cast<std::int32_t>(slots_.size()); }
    std::int32_t chunks_received() const { return static_cast<std::int32_t>(received_); }
    std::size_t bytes_received() const { return bytesReceived_; }
    std::optional<std::size_t> expected_size() const { return expectedSize_; }

    /// 0..1, 1 for an empty transfer.
    float fraction_complete() const;

    /// Throws IncompleteTransfer or SizeMismatch.
    std::vector<std::uint8_t> reassemble() const;

private:
    ChunkSlots slots_;
    std::size_t received_{0};
    std::size_t bytesReceived_{0};
    std::optional<std::size_t> expectedSize_;
};

} // namespace mapsync::transfer
