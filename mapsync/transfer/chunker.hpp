#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace mapsync::transfer {

static constexpr std::size_t kDefaultChunkSize = 8192;

// ============================================================================
// Errors
// ============================================================================

class TransferError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A slot was still empty when reassembly was requested.
class IncompleteTransfer : public TransferError {
public:
    IncompleteTransfer(std::size_t missingIndex, std::size_t missingCount);

    std::size_t first_missing_index() const { return firstMissing_; }
    std::size_t missing_count() const { return missingCount_; }

private:
    std::size_t firstMissing_;
    std::size_t missingCount_;
};

/// The concatenated chunks do not add up to the announced size.
class SizeMismatch : public TransferError {
public:
    SizeMismatch(std::size_t expected, std::size_t actual);

    std::size_t expected() const { return expected_; }
    std::size_t actual() const { return actual_; }

private:
    std::size_t expected_;
    std::size_t actual_;
};

// ============================================================================
// Chunking
// ============================================================================

struct Chunk {
    std::string mapId;
    std::int32_t chunkIndex{0};
    std::int32_t totalChunks{0};
    std::vector<std::uint8_t> payload;
};

using ChunkSlots = std::vector<std::optional<std::vector<std::uint8_t>>>;

/// ceil(blobSize / chunkSize). Throws std::invalid_argument for chunkSize 0
/// and TransferError when the count does not fit an int32.
std::int32_t chunk_count(std::size_t blobSize, std::size_t chunkSize);

/// Bytes of chunk `index`; the last chunk may be shorter than chunkSize.
/// Throws std::out_of_range for an index past the end.
std::span<const std::uint8_t> chunk_payload(std::span<const std::uint8_t> blob,
                                            std::int32_t index,
                                            std::size_t chunkSize);

/// Splits a blob into chunks in byte-offset order.
std::vector<Chunk> chunk(std::span<const std::uint8_t> blob,
                         std::size_t chunkSize,
                         const std::string& mapId = {});

/// Concatenates the slots in index order.
/// Throws IncompleteTransfer if a slot is empty, SizeMismatch if
/// expectedSize is given and differs from the result.
std::vector<std::uint8_t> reassemble(const ChunkSlots& slots,
                                     std::optional<std::size_t> expectedSize = std::nullopt);

} // namespace mapsync::transfer
