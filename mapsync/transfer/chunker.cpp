#include "chunker.hpp"

#include <algorithm>
#include <limits>

namespace mapsync::transfer {

IncompleteTransfer::IncompleteTransfer(std::size_t missingIndex, std::size_t missingCount)
    : TransferError("incomplete transfer: " + std::to_string(missingCount) +
                    " chunk(s) missing, first at index " + std::to_string(missingIndex))
    , firstMissing_(missingIndex)
    , missingCount_(missingCount)
{
}

SizeMismatch::SizeMismatch(std::size_t expected, std::size_t actual)
    : TransferError("reassembled " + std::to_string(actual) + " bytes, expected " +
                    std::to_string(expected))
    , expected_(expected)
    , actual_(actual)
{
}

std::int32_t chunk_count(std::size_t blobSize, std::size_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    const std::size_t count = blobSize / chunkSize + (blobSize % chunkSize != 0 ? 1 : 0);
    if (count > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
        throw TransferError("blob of " + std::to_string(blobSize) + " bytes needs too many chunks");
    }
    return static_cast<std::int32_t>(count);
}

std::span<const std::uint8_t> chunk_payload(std::span<const std::uint8_t> blob,
                                            std::int32_t index,
                                            std::size_t chunkSize) {
    const std::int32_t total = chunk_count(blob.size(), chunkSize);
    if (index < 0 || index >= total) {
        throw std::out_of_range("chunk index " + std::to_string(index) + " out of range [0," +
                                std::to_string(total) + ")");
    }

    const std::size_t offset = static_cast<std::size_t>(index) * chunkSize;
    const std::size_t length = std::min(chunkSize, blob.size() - offset);
    return blob.subspan(offset, length);
}

std::vector<Chunk> chunk(std::span<const std::uint8_t> blob,
                         std::size_t chunkSize,
                         const std::string& mapId) {
    const std::int32_t total = chunk_count(blob.size(), chunkSize);

    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(total));

    for (std::int32_t i = 0; i < total; ++i) {
        auto bytes = chunk_payload(blob, i, chunkSize);
        chunks.push_back(Chunk{mapId, i, total, std::vector<std::uint8_t>(bytes.begin(), bytes.end())});
    }
    return chunks;
}

std::vector<std::uint8_t> reassemble(const ChunkSlots& slots,
                                     std::optional<std::size_t> expectedSize) {
    std::size_t total = 0;
    std::size_t missing = 0;
    std::size_t firstMissing = 0;

    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i]) {
            if (missing == 0) firstMissing = i;
            ++missing;
            continue;
        }
        total += slots[i]->size();
    }

    if (missing != 0) {
        throw IncompleteTransfer(firstMissing, missing);
    }

    std::vector<std::uint8_t> out;
    out.reserve(total);
    for (const auto& slot : slots) {
        out.insert(out.end(), slot->begin(), slot->end());
    }

    if (expectedSize && *expectedSize != out.size()) {
        throw SizeMismatch(*expectedSize, out.size());
    }
    return out;
}

} // namespace mapsync::transfer
