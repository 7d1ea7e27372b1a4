#include "reassembly_buffer.hpp"

namespace mapsync::transfer {

ReassemblyBuffer::ReassemblyBuffer(std::int32_t totalChunks, std::optional<std::size_t> expectedSize) {
    reset(totalChunks, expectedSize);
}

void ReassemblyBuffer::reset(std::int32_t totalChunks, std::optional<std::size_t> expectedSize) {
    slots_.assign(static_cast<std::size_t>(totalChunks > 0 ? totalChunks : 0), std::nullopt);
    received_ = 0;
    bytesReceived_ = 0;
    expectedSize_ = expectedSize;
}

void ReassemblyBuffer::clear() {
    reset(0, std::nullopt);
}

ReassemblyBuffer::ApplyResult ReassemblyBuffer::apply(std::int32_t index,
                                                      std::span<const std::uint8_t> payload) {
    if (index < 0 || static_cast<std::size_t>(index) >= slots_.size()) {
        return ApplyResult::OutOfRange;
    }

    auto& slot = slots_[static_cast<std::size_t>(index)];
    if (slot) {
        return ApplyResult::Duplicate;
    }

    slot.emplace(payload.begin(), payload.end());
    ++received_;
    bytesReceived_ += payload.size();
    return ApplyResult::Stored;
}

bool ReassemblyBuffer::has_chunk(std::int32_t index) const {
    if (index < 0 || static_cast<std::size_t>(index) >= slots_.size()) return false;
    return slots_[static_cast<std::size_t>(index)].has_value();
}

float ReassemblyBuffer::fraction_complete() const {
    if (slots_.empty()) return 1.0f;
    return static_cast<float>(received_) / static_cast<float>(slots_.size());
}

std::vector<std::uint8_t> ReassemblyBuffer::reassemble() const {
    return transfer::reassemble(slots_, expectedSize_);
}

} // namespace mapsync::transfer
