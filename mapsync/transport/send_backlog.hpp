#pragma once

#include <cstddef>
#include <memory>

namespace mapsync::transport {

// ============================================================================
// SendBacklog - Bytes accepted for one peer that the peer has not acknowledged
// ============================================================================

/// Each sent message holds an Entry; the bytes count until the Entry dies.
/// Entries may outlive the backlog (a host destroyed after its peer map).
class SendBacklog {
public:
    class Entry {
    public:
        Entry(std::weak_ptr<std::size_t> total, std::size_t bytes)
            : total_(std::move(total))
            , bytes_(bytes)
        {
            if (auto t = total_.lock()) *t += bytes_;
        }

        ~Entry() {
            if (auto t = total_.lock()) *t -= bytes_;
        }

        Entry(const Entry&) = delete;
        Entry& operator=(const Entry&) = delete;

    private:
        std::weak_ptr<std::size_t> total_;
        std::size_t bytes_;
    };

    std::unique_ptr<Entry> add(std::size_t bytes) {
        return std::make_unique<Entry>(total_, bytes);
    }

    std::size_t bytes() const { return *total_; }

private:
    std::shared_ptr<std::size_t> total_ = std::make_shared<std::size_t>(0);
};

} // namespace mapsync::transport
