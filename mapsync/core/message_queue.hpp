#pragma once

#include <mutex>
#include <queue>

namespace mapsync {

// ============================================================================
// MessageQueue - producers on any thread, one consumer on the tick thread
// ============================================================================

template <typename T>
class MessageQueue {
public:
    void push(T item) {
        std::lock_guard lock(mutex_);
        pending_.push(std::move(item));
    }

    /// Takes the whole pending batch in FIFO order.
    std::queue<T> drain() {
        std::queue<T> batch;
        {
            std::lock_guard lock(mutex_);
            std::swap(batch, pending_);
        }
        return batch;
    }

    std::size_t size() const {
        std::lock_guard lock(mutex_);
        return pending_.size();
    }

    bool empty() const { return size() == 0; }

    void clear() {
        std::lock_guard lock(mutex_);
        std::queue<T>().swap(pending_);
    }

private:
    mutable std::mutex mutex_;
    std::queue<T> pending_;
};

} // namespace mapsync
