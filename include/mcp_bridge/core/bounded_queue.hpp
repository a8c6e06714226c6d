#pragma once

#include <cstddef>
#include <deque>
#include <iterator>
#include <mutex>
#include <vector>

namespace mcp_bridge {

// ---------------------------------------------------------------------------
// BoundedQueue<T>: thread-safe FIFO with a fixed capacity.
//
// Push never blocks: when the queue is full the oldest element is dropped so
// that a chatty producer (a provider writing to stderr) can never stall the
// thread draining it. DrainAll is non-blocking and may return empty.
// ---------------------------------------------------------------------------
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // Returns false if an element had to be dropped to make room.
    bool Push(T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        bool dropped = false;
        if (items_.size() >= capacity_) {
            items_.pop_front();
            ++dropped_count_;
            dropped = true;
        }
        items_.push_back(std::move(value));
        return !dropped;
    }

    [[nodiscard]] std::vector<T> DrainAll() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> drained(std::make_move_iterator(items_.begin()),
                               std::make_move_iterator(items_.end()));
        items_.clear();
        return drained;
    }

    [[nodiscard]] size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] size_t Capacity() const noexcept { return capacity_; }

    [[nodiscard]] size_t DroppedCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_count_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::deque<T> items_;
    size_t dropped_count_ = 0;
};

} // namespace mcp_bridge
