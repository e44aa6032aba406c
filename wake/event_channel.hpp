#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace Wake {

/// EventChannel
/// Bounded FIFO between one producer thread and one consumer thread.
/// The producer side never blocks: a push onto a full channel drops the
/// new value and leaves the queued ones untouched.
template <typename T>
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity)
        : capacity_(capacity == 0 ? 1 : capacity) {}

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    /// Producer side. False if the value was dropped.
    bool tryPush(const T& value) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (queue_.size() >= capacity_) {
                ++dropped_;
                return false;
            }
            queue_.push_back(value);
        }
        cv_.notify_one();
        return true;
    }

    /// Consumer side. Waits at most timeout for a value.
    template <typename Rep, typename Period>
    std::optional<T> popFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        if (!cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); })) {
            return std::nullopt;
        }
        T value = queue_.front();
        queue_.pop_front();
        return value;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        if (queue_.empty()) return std::nullopt;
        T value = queue_.front();
        queue_.pop_front();
        return value;
    }

    /// Discard everything queued; returns how many values were discarded.
    std::size_t drain() {
        std::lock_guard<std::mutex> lock(mtx_);
        std::size_t n = queue_.size();
        queue_.clear();
        return n;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

    std::size_t capacity() const { return capacity_; }

    std::size_t droppedCount() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return dropped_;
    }

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    std::size_t dropped_ = 0;
};

} // namespace Wake
