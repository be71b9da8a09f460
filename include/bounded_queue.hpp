/*
 * Bounded Queue
 *
 * Thread-safe FIFO with a fixed capacity. Producers choose the overflow
 * policy per call: fail fast (tryPush) or drop the oldest item (pushDropOldest).
 * A capacity of 0 means unbounded.
 */

#ifndef BOUNDED_QUEUE_HPP
#define BOUNDED_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace input_link {

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity = 0) : capacity_(capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    // False if the queue is full or closed
    bool tryPush(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || full()) return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Puts an item back at the head, e.g. after a failed send. False if full or closed.
    bool tryPushFront(T item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || full()) return false;
            items_.push_front(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    // Never blocks. Returns true if an older item had to be dropped.
    bool pushDropOldest(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            if (full()) {
                items_.pop_front();
                dropped = true;
            }
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return dropped;
    }

    template <typename Rep, typename Period>
    std::optional<T> pop(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; })) {
            return std::nullopt;
        }
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    std::optional<T> tryPop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    // Wakes all waiters; further pushes fail
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    bool empty() const { return size() == 0; }
    size_t capacity() const { return capacity_; }

private:
    bool full() const { return capacity_ > 0 && items_.size() >= capacity_; }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

}  // namespace input_link

#endif // BOUNDED_QUEUE_HPP
