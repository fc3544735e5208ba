#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace profile_export {

/**
 * Blocking multi-producer / multi-consumer FIFO.
 *
 * - push() blocks while the queue holds `capacity` items (capacity 0 means
 *   unbounded). This is the backpressure applied to fetch workers.
 * - close() is the end-of-stream signal: consumers drain what is left and
 *   then pop() returns std::nullopt. Pushing to a closed queue fails.
 * - interrupt() makes every current and future push() return false without
 *   blocking, while consumers may still drain queued items.
 */
template <typename T>
class BoundedQueue {
public:
    static constexpr size_t kUnbounded = 0;

    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {}

    /**
     * A queue whose push() never blocks.
     */
    static BoundedQueue unbounded() { return BoundedQueue(kUnbounded); }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /**
     * Enqueue an item, blocking while the queue is full.
     * Returns false (and drops the item) if the queue is closed or interrupted.
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] {
            return closed_ || interrupted_ || capacity_ == 0 || items_.size() < capacity_;
        });
        if (closed_ || interrupted_) {
            return false;
        }
        items_.push_back(std::move(item));
        if (items_.size() > high_water_mark_) {
            high_water_mark_ = items_.size();
        }
        not_empty_.notify_one();
        return true;
    }

    /**
     * Dequeue the oldest item, blocking while the queue is empty.
     * Returns std::nullopt once the queue is closed and drained.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt;
        }
        T item = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    void interrupt() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        not_full_.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

    /**
     * Largest number of items ever held at once.
     */
    size_t high_water_mark() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return high_water_mark_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    size_t high_water_mark_ = 0;
    bool closed_ = false;
    bool interrupted_ = false;
};

} // namespace profile_export
