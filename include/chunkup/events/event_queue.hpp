/**
 * @file event_queue.hpp
 * @brief Thread-safe queue backing the progress channel and outcome streams
 *
 * WHY THIS FILE EXISTS:
 * Upload tasks hand progress updates and per-file outcomes to a single
 * consumer without sharing any other state with it. Producers never block
 * on a bounded queue: try_push() reports a full queue instead.
 *
 * EXAMPLE:
 * ThreadSafeQueue<ProgressUpdate> queue(128);
 * queue.try_push(update);        // Producer (fire-and-forget)
 * auto next = queue.try_pop();   // Consumer (non-blocking drain)
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

namespace chunkup::events {

/**
 * @brief Thread-safe FIFO queue with an optional capacity
 *
 * THREAD SAFETY:
 * - Multiple producers can push concurrently
 * - Multiple consumers can pop concurrently
 * - Uses condition variable for blocking wait
 */
template<typename T>
class ThreadSafeQueue {
public:
    /// capacity == 0 means unbounded.
    explicit ThreadSafeQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    // Non-copyable
    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @brief Push item, ignoring the capacity
     *
     * THREAD SAFE: Yes
     * BLOCKS: No
     */
    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    /**
     * @brief Push item unless the queue is full or shut down
     *
     * RETURNS: false when the item was dropped
     * THREAD SAFE: Yes
     * BLOCKS: No
     */
    bool try_push(T item) {
        {
            std::unique_lock lock(mutex_);
            if (shutdown_ || (capacity_ > 0 && queue_.size() >= capacity_)) {
                return false;
            }
            queue_.push(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Try to pop item (non-blocking)
     *
     * RETURNS: Item if available, nullopt if queue empty
     */
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);

        if (queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    /**
     * @brief Pop item (blocking)
     *
     * RETURNS: Item, or nullopt once shut down and drained
     * BLOCKS: Yes, until item available or shutdown
     */
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);

        cv_.wait(lock, [this]() {
            return !queue_.empty() || shutdown_;
        });

        if (shutdown_ && queue_.empty()) {
            return std::nullopt;
        }

        T item = std::move(queue_.front());
        queue_.pop();
        return item;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    std::size_t capacity() const noexcept { return capacity_; }

    /**
     * @brief Signal shutdown (wake up all waiting threads)
     *
     * Items already queued can still be popped; try_push() is refused.
     */
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
    }

    bool is_shutdown() const {
        std::unique_lock lock(mutex_);
        return shutdown_;
    }

private:
    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    const std::size_t capacity_;
    bool shutdown_ = false;
};

} // namespace chunkup::events
