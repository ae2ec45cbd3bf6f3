/**
 * @file event_queue.hpp
 * @brief Blocking FIFO shared between producer and consumer threads
 *
 * Carries progress samples to the delivery thread and transit messages
 * between the two ends of a loopback channel.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

namespace wormhole::events {

/**
 * @brief Thread-safe FIFO queue
 *
 * THREAD SAFETY:
 * - Any number of producers and consumers
 * - pop()/pop_for() block on a condition variable
 * - After shutdown(), pop() drains what is left and then returns nullopt
 * - wait_below() lets a producer hold back until consumers catch up
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    void push(T item) {
        {
            std::unique_lock lock(mutex_);
            queue_.push(std::move(item));
        }
        cv_.notify_one();
    }

    /// Non-blocking; nullopt when empty.
    std::optional<T> try_pop() {
        std::unique_lock lock(mutex_);
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_front();
    }

    /// Blocks until an item arrives or the queue is shut down and empty.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this]() { return !queue_.empty() || shutdown_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_front();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || shutdown_; })) {
            return std::nullopt;
        }
        if (queue_.empty()) {
            return std::nullopt;
        }
        return take_front();
    }

    /// True once fewer than limit items are queued or the queue is shut down; false on timeout.
    template<typename Rep, typename Period>
    bool wait_below(size_t limit, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        return room_cv_.wait_for(lock, timeout, [this, limit]() { return queue_.size() < limit || shutdown_; });
    }

    size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::unique_lock lock(mutex_);
        return queue_.empty();
    }

    /// Wakes every waiting consumer.
    void shutdown() {
        {
            std::unique_lock lock(mutex_);
            shutdown_ = true;
        }
        cv_.notify_all();
        room_cv_.notify_all();
    }

private:
    T take_front() {
        T item = std::move(queue_.front());
        queue_.pop();
        room_cv_.notify_all();
        return item;
    }

    std::queue<T> queue_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable room_cv_;
    bool shutdown_ = false;
};

} // namespace wormhole::events
