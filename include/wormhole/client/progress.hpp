/**
 * @file progress.hpp
 * @brief Fire-and-forget delivery of progress samples
 *
 * The transfer loop must never wait on the caller's handler. Samples are
 * queued and a dedicated thread invokes the handlers, one sample at a time,
 * in the order they were posted.
 */

#pragma once

#include "wormhole/client/types.hpp"
#include "wormhole/events/event_queue.hpp"

#include <cstdint>
#include <mutex>
#include <thread>

namespace wormhole::client {

/**
 * @brief Owns the delivery thread shared by every transfer of a client
 *
 * THREAD SAFETY:
 * - post() may be called from any thread and never blocks on a handler
 * - Exceptions thrown by a handler are logged and dropped
 * - The destructor delivers everything still queued, then joins
 */
class ProgressDispatcher {
public:
    ProgressDispatcher();
    ~ProgressDispatcher();

    ProgressDispatcher(const ProgressDispatcher&) = delete;
    ProgressDispatcher& operator=(const ProgressDispatcher&) = delete;

    void post(ProgressHandler handler, ProgressEvent event);

private:
    struct Delivery {
        ProgressHandler handler;
        ProgressEvent event;
    };

    void run();

    events::ThreadSafeQueue<Delivery> queue_;
    std::thread worker_;
};

/**
 * @brief Per-transfer delivery handle
 *
 * Shared by reference between the streaming sink and the completion step.
 * Keeps the transferred counter non-decreasing and guarantees that the
 * completion sample goes out exactly once.
 */
class ProgressReporter {
public:
    ProgressReporter(ProgressDispatcher& dispatcher, ProgressHandler handler);

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    /// Sink for the transit layer's (bytes_so_far, total) callbacks.
    void report(std::uint64_t transferred, std::uint64_t total);

    void complete(std::uint64_t total);

    [[nodiscard]] std::uint64_t last_transferred() const;
    [[nodiscard]] bool completed() const;

private:
    ProgressDispatcher& dispatcher_;
    ProgressHandler handler_;

    mutable std::mutex mutex_;
    std::uint64_t last_transferred_ = 0;
    bool completed_ = false;
};

} // namespace wormhole::client
