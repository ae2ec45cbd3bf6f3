/**
 * @file components.hpp
 * @brief Ready-made subscribers for the client's event bus
 *
 * Components must outlive every client emitting on the bus.
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * WormholeClient client(rendezvous, bus);
 */

#pragma once

#include "wormhole/events/event_bus.hpp"
#include "wormhole/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace wormhole::events {

/**
 * @brief Writes one spdlog line per lifecycle event
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) {
        bus.subscribe<CodeAllocatedEvent>([](const CodeAllocatedEvent& e) {
            spdlog::info("[CodeAllocated] code={} words={}", e.code, e.word_count);
        });

        bus.subscribe<OfferReceivedEvent>([](const OfferReceivedEvent& e) {
            spdlog::info("[OfferReceived] file={} bytes={}", e.file_name, e.file_size);
        });

        bus.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] direction={} file={} bytes={}",
                         to_string(e.direction), e.file_name, e.total_bytes);
        });

        bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] direction={} file={} bytes={} duration={}ms",
                         to_string(e.direction), e.file_name, e.total_bytes, e.duration.count());
        });

        bus.subscribe<OperationFailedEvent>([](const OperationFailedEvent& e) {
            spdlog::warn("[OperationFailed] op={} kind={} message={}", e.operation, e.error_kind, e.message);
        });

        bus.subscribe<OfferRejectedEvent>([](const OfferRejectedEvent& e) {
            spdlog::info("[OfferRejected] file={}", e.file_name);
        });

        bus.subscribe<SessionCancelledEvent>([](const SessionCancelledEvent& e) {
            spdlog::info("[SessionCancelled] discarded={}", e.discarded_phase);
        });
    }
};

/**
 * @brief Counts what the client did
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> codes_allocated{0};
        std::atomic<uint64_t> offers_received{0};
        std::atomic<uint64_t> files_sent{0};
        std::atomic<uint64_t> bytes_sent{0};
        std::atomic<uint64_t> files_received{0};
        std::atomic<uint64_t> bytes_received{0};
        std::atomic<uint64_t> offers_rejected{0};
        std::atomic<uint64_t> failures{0};
        std::atomic<uint64_t> cancellations{0};
    };

    explicit MetricsComponent(EventBus& bus) {
        bus.subscribe<CodeAllocatedEvent>([this](const CodeAllocatedEvent&) {
            stats_.codes_allocated++;
        });

        bus.subscribe<OfferReceivedEvent>([this](const OfferReceivedEvent&) {
            stats_.offers_received++;
        });

        bus.subscribe<TransferCompletedEvent>([this](const TransferCompletedEvent& e) {
            on_transfer_completed(e);
        });

        bus.subscribe<OfferRejectedEvent>([this](const OfferRejectedEvent&) {
            stats_.offers_rejected++;
        });

        bus.subscribe<OperationFailedEvent>([this](const OperationFailedEvent&) {
            stats_.failures++;
        });

        bus.subscribe<SessionCancelledEvent>([this](const SessionCancelledEvent&) {
            stats_.cancellations++;
        });
    }

    // Subscriptions capture this.
    MetricsComponent(const MetricsComponent&) = delete;
    MetricsComponent& operator=(const MetricsComponent&) = delete;

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Session Statistics:");
        spdlog::info("  Codes allocated: {}", stats_.codes_allocated.load());
        spdlog::info("  Offers received: {}", stats_.offers_received.load());
        spdlog::info("  Files sent:      {}", stats_.files_sent.load());
        spdlog::info("  Bytes sent:      {}", stats_.bytes_sent.load());
        spdlog::info("  Files received:  {}", stats_.files_received.load());
        spdlog::info("  Bytes received:  {}", stats_.bytes_received.load());
        spdlog::info("  Offers rejected: {}", stats_.offers_rejected.load());
        spdlog::info("  Failures:        {}", stats_.failures.load());
        spdlog::info("  Cancellations:   {}", stats_.cancellations.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_transfer_completed(const TransferCompletedEvent& e) {
        if (e.direction == Direction::Send) {
            stats_.files_sent++;
            stats_.bytes_sent += e.total_bytes;
        } else {
            stats_.files_received++;
            stats_.bytes_received += e.total_bytes;
        }
    }

    Stats stats_;
};

} // namespace wormhole::events
