/**
 * @file events.hpp
 * @brief Session lifecycle events published by WormholeClient
 *
 * NAMING CONVENTION:
 * - Events are past-tense: CodeAllocatedEvent, TransferCompletedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace wormhole::events {

enum class Direction {
    Send,
    Receive
};

inline const char* to_string(Direction direction) {
    return direction == Direction::Send ? "send" : "receive";
}

/**
 * @brief Emitted when create_send_code() opened a mailbox
 */
struct CodeAllocatedEvent {
    std::string code;
    std::size_t word_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted once connect_receive() holds an offer
 */
struct OfferReceivedEvent {
    std::string file_name;
    std::uint64_t file_size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferStartedEvent {
    Direction direction = Direction::Send;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct TransferCompletedEvent {
    Direction direction = Direction::Send;
    std::string file_name;
    std::uint64_t total_bytes = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when any public operation fails
 *
 * operation is the public method name, e.g. "send_file".
 */
struct OperationFailedEvent {
    std::string operation;
    std::string error_kind;
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct OfferRejectedEvent {
    std::string file_name;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted by the asynchronous reset that cancel() schedules
 */
struct SessionCancelledEvent {
    std::string discarded_phase;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace wormhole::events
