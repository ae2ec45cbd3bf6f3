#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace wormhole::client {

/**
 * @brief One progress sample delivered to the caller
 *
 * percent is round(100 * transferred / total) clamped to [0, 100], and 0
 * when total is 0.
 */
struct ProgressEvent {
    std::uint64_t transferred = 0;
    std::uint64_t total = 0;
    std::uint32_t percent = 0;

    static ProgressEvent make(std::uint64_t transferred, std::uint64_t total) noexcept;

    /// Final sample of a successful transfer: transferred == total, 100%.
    static ProgressEvent completed(std::uint64_t total) noexcept;

    bool operator==(const ProgressEvent& other) const noexcept {
        return transferred == other.transferred && total == other.total && percent == other.percent;
    }
};

using ProgressHandler = std::function<void(const ProgressEvent&)>;

/**
 * @brief Incoming file as announced by the sender
 */
struct TransferOffer {
    std::string filename;
    std::uint64_t filesize = 0;
};

} // namespace wormhole::client
