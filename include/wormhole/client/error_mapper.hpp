#pragma once

#include "wormhole/core/error.hpp"
#include "wormhole/rendezvous/rendezvous.hpp"

#include <filesystem>
#include <system_error>

namespace wormhole::client {

/// Where in an operation a rendezvous failure happened.
enum class Stage {
    Mailbox,
    KeyExchange,
    Offer,
    Transfer,
    Rejection
};

const char* to_string(Stage stage) noexcept;

/**
 * @brief Folds a rendezvous failure into the caller-facing taxonomy
 *
 * Mailbox and key exchange failures become ConnectionFailed;
 * offer, transfer and rejection failures become TransferFailed. A cancelled
 * call is always Cancelled. The raw failure kind stays in the detail text.
 */
core::Error map_failure(Stage stage, const rendezvous::Failure& failure);

/// Filesystem failures: a missing entry is FileNotFound, anything else IoError.
core::Error map_filesystem_error(const std::error_code& ec, const std::filesystem::path& path);

} // namespace wormhole::client
