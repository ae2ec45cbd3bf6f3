#pragma once

#include "wormhole/core/result.hpp"

#include <string>

namespace wormhole::core {

/**
 * @brief Closed set of failure categories surfaced to callers
 *
 * Every failure coming out of the rendezvous layer or the filesystem is
 * folded into exactly one of these before it leaves the client.
 */
enum class ErrorKind {
    ConnectionFailed,
    InvalidCode,
    TransferFailed,
    Cancelled,
    FileNotFound,
    IoError,
    ProtocolError,
    NoActiveSession
};

const char* to_string(ErrorKind kind) noexcept;

class Error {
public:
    Error(ErrorKind kind, std::string detail);

    static Error connection_failed(std::string detail);
    static Error invalid_code(std::string raw_code);
    static Error transfer_failed(std::string detail);
    static Error cancelled();
    static Error file_not_found(std::string path);
    static Error io_error(std::string detail);
    static Error protocol_error(std::string detail);
    static Error no_active_session();

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::string& detail() const noexcept { return detail_; }

    /// Human readable text, e.g. "Connection failed: relay unreachable"
    [[nodiscard]] std::string message() const;

    bool operator==(const Error& other) const noexcept {
        return kind_ == other.kind_ && detail_ == other.detail_;
    }
    bool operator!=(const Error& other) const noexcept { return !(*this == other); }

private:
    ErrorKind kind_;
    std::string detail_;
};

template<typename T>
using Outcome = wormhole::Result<T, Error>;

} // namespace wormhole::core
