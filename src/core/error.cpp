#include "wormhole/core/error.hpp"

namespace wormhole::core {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::ConnectionFailed: return "ConnectionFailed";
        case ErrorKind::InvalidCode: return "InvalidCode";
        case ErrorKind::TransferFailed: return "TransferFailed";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::FileNotFound: return "FileNotFound";
        case ErrorKind::IoError: return "IoError";
        case ErrorKind::ProtocolError: return "ProtocolError";
        case ErrorKind::NoActiveSession: return "NoActiveSession";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, std::string detail)
    : kind_(kind), detail_(std::move(detail)) {}

Error Error::connection_failed(std::string detail) {
    return Error(ErrorKind::ConnectionFailed, std::move(detail));
}

Error Error::invalid_code(std::string raw_code) {
    return Error(ErrorKind::InvalidCode, std::move(raw_code));
}

Error Error::transfer_failed(std::string detail) {
    return Error(ErrorKind::TransferFailed, std::move(detail));
}

Error Error::cancelled() {
    return Error(ErrorKind::Cancelled, {});
}

Error Error::file_not_found(std::string path) {
    return Error(ErrorKind::FileNotFound, std::move(path));
}

Error Error::io_error(std::string detail) {
    return Error(ErrorKind::IoError, std::move(detail));
}

Error Error::protocol_error(std::string detail) {
    return Error(ErrorKind::ProtocolError, std::move(detail));
}

Error Error::no_active_session() {
    return Error(ErrorKind::NoActiveSession, {});
}

std::string Error::message() const {
    switch (kind_) {
        case ErrorKind::ConnectionFailed: return "Connection failed: " + detail_;
        case ErrorKind::InvalidCode: return "Invalid code: " + detail_;
        case ErrorKind::TransferFailed: return "Transfer failed: " + detail_;
        case ErrorKind::Cancelled: return "Operation cancelled";
        case ErrorKind::FileNotFound: return "File not found: " + detail_;
        case ErrorKind::IoError: return "IO error: " + detail_;
        case ErrorKind::ProtocolError: return "Protocol error: " + detail_;
        case ErrorKind::NoActiveSession: return "No active wormhole session";
    }
    return detail_;
}

} // namespace wormhole::core
