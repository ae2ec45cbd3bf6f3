#include "wormhole/rendezvous/rendezvous.hpp"

namespace wormhole::rendezvous {

const char* to_string(FailureKind kind) noexcept {
    switch (kind) {
        case FailureKind::Network: return "network";
        case FailureKind::Protocol: return "protocol";
        case FailureKind::KeyMismatch: return "key-mismatch";
        case FailureKind::Io: return "io";
        case FailureKind::Rejected: return "rejected";
        case FailureKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::string Failure::describe() const {
    return std::string("[") + to_string(kind) + "] " + message;
}

} // namespace wormhole::rendezvous
