#include "wormhole/client/error_mapper.hpp"

namespace wormhole::client {

const char* to_string(Stage stage) noexcept {
    switch (stage) {
        case Stage::Mailbox: return "mailbox";
        case Stage::KeyExchange: return "key exchange";
        case Stage::Offer: return "offer";
        case Stage::Transfer: return "transfer";
        case Stage::Rejection: return "rejection";
    }
    return "unknown";
}

core::Error map_failure(Stage stage, const rendezvous::Failure& failure) {
    if (failure.kind == rendezvous::FailureKind::Cancelled) {
        return core::Error::cancelled();
    }

    auto detail = std::string(to_string(stage)) + ": " + failure.describe();
    switch (stage) {
        case Stage::Mailbox:
        case Stage::KeyExchange:
            return core::Error::connection_failed(std::move(detail));
        case Stage::Offer:
        case Stage::Transfer:
        case Stage::Rejection:
            return core::Error::transfer_failed(std::move(detail));
    }
    return core::Error::protocol_error(std::move(detail));
}

core::Error map_filesystem_error(const std::error_code& ec, const std::filesystem::path& path) {
    if (ec == std::errc::no_such_file_or_directory) {
        return core::Error::file_not_found(path.string());
    }
    return core::Error::io_error(path.string() + ": " + ec.message());
}

} // namespace wormhole::client
