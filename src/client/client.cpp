#include "wormhole/client/client.hpp"

#include "wormhole/client/error_mapper.hpp"
#include "wormhole/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <variant>

namespace wormhole::client {
namespace fs = std::filesystem;

namespace {

// The offered name becomes a path component under the caller's directory.
wormhole::Result<void> validate_offered_name(const std::string& name) {
    if (name.empty()) {
        return wormhole::Err(std::string("peer offered an empty file name"));
    }
    if (name == "." || name == "..") {
        return wormhole::Err("peer offered a reserved file name: " + name);
    }
    if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos) {
        return wormhole::Err("peer offered a file name containing a path separator: " + name);
    }
    return wormhole::Ok();
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
}

} // namespace

WormholeClient::WormholeClient(std::shared_ptr<rendezvous::Rendezvous> rendezvous,
                               events::EventBus& bus,
                               core::ClientConfig config)
    : rendezvous_(std::move(rendezvous)),
      bus_(bus),
      config_(std::move(config)) {}

WormholeClient::~WormholeClient() {
    // A pending cancel() reset still touches slot_ and bus_.
    background_.join();
}

core::Outcome<std::string> WormholeClient::create_send_code(std::optional<std::size_t> code_length) {
    constexpr const char* op = "create_send_code";
    const auto length = code_length.value_or(config_.code_length);

    auto relay_hints = rendezvous::default_relay_hints();
    if (relay_hints.is_error()) {
        return wormhole::Err(failed(op, core::Error::connection_failed("relay hints: " + relay_hints.error())));
    }

    auto allocated = rendezvous_->allocate_code(length);
    if (allocated.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Mailbox, allocated.error())));
    }

    auto code = allocated.value().code.to_string();
    const auto word_count = allocated.value().code.word_count();
    auto displaced = slot_.swap(MailboxReadyPhase{std::move(allocated.value().mailbox),
                                                  std::move(relay_hints.value())});
    if (kind_of(displaced) != PhaseKind::Idle) {
        spdlog::debug("{} displaced a {} session", op, to_string(kind_of(displaced)));
    }

    bus_.emit(events::CodeAllocatedEvent{code, word_count});
    return wormhole::Ok(std::move(code));
}

core::Outcome<void> WormholeClient::send_file(const std::string& file_path, ProgressHandler on_progress) {
    constexpr const char* op = "send_file";
    const fs::path path(file_path);

    std::error_code ec;
    const bool present = fs::exists(path, ec);
    if (ec) {
        return wormhole::Err(failed(op, map_filesystem_error(ec, path)));
    }
    if (!present) {
        return wormhole::Err(failed(op, core::Error::file_not_found(file_path)));
    }

    const auto cancel = current_token();
    auto taken = slot_.take();
    auto* ready = std::get_if<MailboxReadyPhase>(&taken);
    if (ready == nullptr) {
        return wormhole::Err(failed(op, core::Error::no_active_session()));
    }

    auto channel = rendezvous_->authenticate(std::move(ready->mailbox), cancel);
    if (channel.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::KeyExchange, channel.error())));
    }

    auto offer = rendezvous_->make_offer(*channel.value(), path);
    if (offer.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Offer, offer.error())));
    }
    const auto& outgoing = offer.value();

    bus_.emit(events::TransferStartedEvent{events::Direction::Send, outgoing.file_name, outgoing.total_size});
    const auto started = std::chrono::steady_clock::now();

    ProgressReporter reporter(progress_, std::move(on_progress));
    const rendezvous::ProgressSink sink = [&reporter](std::uint64_t sent, std::uint64_t total) {
        reporter.report(sent, total);
    };

    auto sent = rendezvous_->send(std::move(channel.value()), ready->relay_hints, outgoing, sink, cancel);
    if (sent.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Transfer, sent.error())));
    }

    reporter.complete(outgoing.total_size);
    bus_.emit(events::TransferCompletedEvent{events::Direction::Send, outgoing.file_name,
                                             outgoing.total_size, elapsed_since(started)});
    return wormhole::Ok();
}

core::Outcome<TransferOffer> WormholeClient::connect_receive(const std::string& code) {
    constexpr const char* op = "connect_receive";

    auto parsed = rendezvous::parse_code(code);
    if (parsed.is_error()) {
        spdlog::debug("Rejected code '{}': {}", code, parsed.error());
        return wormhole::Err(failed(op, core::Error::invalid_code(code)));
    }

    const auto cancel = current_token();
    auto relay_hints = rendezvous::default_relay_hints();
    if (relay_hints.is_error()) {
        return wormhole::Err(failed(op, core::Error::connection_failed("relay hints: " + relay_hints.error())));
    }

    auto mailbox = rendezvous_->bind_code(parsed.value());
    if (mailbox.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Mailbox, mailbox.error())));
    }

    auto channel = rendezvous_->authenticate(std::move(mailbox.value()), cancel);
    if (channel.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::KeyExchange, channel.error())));
    }

    auto request = rendezvous_->request_offer(std::move(channel.value()), relay_hints.value(), cancel);
    if (request.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Offer, request.error())));
    }
    if (!request.value()) {
        // Sender went away before offering anything.
        return wormhole::Err(failed(op, core::Error::cancelled()));
    }

    auto& pending = request.value();
    TransferOffer offer{pending->file_name(), pending->file_size()};
    if (auto valid = validate_offered_name(offer.filename); valid.is_error()) {
        return wormhole::Err(failed(op, core::Error::protocol_error(valid.error())));
    }
    if (cancel.is_cancelled()) {
        return wormhole::Err(failed(op, core::Error::cancelled()));
    }

    auto displaced = slot_.swap(ReceivingPhase{std::move(pending), std::move(relay_hints.value())});
    if (kind_of(displaced) != PhaseKind::Idle) {
        spdlog::debug("{} displaced a {} session", op, to_string(kind_of(displaced)));
    }

    bus_.emit(events::OfferReceivedEvent{offer.filename, offer.filesize});
    return wormhole::Ok(std::move(offer));
}

core::Outcome<std::string> WormholeClient::accept_transfer(const std::string& output_dir,
                                                           ProgressHandler on_progress) {
    constexpr const char* op = "accept_transfer";

    const auto cancel = current_token();
    auto taken = slot_.take();
    auto* receiving = std::get_if<ReceivingPhase>(&taken);
    if (receiving == nullptr) {
        return wormhole::Err(failed(op, core::Error::no_active_session()));
    }

    auto& request = *receiving->request;
    const auto file_name = request.file_name();
    const auto file_size = request.file_size();
    const auto destination = fs::path(output_dir) / file_name;

    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        const std::error_code open_error(errno, std::generic_category());
        return wormhole::Err(failed(op, core::Error::io_error("cannot open " + destination.string() +
                                                              " for writing: " + open_error.message())));
    }

    bus_.emit(events::TransferStartedEvent{events::Direction::Receive, file_name, file_size});
    const auto started = std::chrono::steady_clock::now();

    ProgressReporter reporter(progress_, std::move(on_progress));
    const rendezvous::ProgressSink sink = [&reporter](std::uint64_t received, std::uint64_t total) {
        reporter.report(received, total);
    };

    // A failed transfer leaves whatever was written at destination.
    auto received = request.accept(output, sink, cancel);
    if (received.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Transfer, received.error())));
    }

    output.close();
    if (output.fail()) {
        return wormhole::Err(failed(op, core::Error::io_error("failed to close " + destination.string())));
    }

    reporter.complete(file_size);
    bus_.emit(events::TransferCompletedEvent{events::Direction::Receive, file_name, file_size,
                                             elapsed_since(started)});
    return wormhole::Ok(destination.string());
}

core::Outcome<void> WormholeClient::reject_transfer() {
    constexpr const char* op = "reject_transfer";

    auto taken = slot_.take();
    auto* receiving = std::get_if<ReceivingPhase>(&taken);
    if (receiving == nullptr) {
        return wormhole::Err(failed(op, core::Error::no_active_session()));
    }

    const auto file_name = receiving->request->file_name();
    auto rejected = receiving->request->reject();
    if (rejected.is_error()) {
        return wormhole::Err(failed(op, map_failure(Stage::Rejection, rejected.error())));
    }

    bus_.emit(events::OfferRejectedEvent{file_name});
    return wormhole::Ok();
}

void WormholeClient::cancel() {
    {
        std::lock_guard lock(cancel_mutex_);
        cancel_source_.request_cancel();
        cancel_source_ = rendezvous::CancelSource();
    }

    boost::asio::post(background_, [this]() {
        auto discarded = slot_.take();
        bus_.emit(events::SessionCancelledEvent{to_string(kind_of(discarded))});
    });
}

rendezvous::CancelToken WormholeClient::current_token() const {
    std::lock_guard lock(cancel_mutex_);
    return cancel_source_.token();
}

core::Error WormholeClient::failed(const char* operation, core::Error error) {
    bus_.emit(events::OperationFailedEvent{operation, core::to_string(error.kind()), error.message()});
    return error;
}

} // namespace wormhole::client
