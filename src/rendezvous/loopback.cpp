#include "wormhole/rendezvous/loopback.hpp"

#include "wormhole/events/event_queue.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <condition_variable>
#include <fstream>
#include <vector>

namespace wormhole::rendezvous {
namespace fs = std::filesystem;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

enum class Side { Sender, Receiver };

struct TransitMessage {
    enum class Type { Offer, Accept, Reject, Data, Done, Ack, Closed };

    explicit TransitMessage(Type t) : type(t) {}

    Type type;
    std::string file_name;
    std::uint64_t file_size = 0;
    std::vector<char> payload;
};

using Pipe = events::ThreadSafeQueue<TransitMessage>;

wormhole::ErrValue<Failure> fail(FailureKind kind, std::string message) {
    return wormhole::Err(Failure{kind, std::move(message)});
}

} // namespace

struct LoopbackMailbox {
    explicit LoopbackMailbox(Code c) : code(std::move(c)) {}

    Code code;
    std::mutex mutex;
    std::condition_variable cv;
    bool claimed = false;
    bool sender_arrived = false;
    bool receiver_arrived = false;
    bool sender_gone = false;
    bool receiver_gone = false;
    std::string receiver_password;
    Pipe to_receiver;
    Pipe to_sender;
};

namespace {

class LoopbackMailboxHandle : public MailboxHandle {
public:
    LoopbackMailboxHandle(std::shared_ptr<LoopbackMailbox> box, Side side, Code code)
        : box_(std::move(box)), side_(side), code_(std::move(code)) {}

    ~LoopbackMailboxHandle() override {
        if (consumed_) {
            return;
        }
        {
            std::lock_guard lock(box_->mutex);
            if (side_ == Side::Sender) {
                box_->sender_gone = true;
            } else {
                box_->receiver_gone = true;
            }
        }
        box_->cv.notify_all();
    }

    const Code& code() const override { return code_; }

    const std::shared_ptr<LoopbackMailbox>& box() const { return box_; }
    Side side() const { return side_; }
    void mark_consumed() { consumed_ = true; }

private:
    std::shared_ptr<LoopbackMailbox> box_;
    Side side_;
    Code code_;
    bool consumed_ = false;
};

class LoopbackChannel : public Channel {
public:
    LoopbackChannel(std::shared_ptr<LoopbackMailbox> box, Side side, Code code)
        : box_(std::move(box)), side_(side), code_(std::move(code)) {}

    // The peer reads this as "connection closed" if it is still waiting on us.
    ~LoopbackChannel() override {
        outgoing().push(TransitMessage(TransitMessage::Type::Closed));
    }

    const Code& code() const override { return code_; }

    Pipe& outgoing() { return side_ == Side::Sender ? box_->to_receiver : box_->to_sender; }
    Pipe& incoming() { return side_ == Side::Sender ? box_->to_sender : box_->to_receiver; }

private:
    std::shared_ptr<LoopbackMailbox> box_;
    Side side_;
    Code code_;
};

Attempt<TransitMessage> await_message(Pipe& pipe,
                                      const CancelToken& cancel,
                                      std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (cancel.is_cancelled()) {
            return fail(FailureKind::Cancelled, "cancelled while waiting for peer");
        }
        if (auto message = pipe.pop_for(kPollInterval)) {
            return wormhole::Ok(std::move(*message));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return fail(FailureKind::Network, "timed out waiting for peer");
        }
    }
}

// Blocks the sender while the receiver is window chunks behind.
Attempt<void> await_room(LoopbackChannel& channel,
                         std::size_t window,
                         const CancelToken& cancel,
                         std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!channel.outgoing().wait_below(window, kPollInterval)) {
        if (cancel.is_cancelled()) {
            return fail(FailureKind::Cancelled, "cancelled during transfer");
        }
        if (auto message = channel.incoming().try_pop()) {
            if (message->type == TransitMessage::Type::Closed) {
                return fail(FailureKind::Network, "peer closed the connection during transfer");
            }
            return fail(FailureKind::Protocol, "unexpected transit message during transfer");
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return fail(FailureKind::Network, "timed out waiting for peer to drain transit");
        }
    }
    return wormhole::Ok();
}

class LoopbackPendingRequest : public PendingRequest {
public:
    LoopbackPendingRequest(std::unique_ptr<LoopbackChannel> channel,
                           std::string file_name,
                           std::uint64_t file_size,
                           std::chrono::milliseconds timeout)
        : channel_(std::move(channel)),
          file_name_(std::move(file_name)),
          file_size_(file_size),
          timeout_(timeout) {}

    const std::string& file_name() const override { return file_name_; }
    std::uint64_t file_size() const override { return file_size_; }

    Attempt<void> accept(std::ostream& sink,
                         const ProgressSink& progress,
                         const CancelToken& cancel) override {
        if (answered_) {
            return fail(FailureKind::Protocol, "offer was already answered");
        }
        answered_ = true;
        channel_->outgoing().push(TransitMessage(TransitMessage::Type::Accept));

        std::uint64_t received = 0;
        while (true) {
            auto next = await_message(channel_->incoming(), cancel, timeout_);
            if (next.is_error()) {
                return wormhole::Err(next.error());
            }

            auto& message = next.value();
            switch (message.type) {
                case TransitMessage::Type::Data:
                    received += message.payload.size();
                    if (received > file_size_) {
                        return fail(FailureKind::Protocol, "peer sent more data than it offered");
                    }
                    sink.write(message.payload.data(), static_cast<std::streamsize>(message.payload.size()));
                    if (!sink) {
                        return fail(FailureKind::Io, "failed to write received data");
                    }
                    if (progress) {
                        progress(received, file_size_);
                    }
                    break;
                case TransitMessage::Type::Done:
                    sink.flush();
                    if (!sink) {
                        return fail(FailureKind::Io, "failed to flush received data");
                    }
                    if (received != file_size_) {
                        return fail(FailureKind::Protocol,
                                    "transfer ended after " + std::to_string(received) + " of " +
                                        std::to_string(file_size_) + " bytes");
                    }
                    channel_->outgoing().push(TransitMessage(TransitMessage::Type::Ack));
                    return wormhole::Ok();
                case TransitMessage::Type::Closed:
                    return fail(FailureKind::Network, "sender disconnected during transfer");
                default:
                    return fail(FailureKind::Protocol, "unexpected transit message during transfer");
            }
        }
    }

    Attempt<void> reject() override {
        if (answered_) {
            return fail(FailureKind::Protocol, "offer was already answered");
        }
        answered_ = true;

        while (auto pending = channel_->incoming().try_pop()) {
            if (pending->type == TransitMessage::Type::Closed) {
                return fail(FailureKind::Network, "sender already disconnected");
            }
        }
        channel_->outgoing().push(TransitMessage(TransitMessage::Type::Reject));
        return wormhole::Ok();
    }

private:
    std::unique_ptr<LoopbackChannel> channel_;
    std::string file_name_;
    std::uint64_t file_size_;
    std::chrono::milliseconds timeout_;
    bool answered_ = false;
};

} // namespace

// ──────────────────────────────────────────────────────────
// LoopbackRelay
// ──────────────────────────────────────────────────────────

LoopbackRelay::LoopbackRelay(std::uint64_t seed) : rng_(seed) {}

Attempt<std::shared_ptr<LoopbackMailbox>> LoopbackRelay::open(std::size_t length) {
    if (length == 0) {
        return fail(FailureKind::Protocol, "code length must be at least 1");
    }
    if (length > core::kMaxCodeLength) {
        return fail(FailureKind::Protocol, "code length " + std::to_string(length) + " exceeds the limit of " +
                                               std::to_string(core::kMaxCodeLength) + " words");
    }

    std::lock_guard lock(mutex_);
    auto nameplate = next_free_nameplate();
    auto mailbox = std::make_shared<LoopbackMailbox>(generate_code(nameplate, length, rng_));
    mailboxes_[nameplate] = mailbox;
    return wormhole::Ok(std::move(mailbox));
}

Attempt<std::shared_ptr<LoopbackMailbox>> LoopbackRelay::claim(const Code& code) {
    std::lock_guard lock(mutex_);
    const auto it = mailboxes_.find(code.nameplate);
    if (it == mailboxes_.end()) {
        return fail(FailureKind::Network, "no mailbox allocated for nameplate " + code.nameplate);
    }

    auto mailbox = it->second.lock();
    if (!mailbox) {
        mailboxes_.erase(it);
        return fail(FailureKind::Network, "no mailbox allocated for nameplate " + code.nameplate);
    }

    std::lock_guard box_lock(mailbox->mutex);
    if (mailbox->sender_gone) {
        return fail(FailureKind::Network, "sender abandoned nameplate " + code.nameplate);
    }
    if (mailbox->claimed) {
        return fail(FailureKind::Protocol, "nameplate " + code.nameplate + " is already in use");
    }
    mailbox->claimed = true;
    return wormhole::Ok(std::move(mailbox));
}

void LoopbackRelay::release(const std::shared_ptr<LoopbackMailbox>& mailbox) {
    std::lock_guard lock(mutex_);
    const auto it = mailboxes_.find(mailbox->code.nameplate);
    if (it != mailboxes_.end() && it->second.lock() == mailbox) {
        mailboxes_.erase(it);
    }
}

std::size_t LoopbackRelay::open_nameplates() const {
    std::lock_guard lock(mutex_);
    return static_cast<std::size_t>(std::count_if(mailboxes_.begin(), mailboxes_.end(),
                                                  [](const auto& entry) { return !entry.second.expired(); }));
}

std::string LoopbackRelay::next_free_nameplate() {
    for (std::uint64_t candidate = 1;; ++candidate) {
        auto key = std::to_string(candidate);
        const auto it = mailboxes_.find(key);
        if (it == mailboxes_.end() || it->second.expired()) {
            return key;
        }
    }
}

// ──────────────────────────────────────────────────────────
// LoopbackRendezvous
// ──────────────────────────────────────────────────────────

LoopbackOptions LoopbackOptions::from_config(const core::ClientConfig& config) {
    LoopbackOptions options;
    options.chunk_size = config.transit_chunk_size;
    options.peer_timeout = config.peer_timeout;
    return options;
}

LoopbackRendezvous::LoopbackRendezvous(std::shared_ptr<LoopbackRelay> relay, LoopbackOptions options)
    : relay_(std::move(relay)), options_(options) {
    options_.chunk_size = std::max<std::size_t>(options_.chunk_size, 1);
    options_.window_chunks = std::max<std::size_t>(options_.window_chunks, 1);
}

Attempt<AllocatedMailbox> LoopbackRendezvous::allocate_code(std::size_t length) {
    auto opened = relay_->open(length);
    if (opened.is_error()) {
        return wormhole::Err(opened.error());
    }

    auto mailbox = std::move(opened.value());
    auto code = mailbox->code;
    spdlog::debug("Loopback relay allocated nameplate {}", code.nameplate);
    return wormhole::Ok(AllocatedMailbox{
        std::make_unique<LoopbackMailboxHandle>(std::move(mailbox), Side::Sender, code), code});
}

Attempt<std::unique_ptr<MailboxHandle>> LoopbackRendezvous::bind_code(const Code& code) {
    auto claimed = relay_->claim(code);
    if (claimed.is_error()) {
        return wormhole::Err(claimed.error());
    }
    return wormhole::Ok(std::make_unique<LoopbackMailboxHandle>(std::move(claimed.value()), Side::Receiver, code));
}

Attempt<std::unique_ptr<Channel>> LoopbackRendezvous::authenticate(std::unique_ptr<MailboxHandle> mailbox,
                                                                   const CancelToken& cancel) {
    auto* handle = dynamic_cast<LoopbackMailboxHandle*>(mailbox.get());
    if (handle == nullptr) {
        return fail(FailureKind::Protocol, "mailbox was not opened by the loopback relay");
    }

    const auto box = handle->box();
    const auto side = handle->side();
    {
        std::unique_lock lock(box->mutex);
        if (side == Side::Sender) {
            box->sender_arrived = true;
        } else {
            box->receiver_arrived = true;
            box->receiver_password = handle->code().password();
        }
        box->cv.notify_all();

        const auto deadline = std::chrono::steady_clock::now() + options_.peer_timeout;
        auto peer_arrived = [&]() { return side == Side::Sender ? box->receiver_arrived : box->sender_arrived; };
        auto peer_gone = [&]() { return side == Side::Sender ? box->receiver_gone : box->sender_gone; };

        while (!peer_arrived()) {
            if (cancel.is_cancelled()) {
                return fail(FailureKind::Cancelled, "cancelled during key exchange");
            }
            if (peer_gone()) {
                return fail(FailureKind::Network, "peer abandoned the mailbox");
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return fail(FailureKind::Network, "timed out waiting for peer to join");
            }
            box->cv.wait_for(lock, kPollInterval);
        }

        if (box->receiver_password != box->code.password()) {
            return fail(FailureKind::KeyMismatch, "key confirmation failed, the code was probably mistyped");
        }
        handle->mark_consumed();
    }

    relay_->release(box);
    spdlog::debug("Loopback key exchange complete on nameplate {}", box->code.nameplate);
    return wormhole::Ok(std::make_unique<LoopbackChannel>(box, side, handle->code()));
}

Attempt<OfferSend> LoopbackRendezvous::make_offer(const Channel& channel, const fs::path& path) {
    std::error_code ec;
    const auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        return fail(FailureKind::Io, "cannot stat " + path.string() + ": " + ec.message());
    }
    if (fs::is_directory(status)) {
        return fail(FailureKind::Io, "directories cannot be offered: " + path.string());
    }
    if (!fs::is_regular_file(status)) {
        return fail(FailureKind::Io, "not a regular file: " + path.string());
    }

    const auto size = fs::file_size(path, ec);
    if (ec) {
        return fail(FailureKind::Io, "cannot read size of " + path.string() + ": " + ec.message());
    }

    std::ifstream readable(path, std::ios::binary);
    if (!readable) {
        return fail(FailureKind::Io, "file is not readable: " + path.string());
    }

    OfferSend offer;
    offer.file_name = path.filename().string();
    if (offer.file_name.empty()) {
        offer.file_name = "file";
    }
    offer.source = path;
    offer.total_size = static_cast<std::uint64_t>(size);
    spdlog::debug("Offer on {}: {} ({} bytes)", channel.code().nameplate, offer.file_name, offer.total_size);
    return wormhole::Ok(std::move(offer));
}

Attempt<void> LoopbackRendezvous::send(std::unique_ptr<Channel> channel,
                                       const std::vector<RelayHint>& relay_hints,
                                       const OfferSend& offer,
                                       const ProgressSink& progress,
                                       const CancelToken& cancel) {
    auto* transit = dynamic_cast<LoopbackChannel*>(channel.get());
    if (transit == nullptr) {
        return fail(FailureKind::Protocol, "channel was not opened by the loopback relay");
    }
    spdlog::debug("Loopback transit for {} ({} relay hint(s) unused)", offer.file_name, relay_hints.size());

    TransitMessage announce(TransitMessage::Type::Offer);
    announce.file_name = offer.file_name;
    announce.file_size = offer.total_size;
    transit->outgoing().push(std::move(announce));

    auto answer = await_message(transit->incoming(), cancel, options_.peer_timeout);
    if (answer.is_error()) {
        return wormhole::Err(answer.error());
    }
    switch (answer.value().type) {
        case TransitMessage::Type::Accept:
            break;
        case TransitMessage::Type::Reject:
            return fail(FailureKind::Rejected, "peer rejected the offer");
        case TransitMessage::Type::Closed:
            return fail(FailureKind::Network, "peer closed the connection before answering");
        default:
            return fail(FailureKind::Protocol, "unexpected answer to offer");
    }

    std::ifstream input(offer.source, std::ios::binary);
    if (!input) {
        return fail(FailureKind::Io, "failed to open " + offer.source.string());
    }

    std::uint64_t sent = 0;
    while (sent < offer.total_size) {
        if (cancel.is_cancelled()) {
            return fail(FailureKind::Cancelled, "cancelled during transfer");
        }
        if (auto room = await_room(*transit, options_.window_chunks, cancel, options_.peer_timeout);
            room.is_error()) {
            return wormhole::Err(room.error());
        }

        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(options_.chunk_size, offer.total_size - sent));
        TransitMessage chunk(TransitMessage::Type::Data);
        chunk.payload.resize(want);
        input.read(chunk.payload.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            return fail(FailureKind::Io, "source file shrank during transfer: " + offer.source.string());
        }

        chunk.payload.resize(got);
        sent += got;
        transit->outgoing().push(std::move(chunk));
        if (progress) {
            progress(sent, offer.total_size);
        }
    }
    transit->outgoing().push(TransitMessage(TransitMessage::Type::Done));

    auto ack = await_message(transit->incoming(), cancel, options_.peer_timeout);
    if (ack.is_error()) {
        return wormhole::Err(ack.error());
    }
    switch (ack.value().type) {
        case TransitMessage::Type::Ack:
            return wormhole::Ok();
        case TransitMessage::Type::Closed:
            return fail(FailureKind::Network, "peer closed the connection before acknowledging");
        default:
            return fail(FailureKind::Protocol, "unexpected message instead of acknowledgement");
    }
}

Attempt<std::unique_ptr<PendingRequest>> LoopbackRendezvous::request_offer(std::unique_ptr<Channel> channel,
                                                                           const std::vector<RelayHint>& relay_hints,
                                                                           const CancelToken& cancel) {
    if (dynamic_cast<LoopbackChannel*>(channel.get()) == nullptr) {
        return fail(FailureKind::Protocol, "channel was not opened by the loopback relay");
    }
    std::unique_ptr<LoopbackChannel> transit(static_cast<LoopbackChannel*>(channel.release()));
    spdlog::debug("Waiting for offer on {} ({} relay hint(s))", transit->code().nameplate, relay_hints.size());

    auto first = await_message(transit->incoming(), cancel, options_.peer_timeout);
    if (first.is_error()) {
        return wormhole::Err(first.error());
    }

    auto& message = first.value();
    switch (message.type) {
        case TransitMessage::Type::Offer:
            return wormhole::Ok(std::make_unique<LoopbackPendingRequest>(
                std::move(transit), std::move(message.file_name), message.file_size, options_.peer_timeout));
        case TransitMessage::Type::Closed:
            return wormhole::Ok(std::unique_ptr<PendingRequest>());
        default:
            return fail(FailureKind::Protocol, "expected a file offer");
    }
}

} // namespace wormhole::rendezvous
