/**
 * @file rendezvous.hpp
 * @brief Interface to the rendezvous/transit library the client drives
 *
 * The client never talks to a mailbox server or a relay directly. It hands
 * every network and cryptographic step to an implementation of Rendezvous
 * and only sequences the calls.
 *
 * OWNERSHIP:
 * Handles are move-only and consumed by the call that advances them:
 * a MailboxHandle is consumed by authenticate(), a Channel by send() or
 * request_offer(). Dropping a handle closes it and lets the peer observe it.
 */

#pragma once

#include "wormhole/core/result.hpp"
#include "wormhole/rendezvous/cancel.hpp"
#include "wormhole/rendezvous/code.hpp"
#include "wormhole/rendezvous/relay_hint.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace wormhole::rendezvous {

enum class FailureKind {
    Network,     ///< Mailbox server or relay unreachable, peer timed out
    Protocol,    ///< Peer sent something unexpected
    KeyMismatch, ///< Key exchange finished with different keys (wrong code)
    Io,          ///< Local read/write failure while streaming
    Rejected,    ///< Peer declined the offer
    Cancelled    ///< Cancel token tripped
};

const char* to_string(FailureKind kind) noexcept;

/**
 * @brief Raw failure reported by the rendezvous layer
 */
struct Failure {
    FailureKind kind = FailureKind::Network;
    std::string message;

    [[nodiscard]] std::string describe() const;
};

template<typename T>
using Attempt = wormhole::Result<T, Failure>;

/// Called with (bytes_so_far, total_bytes) from inside the transfer loop.
using ProgressSink = std::function<void(std::uint64_t, std::uint64_t)>;

class MailboxHandle {
public:
    virtual ~MailboxHandle() = default;
    [[nodiscard]] virtual const Code& code() const = 0;
};

/// Authenticated, encrypted channel between the two parties.
class Channel {
public:
    virtual ~Channel() = default;
    [[nodiscard]] virtual const Code& code() const = 0;
};

/**
 * @brief Incoming offer waiting for the local decision
 *
 * Exactly one of accept() or reject() may be called.
 */
class PendingRequest {
public:
    virtual ~PendingRequest() = default;

    [[nodiscard]] virtual const std::string& file_name() const = 0;
    [[nodiscard]] virtual std::uint64_t file_size() const = 0;

    virtual Attempt<void> accept(std::ostream& sink,
                                 const ProgressSink& progress,
                                 const CancelToken& cancel) = 0;

    virtual Attempt<void> reject() = 0;
};

struct AllocatedMailbox {
    std::unique_ptr<MailboxHandle> mailbox;
    Code code;
};

struct OfferSend {
    std::string file_name;
    std::filesystem::path source;
    std::uint64_t total_size = 0;
};

class Rendezvous {
public:
    virtual ~Rendezvous() = default;

    /// Opens a mailbox and allocates a fresh code of `length` words.
    virtual Attempt<AllocatedMailbox> allocate_code(std::size_t length) = 0;

    /// Opens the mailbox named by an existing code.
    virtual Attempt<std::unique_ptr<MailboxHandle>> bind_code(const Code& code) = 0;

    /// Runs the key exchange; blocks until the peer shows up.
    virtual Attempt<std::unique_ptr<Channel>> authenticate(std::unique_ptr<MailboxHandle> mailbox,
                                                           const CancelToken& cancel) = 0;

    /// Reads file metadata only.
    virtual Attempt<OfferSend> make_offer(const Channel& channel,
                                          const std::filesystem::path& path) = 0;

    virtual Attempt<void> send(std::unique_ptr<Channel> channel,
                               const std::vector<RelayHint>& relay_hints,
                               const OfferSend& offer,
                               const ProgressSink& progress,
                               const CancelToken& cancel) = 0;

    /// An empty pointer means the sender went away before offering anything.
    virtual Attempt<std::unique_ptr<PendingRequest>> request_offer(std::unique_ptr<Channel> channel,
                                                                   const std::vector<RelayHint>& relay_hints,
                                                                   const CancelToken& cancel) = 0;
};

} // namespace wormhole::rendezvous
