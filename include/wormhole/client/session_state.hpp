#pragma once

#include "wormhole/rendezvous/rendezvous.hpp"

#include <memory>
#include <mutex>
#include <variant>
#include <vector>

namespace wormhole::client {

using RelayHints = std::vector<rendezvous::RelayHint>;

struct IdlePhase {};

/// Code allocated, key exchange not started yet.
struct MailboxReadyPhase {
    std::unique_ptr<rendezvous::MailboxHandle> mailbox;
    RelayHints relay_hints;
};

/// Authenticated channel not yet bound to a transfer.
struct ConnectedPhase {
    std::unique_ptr<rendezvous::Channel> channel;
    RelayHints relay_hints;
};

/// Offer received, waiting for accept or reject.
struct ReceivingPhase {
    std::unique_ptr<rendezvous::PendingRequest> request;
    RelayHints relay_hints;
};

using SessionPhase = std::variant<IdlePhase, MailboxReadyPhase, ConnectedPhase, ReceivingPhase>;

enum class PhaseKind {
    Idle,
    MailboxReady,
    Connected,
    Receiving
};

const char* to_string(PhaseKind kind) noexcept;
PhaseKind kind_of(const SessionPhase& phase) noexcept;

/**
 * @brief The single session slot of a client
 *
 * Every transition is a swap: the caller receives the previous phase and
 * becomes its sole owner, so resources held by a phase are handed out at
 * most once. The lock is held only for the swap itself.
 */
class SessionSlot {
public:
    SessionSlot() = default;

    SessionSlot(const SessionSlot&) = delete;
    SessionSlot& operator=(const SessionSlot&) = delete;

    SessionPhase swap(SessionPhase next);

    /// swap(IdlePhase{})
    SessionPhase take();

    [[nodiscard]] PhaseKind peek() const;

private:
    mutable std::mutex mutex_;
    SessionPhase phase_{IdlePhase{}};
};

} // namespace wormhole::client
