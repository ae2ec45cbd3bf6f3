#include "wormhole/client/session_state.hpp"

namespace wormhole::client {

const char* to_string(PhaseKind kind) noexcept {
    switch (kind) {
        case PhaseKind::Idle: return "Idle";
        case PhaseKind::MailboxReady: return "MailboxReady";
        case PhaseKind::Connected: return "Connected";
        case PhaseKind::Receiving: return "Receiving";
    }
    return "Unknown";
}

PhaseKind kind_of(const SessionPhase& phase) noexcept {
    switch (phase.index()) {
        case 1: return PhaseKind::MailboxReady;
        case 2: return PhaseKind::Connected;
        case 3: return PhaseKind::Receiving;
        default: return PhaseKind::Idle;
    }
}

SessionPhase SessionSlot::swap(SessionPhase next) {
    std::lock_guard lock(mutex_);
    std::swap(phase_, next);
    return next;
}

SessionPhase SessionSlot::take() {
    return swap(IdlePhase{});
}

PhaseKind SessionSlot::peek() const {
    std::lock_guard lock(mutex_);
    return kind_of(phase_);
}

} // namespace wormhole::client
