#pragma once

#include "wormhole/core/config.hpp"
#include "wormhole/rendezvous/rendezvous.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <string>

namespace wormhole::rendezvous {

struct LoopbackMailbox;

/**
 * @brief In-process mailbox server
 *
 * Hands out nameplates (lowest free number first), lets one receiver claim
 * each of them, and forgets a nameplate once its mailbox is connected or
 * abandoned. Several LoopbackRendezvous instances sharing one relay can
 * reach each other.
 */
class LoopbackRelay {
public:
    explicit LoopbackRelay(std::uint64_t seed = std::random_device{}());

    LoopbackRelay(const LoopbackRelay&) = delete;
    LoopbackRelay& operator=(const LoopbackRelay&) = delete;

    Attempt<std::shared_ptr<LoopbackMailbox>> open(std::size_t length);
    Attempt<std::shared_ptr<LoopbackMailbox>> claim(const Code& code);
    /// Forgets the nameplate, unless it has already been handed to a newer mailbox.
    void release(const std::shared_ptr<LoopbackMailbox>& mailbox);

    [[nodiscard]] std::size_t open_nameplates() const;

private:
    std::string next_free_nameplate();

    mutable std::mutex mutex_;
    std::map<std::string, std::weak_ptr<LoopbackMailbox>> mailboxes_;
    std::mt19937_64 rng_;
};

struct LoopbackOptions {
    std::size_t chunk_size = 64 * 1024;
    /// Chunks the sender may queue ahead of the receiver.
    std::size_t window_chunks = 8;
    std::chrono::milliseconds peer_timeout{120'000};

    static LoopbackOptions from_config(const core::ClientConfig& config);
};

/**
 * @brief Rendezvous implementation backed by a LoopbackRelay
 *
 * Key exchange succeeds when both sides present the same words. Transit
 * moves the file through in-memory queues in chunks of
 * LoopbackOptions::chunk_size, reporting progress after each chunk. The
 * sender stalls once window_chunks chunks are waiting for the receiver.
 */
class LoopbackRendezvous : public Rendezvous {
public:
    LoopbackRendezvous(std::shared_ptr<LoopbackRelay> relay, LoopbackOptions options = {});

    Attempt<AllocatedMailbox> allocate_code(std::size_t length) override;
    Attempt<std::unique_ptr<MailboxHandle>> bind_code(const Code& code) override;
    Attempt<std::unique_ptr<Channel>> authenticate(std::unique_ptr<MailboxHandle> mailbox,
                                                   const CancelToken& cancel) override;
    Attempt<OfferSend> make_offer(const Channel& channel, const std::filesystem::path& path) override;
    Attempt<void> send(std::unique_ptr<Channel> channel,
                       const std::vector<RelayHint>& relay_hints,
                       const OfferSend& offer,
                       const ProgressSink& progress,
                       const CancelToken& cancel) override;
    Attempt<std::unique_ptr<PendingRequest>> request_offer(std::unique_ptr<Channel> channel,
                                                           const std::vector<RelayHint>& relay_hints,
                                                           const CancelToken& cancel) override;

    [[nodiscard]] const LoopbackOptions& options() const noexcept { return options_; }

private:
    std::shared_ptr<LoopbackRelay> relay_;
    LoopbackOptions options_;
};

} // namespace wormhole::rendezvous
