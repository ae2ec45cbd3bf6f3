#pragma once

#include "wormhole/client/progress.hpp"
#include "wormhole/client/session_state.hpp"
#include "wormhole/client/types.hpp"
#include "wormhole/core/config.hpp"
#include "wormhole/core/error.hpp"
#include "wormhole/events/event_bus.hpp"
#include "wormhole/rendezvous/cancel.hpp"
#include "wormhole/rendezvous/rendezvous.hpp"

#include <boost/asio/thread_pool.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace wormhole::client {

/**
 * @brief Session orchestrator for one party of a wormhole transfer
 *
 * Send path:    create_send_code() -> send_file()
 * Receive path: connect_receive()  -> accept_transfer() | reject_transfer()
 *
 * Operations may be called from any thread. Each one swaps what it needs
 * out of the session slot, runs the rendezvous calls without holding any
 * lock, and installs its resulting phase at the end. On failure the slot
 * is left Idle. Progress handlers run on the client's delivery thread.
 */
class WormholeClient {
public:
    WormholeClient(std::shared_ptr<rendezvous::Rendezvous> rendezvous,
                   events::EventBus& bus,
                   core::ClientConfig config = {});
    ~WormholeClient();

    WormholeClient(const WormholeClient&) = delete;
    WormholeClient& operator=(const WormholeClient&) = delete;

    /// Opens a mailbox and returns its code. Length defaults to config().code_length.
    core::Outcome<std::string> create_send_code(std::optional<std::size_t> code_length = std::nullopt);

    /// Runs the key exchange on the mailbox from create_send_code() and streams the file.
    core::Outcome<void> send_file(const std::string& file_path, ProgressHandler on_progress);

    core::Outcome<TransferOffer> connect_receive(const std::string& code);

    /// Writes the offered file into output_dir, replacing an existing file. Returns its path.
    core::Outcome<std::string> accept_transfer(const std::string& output_dir, ProgressHandler on_progress);

    core::Outcome<void> reject_transfer();

    /**
     * @brief Abort whatever is running and reset the session
     *
     * Returns immediately. Operations already inside a rendezvous call end
     * with ErrorKind::Cancelled at their next cancellation check; the slot
     * is reset to Idle on a background thread.
     */
    void cancel();

    [[nodiscard]] PhaseKind phase() const { return slot_.peek(); }
    [[nodiscard]] const core::ClientConfig& config() const noexcept { return config_; }

private:
    rendezvous::CancelToken current_token() const;
    core::Error failed(const char* operation, core::Error error);

    std::shared_ptr<rendezvous::Rendezvous> rendezvous_;
    events::EventBus& bus_;
    core::ClientConfig config_;

    SessionSlot slot_;
    ProgressDispatcher progress_;

    mutable std::mutex cancel_mutex_;
    rendezvous::CancelSource cancel_source_;

    boost::asio::thread_pool background_{1};
};

} // namespace wormhole::client
