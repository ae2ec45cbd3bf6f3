#pragma once

#include <atomic>
#include <memory>

namespace wormhole::rendezvous {

/**
 * @brief Read side of a cancellation flag, passed into every suspending call
 *
 * Copies share the same flag. A default-constructed token never trips.
 */
class CancelToken {
public:
    CancelToken() = default;

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

    static CancelToken never() { return CancelToken(); }

private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<std::atomic<bool>> flag) : flag_(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> flag_;
};

class CancelSource {
public:
    CancelSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    [[nodiscard]] CancelToken token() const { return CancelToken(flag_); }

    void request_cancel() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace wormhole::rendezvous
