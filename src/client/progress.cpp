#include "wormhole/client/progress.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <exception>

namespace wormhole::client {

ProgressEvent ProgressEvent::make(std::uint64_t transferred, std::uint64_t total) noexcept {
    ProgressEvent event;
    event.transferred = transferred;
    event.total = total;
    if (total > 0) {
        const double ratio = static_cast<double>(transferred) / static_cast<double>(total);
        const double rounded = std::round(ratio * 100.0);
        event.percent = static_cast<std::uint32_t>(std::clamp(rounded, 0.0, 100.0));
    }
    return event;
}

ProgressEvent ProgressEvent::completed(std::uint64_t total) noexcept {
    ProgressEvent event;
    event.transferred = total;
    event.total = total;
    event.percent = 100;
    return event;
}

// ──────────────────────────────────────────────────────────
// ProgressDispatcher
// ──────────────────────────────────────────────────────────

ProgressDispatcher::ProgressDispatcher() : worker_([this]() { run(); }) {}

ProgressDispatcher::~ProgressDispatcher() {
    queue_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ProgressDispatcher::post(ProgressHandler handler, ProgressEvent event) {
    if (!handler) {
        return;
    }
    queue_.push(Delivery{std::move(handler), event});
}

void ProgressDispatcher::run() {
    while (auto delivery = queue_.pop()) {
        try {
            delivery->handler(delivery->event);
        } catch (const std::exception& e) {
            spdlog::warn("Progress handler threw: {}", e.what());
        } catch (...) {
            spdlog::warn("Progress handler threw a non-standard exception");
        }
    }
}

// ──────────────────────────────────────────────────────────
// ProgressReporter
// ──────────────────────────────────────────────────────────

ProgressReporter::ProgressReporter(ProgressDispatcher& dispatcher, ProgressHandler handler)
    : dispatcher_(dispatcher), handler_(std::move(handler)) {}

void ProgressReporter::report(std::uint64_t transferred, std::uint64_t total) {
    std::lock_guard lock(mutex_);
    if (completed_ || transferred < last_transferred_) {
        return;
    }
    last_transferred_ = transferred;
    dispatcher_.post(handler_, ProgressEvent::make(transferred, total));
}

void ProgressReporter::complete(std::uint64_t total) {
    std::lock_guard lock(mutex_);
    if (completed_) {
        return;
    }
    completed_ = true;
    last_transferred_ = total;
    dispatcher_.post(handler_, ProgressEvent::completed(total));
}

std::uint64_t ProgressReporter::last_transferred() const {
    std::lock_guard lock(mutex_);
    return last_transferred_;
}

bool ProgressReporter::completed() const {
    std::lock_guard lock(mutex_);
    return completed_;
}

} // namespace wormhole::client
