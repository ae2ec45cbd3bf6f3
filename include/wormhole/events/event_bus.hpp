/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus
 *
 * The client publishes its lifecycle here; logging and metrics subscribe
 * without the client knowing about them.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) { ... });
 * bus.emit(TransferCompletedEvent{...});
 */

#pragma once

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace wormhole::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - emit() and subscribe() may run concurrently from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock,
 *   so a handler may subscribe or emit without deadlocking
 */
class EventBus {
public:
    using HandlerId = size_t;

    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register a handler for EventType
     *
     * RETURNS: id to pass to unsubscribe()
     */
    template<typename EventType>
    HandlerId subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const HandlerId id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].emplace_back(
            id, std::make_shared<HandlerImpl<EventType>>(std::move(handler)));
        return id;
    }

    template<typename EventType>
    void unsubscribe(HandlerId handler_id) {
        std::unique_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const auto& entry) { return entry.first == handler_id; }),
                   list.end());
    }

    /**
     * @brief Deliver event to every subscriber of its type
     *
     * EXCEPTION SAFETY:
     * A throwing handler is logged and skipped; the others still run,
     * and the emitting operation is never failed by a subscriber.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                snapshot.push_back(handler);
            }
        }

        for (auto& handler : snapshot) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            } catch (...) {
                spdlog::error("Event handler for {} threw a non-standard exception", typeid(EventType).name());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct HandlerBase {
        virtual ~HandlerBase() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct HandlerImpl : HandlerBase {
        explicit HandlerImpl(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        // Only ever invoked with the EventType it was registered under.
        void call(const void* event) override { func(*static_cast<const EventType*>(event)); }

        std::function<void(const EventType&)> func;
    };

    std::unordered_map<std::type_index,
                       std::vector<std::pair<HandlerId, std::shared_ptr<HandlerBase>>>> handlers_;
    mutable std::shared_mutex mutex_;
    HandlerId next_handler_id_ = 0;
};

} // namespace wormhole::events
