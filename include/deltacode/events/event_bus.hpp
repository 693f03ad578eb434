/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for observing comparisons
 *
 * WHY THIS FILE EXISTS:
 * The engine reports progress (comparison started, each delta classified,
 * comparison finished) without knowing who listens. Logging and statistics
 * subscribe to those events; tests subscribe to assert on them.
 *
 * WHAT IT DOES:
 * - Subscription keyed by event type, checked at compile time
 * - Synchronous delivery on the emitting thread
 * - Handler failures logged and isolated from other handlers
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<DeltaClassifiedEvent>([](const DeltaClassifiedEvent& e) { ... });
 * bus.emit(DeltaClassifiedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace deltacode::events {

/**
 * @brief Type-safe publish/subscribe hub
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - Handlers run synchronously on the emitting thread, outside the lock
 * - A handler throwing std::exception is logged; the others still run
 */
class EventBus {
public:
    EventBus() = default;
    ~EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of one type
     *
     * PARAMETERS:
     * handler - called with every emitted EventType, in subscription order
     *
     * RETURNS:
     * Subscription ID for unsubscribe<EventType>()
     *
     * EXAMPLE:
     * auto id = bus.subscribe<SnapshotRejectedEvent>([](const SnapshotRejectedEvent& e) {
     *     spdlog::warn("{} rejected: {}", e.label, e.error.to_string());
     * });
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        auto erased = std::make_shared<ErasedHandler>(
            [typed = std::move(handler)](const void* event) {
                // Stored under EventType's key only, so the cast is exact
                typed(*static_cast<const EventType*>(event));
            });

        std::unique_lock lock(mutex_);
        const size_t id = next_handler_id_++;
        subscriptions_[key_of<EventType>()].push_back(Subscription{id, std::move(erased)});
        return id;
    }

    /**
     * @brief Drop one handler; unknown IDs are ignored
     *
     * EXAMPLE:
     * size_t id = bus.subscribe<ComparisonCompletedEvent>(...);
     * bus.unsubscribe<ComparisonCompletedEvent>(id);
     */
    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = subscriptions_.find(key_of<EventType>());
        if (it == subscriptions_.end()) {
            return;
        }
        auto& list = it->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [handler_id](const Subscription& s) { return s.id == handler_id; }),
                   list.end());
        if (list.empty()) {
            subscriptions_.erase(it);
        }
    }

    /**
     * @brief Deliver an event to every subscriber of its type
     *
     * PARAMETERS:
     * event - passed by reference to each handler; not copied
     *
     * Handlers are snapshotted under a shared lock first, so a handler may
     * subscribe or unsubscribe without deadlocking. Those changes apply from
     * the next emit().
     */
    template<typename EventType>
    void emit(const EventType& event) {
        for (const auto& handler : snapshot(key_of<EventType>())) {
            try {
                (*handler)(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
            }
        }
    }

    template<typename EventType>
    size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = subscriptions_.find(key_of<EventType>());
        return it != subscriptions_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscriptions_.clear();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    struct Subscription {
        size_t id;
        std::shared_ptr<ErasedHandler> handler;
    };

    template<typename EventType>
    static std::type_index key_of() {
        return std::type_index(typeid(EventType));
    }

    std::vector<std::shared_ptr<ErasedHandler>> snapshot(std::type_index key) const {
        std::vector<std::shared_ptr<ErasedHandler>> handlers;
        std::shared_lock lock(mutex_);
        auto it = subscriptions_.find(key);
        if (it != subscriptions_.end()) {
            handlers.reserve(it->second.size());
            for (const auto& subscription : it->second) {
                handlers.push_back(subscription.handler);
            }
        }
        return handlers;
    }

    std::unordered_map<std::type_index, std::vector<Subscription>> subscriptions_;
    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace deltacode::events
