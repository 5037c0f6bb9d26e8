/**
 * @file event_bus.hpp
 * @brief Type-safe event bus for observing staging runs
 *
 * The staging coordinator reports what it does (uploads, cache hits,
 * failures) without knowing who listens. Logging and metrics subscribe
 * here instead of being wired into the coordinator.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<PackageUploadedEvent>([](const PackageUploadedEvent& e) { ... });
 * bus.emit(PackageUploadedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace stager::events {

using SubscriptionId = std::size_t;

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * Staging units emit from pool threads, so emit/subscribe/unsubscribe may
 * all race. Handlers run synchronously on the emitting thread and must be
 * thread-safe themselves.
 *
 * Each event type owns an immutable handler list. Subscribing or
 * unsubscribing swaps in a new list; emit only takes a reference to the
 * current one, so handlers run without any lock held.
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register @p handler for events of type EventType
     * @return id to pass to unsubscribe()
     */
    template<typename EventType>
    SubscriptionId subscribe(std::function<void(const EventType&)> handler) {
        Subscription subscription;
        subscription.invoke = [fn = std::move(handler)](const void* event) {
            fn(*static_cast<const EventType*>(event));
        };

        std::unique_lock lock(mutex_);
        subscription.id = next_id_++;
        auto& slot = subscriptions_[std::type_index(typeid(EventType))];
        auto updated = slot ? std::make_shared<SubscriptionList>(*slot) : std::make_shared<SubscriptionList>();
        updated->push_back(std::move(subscription));
        slot = std::move(updated);
        return next_id_ - 1;
    }

    template<typename EventType>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto it = subscriptions_.find(std::type_index(typeid(EventType)));
        if (it == subscriptions_.end() || !it->second) {
            return;
        }

        auto updated = std::make_shared<SubscriptionList>();
        for (const auto& subscription : *it->second) {
            if (subscription.id != id) {
                updated->push_back(subscription);
            }
        }
        it->second = std::move(updated);
    }

    /**
     * @brief Deliver @p event to every current subscriber of its type
     *
     * A handler that throws anything is logged and skipped; emit runs on
     * pool threads, where an escaping exception would terminate the process.
     */
    template<typename EventType>
    void emit(const EventType& event) const {
        const auto subscribers = snapshot(std::type_index(typeid(EventType)));
        if (!subscribers) {
            return;
        }

        for (const auto& subscription : *subscribers) {
            try {
                subscription.invoke(&event);
            } catch (const std::exception& e) {
                spdlog::error("Handler {} for {} threw: {}", subscription.id, typeid(EventType).name(), e.what());
            } catch (...) {
                spdlog::error("Handler {} for {} threw an unknown exception",
                              subscription.id, typeid(EventType).name());
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        const auto subscribers = snapshot(std::type_index(typeid(EventType)));
        return subscribers ? subscribers->size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscriptions_.clear();
    }

private:
    struct Subscription {
        SubscriptionId id = 0;
        std::function<void(const void*)> invoke;
    };

    using SubscriptionList = std::vector<Subscription>;

    std::shared_ptr<const SubscriptionList> snapshot(std::type_index type) const {
        std::shared_lock lock(mutex_);
        auto it = subscriptions_.find(type);
        return it != subscriptions_.end() ? it->second : nullptr;
    }

    std::unordered_map<std::type_index, std::shared_ptr<const SubscriptionList>> subscriptions_;
    mutable std::shared_mutex mutex_;
    SubscriptionId next_id_ = 0;
};

} // namespace stager::events
