/**
 * @file event_bus.hpp
 * @brief Type-safe publish/subscribe bus for upload progress events
 *
 * WHY THIS FILE EXISTS:
 * The coordinator reports progress (part uploaded, retry scheduled, upload
 * aborted...) without knowing who listens. Logging and metrics subscribe
 * independently.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<PartUploadedEvent>([](const PartUploadedEvent& e) { ... });
 * bus.emit(PartUploadedEvent{...});
 */

#pragma once

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

namespace mpu::events {

using SubscriptionId = std::size_t;

/**
 * @brief Type-indexed event bus
 *
 * THREAD SAFETY:
 * - Part workers emit concurrently from their own threads
 * - Handlers run synchronously in the emitting thread, so they must be
 *   thread-safe themselves
 * - Dispatch works on a snapshot of the subscriber list; a handler may
 *   subscribe or unsubscribe without deadlocking
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    template<typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> handler) {
        // Erase the event type; emit() restores it from the type_index key.
        auto erased = std::make_shared<const Callback>(
            [fn = std::move(handler)](const void* event) { fn(*static_cast<const Event*>(event)); });

        std::unique_lock lock(mutex_);
        const SubscriptionId id = ++last_id_;
        subscribers_[key_of<Event>()].push_back(Subscriber{id, std::move(erased)});
        return id;
    }

    /// Unknown ids are ignored.
    template<typename Event>
    void unsubscribe(SubscriptionId id) {
        std::unique_lock lock(mutex_);
        auto found = subscribers_.find(key_of<Event>());
        if (found == subscribers_.end()) {
            return;
        }
        auto& list = found->second;
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [id](const Subscriber& s) { return s.id == id; }),
                   list.end());
        if (list.empty()) {
            subscribers_.erase(found);
        }
    }

    /**
     * @brief Deliver @p event to every subscriber of its type
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the emitter never sees the exception.
     */
    template<typename Event>
    void emit(const Event& event) const {
        std::vector<std::shared_ptr<const Callback>> snapshot;
        {
            std::shared_lock lock(mutex_);
            auto found = subscribers_.find(key_of<Event>());
            if (found == subscribers_.end()) {
                return;
            }
            snapshot.reserve(found->second.size());
            for (const auto& subscriber : found->second) {
                snapshot.push_back(subscriber.callback);
            }
        }

        for (const auto& callback : snapshot) {
            try {
                (*callback)(&event);
            } catch (const std::exception& e) {
                spdlog::error("[EventBus] {} subscriber threw: {}", typeid(Event).name(), e.what());
            }
        }
    }

    template<typename Event>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto found = subscribers_.find(key_of<Event>());
        return found == subscribers_.end() ? 0 : found->second.size();
    }

    void clear() {
        std::unique_lock lock(mutex_);
        subscribers_.clear();
    }

private:
    using Callback = std::function<void(const void*)>;

    struct Subscriber {
        SubscriptionId id;
        std::shared_ptr<const Callback> callback;
    };

    template<typename Event>
    static std::type_index key_of() {
        return std::type_index(typeid(Event));
    }

    std::unordered_map<std::type_index, std::vector<Subscriber>> subscribers_;
    mutable std::shared_mutex mutex_;
    SubscriptionId last_id_ = 0;
};

} // namespace mpu::events
