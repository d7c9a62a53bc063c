/**
 * @file event_bus.hpp
 * @brief Typed publish/subscribe channel for sync lifecycle events
 *
 * The sync engine emits events without knowing who consumes them; the CLI
 * attaches a logger and a metrics collector, tests attach recorders.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<SyncCompletedEvent>([](const SyncCompletedEvent& e) { ... });
 * bus.emit(SyncCompletedEvent{...});
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
#include <utility>
#include <vector>

namespace csync::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - subscribe/unsubscribe/emit may be called from any thread
 * - handlers run synchronously on the emitting thread, without the lock held,
 *   so a handler may subscribe further handlers
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Register @p handler for every EventType emitted afterwards
     * @return id to pass to unsubscribe()
     */
    template<typename EventType>
    std::size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);
        const std::size_t id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back(
            {id, std::make_shared<TypedHandler<EventType>>(std::move(handler))});
        return id;
    }

    template<typename EventType>
    void unsubscribe(std::size_t handler_id) {
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
     * @brief Deliver @p event to every current subscriber
     *
     * A handler that throws is logged and skipped; the remaining handlers
     * still run and the exception never reaches the emitter.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<Handler>> snapshot;
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
            }
        }
    }

    template<typename EventType>
    std::size_t subscriber_count() const {
        std::shared_lock lock(mutex_);
        auto it = handlers_.find(std::type_index(typeid(EventType)));
        return it != handlers_.end() ? it->second.size() : 0;
    }

    void clear() {
        std::unique_lock lock(mutex_);
        handlers_.clear();
    }

private:
    struct Handler {
        virtual ~Handler() = default;
        virtual void call(const void* event) = 0;
    };

    template<typename EventType>
    struct TypedHandler : Handler {
        std::function<void(const EventType&)> func;

        explicit TypedHandler(std::function<void(const EventType&)> f) : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    std::unordered_map<std::type_index, std::vector<std::pair<std::size_t, std::shared_ptr<Handler>>>> handlers_;
    mutable std::shared_mutex mutex_;
    std::size_t next_handler_id_ = 0;
};

} // namespace csync::events
