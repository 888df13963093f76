/**
 * @file event_bus.hpp
 * @brief Type-safe event bus between the sync engine and its observers
 *
 * WHY THIS FILE EXISTS:
 * The synchronizer, the promotion scheduler and the folder lifecycle report
 * what they did without knowing who listens. Logging and metrics subscribe
 * here instead of being threaded through every constructor.
 *
 * EXAMPLE:
 * EventBus bus;
 * bus.subscribe<FileUploadedEvent>([](const FileUploadedEvent& e) { ... });
 * bus.emit(FileUploadedEvent{"a.txt", "fuse/staging/a.txt", 10});
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

namespace tiersync::events {

/**
 * @brief Type-safe event bus
 *
 * THREAD SAFETY:
 * - The dispatcher and scheduler threads emit concurrently
 * - Handlers run synchronously in the emitting thread, outside the lock
 * - A throwing handler is logged and skipped; the others still run
 */
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /**
     * @brief Subscribe to events of a specific type
     *
     * RETURNS:
     * Subscription ID for unsubscribe()
     */
    template<typename EventType>
    size_t subscribe(std::function<void(const EventType&)> handler) {
        std::unique_lock lock(mutex_);

        auto wrapper = std::make_shared<HandlerImpl<EventType>>(std::move(handler));
        size_t handler_id = next_handler_id_++;
        handlers_[std::type_index(typeid(EventType))].push_back({handler_id, wrapper});
        return handler_id;
    }

    template<typename EventType>
    void unsubscribe(size_t handler_id) {
        std::unique_lock lock(mutex_);

        auto it = handlers_.find(std::type_index(typeid(EventType)));
        if (it == handlers_.end()) {
            return;
        }
        auto& handler_list = it->second;
        handler_list.erase(
            std::remove_if(handler_list.begin(), handler_list.end(),
                [handler_id](const auto& pair) {
                    return pair.first == handler_id;
                }),
            handler_list.end()
        );
    }

    /**
     * @brief Emit an event to all subscribers
     *
     * Handler pointers are copied under a shared lock so a handler may
     * subscribe or emit without deadlocking.
     */
    template<typename EventType>
    void emit(const EventType& event) {
        std::vector<std::shared_ptr<HandlerBase>> handlers_copy;
        {
            std::shared_lock lock(mutex_);
            auto it = handlers_.find(std::type_index(typeid(EventType)));
            if (it == handlers_.end()) {
                return;
            }
            for (const auto& [id, handler] : it->second) {
                handlers_copy.push_back(handler);
            }
        }

        for (auto& handler : handlers_copy) {
            try {
                handler->call(&event);
            } catch (const std::exception& e) {
                spdlog::error("Event handler for {} threw: {}", typeid(EventType).name(), e.what());
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
        std::function<void(const EventType&)> func;

        explicit HandlerImpl(std::function<void(const EventType&)> f)
            : func(std::move(f)) {}

        void call(const void* event) override {
            func(*static_cast<const EventType*>(event));
        }
    };

    // event type -> list of (handler_id, handler)
    std::unordered_map<
        std::type_index,
        std::vector<std::pair<size_t, std::shared_ptr<HandlerBase>>>
    > handlers_;

    mutable std::shared_mutex mutex_;
    size_t next_handler_id_ = 0;
};

} // namespace tiersync::events
