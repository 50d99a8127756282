/**
 * @file eventbus.hpp
 * @brief Thread-safe typed publish/subscribe hub
 *
 * Components publish plain event structs (see safetyevents.hpp); any number of
 * handlers may subscribe per event type. Publishing is fire-and-forget: a
 * throwing handler is logged and does not affect the publisher or the other
 * handlers.
 */

#ifndef EVENTBUS_HPP
#define EVENTBUS_HPP

#include <cstddef>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <typeindex>
#include <unordered_map>
#include <vector>

#include "logging.hpp"

class EventBus {
public:
    using SubscriptionId = std::size_t;

    /**
     * @brief Registers a handler for events of type @p Event
     * @return Id usable with unsubscribe()
     */
    template <typename Event>
    SubscriptionId subscribe(std::function<void(const Event&)> handler) {
        std::lock_guard<std::mutex> lock(m_mutex);
        SubscriptionId id = ++m_nextId;
        auto erased = [handler = std::move(handler)](const void* event) {
            handler(*static_cast<const Event*>(event));
        };
        m_handlers[std::type_index(typeid(Event))].emplace(id, std::move(erased));
        return id;
    }

    bool unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& entry : m_handlers) {
            if (entry.second.erase(id) > 0)
                return true;
        }
        return false;
    }

    /**
     * @brief Delivers @p event to every handler subscribed to its type
     *
     * Handlers are copied under the lock and invoked without it, so a handler
     * may publish or subscribe itself.
     */
    template <typename Event>
    void publish(const Event& event) const {
        std::vector<ErasedHandler> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_handlers.find(std::type_index(typeid(Event)));
            if (it == m_handlers.end())
                return;
            for (const auto& entry : it->second)
                handlers.push_back(entry.second);
        }

        for (const auto& handler : handlers) {
            try {
                handler(&event);
            } catch (const std::exception& e) {
                MEDIASORT_LOG_ERROR("Event handler for {} threw: {}", typeid(Event).name(), e.what());
            }
        }
    }

    template <typename Event>
    std::size_t subscriberCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handlers.find(std::type_index(typeid(Event)));
        return it == m_handlers.end() ? 0 : it->second.size();
    }

private:
    using ErasedHandler = std::function<void(const void*)>;

    mutable std::mutex m_mutex;
    SubscriptionId m_nextId = 0;
    // std::map keeps delivery in subscription order
    std::unordered_map<std::type_index, std::map<SubscriptionId, ErasedHandler>> m_handlers;
};

using EventBusPtr = std::shared_ptr<EventBus>;

#endif // EVENTBUS_HPP
