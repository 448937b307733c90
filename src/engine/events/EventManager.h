// EventManager.h

#pragma once
#include "Event.h"
#include <functional>
#include <unordered_map>
#include <vector>
#include <algorithm>

class EventManager {
public:
    using Listener = std::function<void(const Event&)>;
    using SubscriptionId = int;

    static EventManager& getInstance() {
        static EventManager instance;
        return instance;
    }

    // Returns a handle for unsubscribe(); systems that die before the
    // manager must drop their listeners.
    SubscriptionId subscribe(EventType type, const Listener& listener) {
        SubscriptionId id = nextId++;
        listeners[type].push_back({id, listener});
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        for (auto& [type, list] : listeners) {
            list.erase(std::remove_if(list.begin(), list.end(),
                                      [id](const Entry& e){ return e.id == id; }),
                       list.end());
        }
    }

    // Emit an event to all registered listeners for its type.
    // Listeners are copied first so a handler may (un)subscribe safely.
    void emit(const Event& event) const {
        auto it = listeners.find(event.getType());
        if (it == listeners.end()) return;
        const std::vector<Entry> snapshot = it->second;
        for (const auto& entry : snapshot) {
            entry.listener(event);
        }
    }

    size_t listenerCount(EventType type) const {
        auto it = listeners.find(type);
        return it == listeners.end() ? 0 : it->second.size();
    }

private:
    struct Entry {
        SubscriptionId id;
        Listener listener;
    };

    EventManager() = default;
    EventManager(const EventManager&) = delete;
    EventManager& operator=(const EventManager&) = delete;

    std::unordered_map<EventType, std::vector<Entry>> listeners;
    SubscriptionId nextId = 1;
};
