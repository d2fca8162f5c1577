#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace emberfall {

/// Payload of a gameplay event: named integer and string fields.
/// Setting a key again replaces it, whatever its previous type.
class EventData {
public:
    void setString(const std::string& key, const std::string& value) { m_fields[key] = value; }
    void setInt(const std::string& key, int64_t value) { m_fields[key] = value; }

    std::string getString(const std::string& key, const std::string& def = "") const {
        const auto* value = field<std::string>(key);
        return value ? *value : def;
    }
    int64_t getInt(const std::string& key, int64_t def = 0) const {
        const auto* value = field<int64_t>(key);
        return value ? *value : def;
    }

    bool hasString(const std::string& key) const { return field<std::string>(key) != nullptr; }
    bool hasInt(const std::string& key) const { return field<int64_t>(key) != nullptr; }

private:
    template<typename T>
    const T* field(const std::string& key) const {
        auto it = m_fields.find(key);
        return it != m_fields.end() ? std::get_if<T>(&it->second) : nullptr;
    }

    std::map<std::string, std::variant<int64_t, std::string>> m_fields;
};

using EventHandlerId = uint64_t;

/// Returns true to consume the event; later handlers are then skipped
using EventHandler = std::function<bool(const EventData&)>;

/// In-process bus for gameplay notifications (entity_death,
/// animation_finished). Handlers run in ascending priority, ties in
/// subscription order.
class EventBus {
public:
    EventHandlerId on(const std::string& eventName, EventHandler handler, int priority = 0) {
        auto& handlers = m_handlers[eventName];
        auto pos = std::upper_bound(handlers.begin(), handlers.end(), priority,
            [](int p, const Subscription& sub) { return p < sub.priority; });
        EventHandlerId id = m_nextId++;
        handlers.insert(pos, Subscription{id, priority, std::move(handler)});
        return id;
    }

    bool off(EventHandlerId id) {
        for (auto& [name, handlers] : m_handlers) {
            auto erased = std::erase_if(handlers, [id](const Subscription& sub) { return sub.id == id; });
            if (erased > 0) return true;
        }
        return false;
    }

    /// Returns true if a handler consumed the event. Handlers may subscribe
    /// or unsubscribe while it is being delivered.
    bool emit(const std::string& eventName, const EventData& data = {}) {
        auto it = m_handlers.find(eventName);
        if (it == m_handlers.end()) return false;

        const std::vector<Subscription> snapshot = it->second;
        return std::any_of(snapshot.begin(), snapshot.end(),
            [&data](const Subscription& sub) { return sub.callback(data); });
    }

    size_t handlerCount(const std::string& eventName) const {
        auto it = m_handlers.find(eventName);
        return it != m_handlers.end() ? it->second.size() : 0;
    }

    void clear() { m_handlers.clear(); }

private:
    struct Subscription {
        EventHandlerId id = 0;
        int priority = 0;
        EventHandler callback;
    };

    std::map<std::string, std::vector<Subscription>> m_handlers;
    EventHandlerId m_nextId = 1;
};

} // namespace emberfall
