#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <functional>
#include <algorithm>
#include <cstdint>

namespace delve {

/// Event names emitted by the game core. Payload keys are listed beside each.
namespace Events {
    inline constexpr const char* Rest       = "rest";        // healed
    inline constexpr const char* Descend    = "descend";     // depth
    inline constexpr const char* LevelUp    = "level_up";    // level
    inline constexpr const char* Kill       = "kill";        // attacker, victim, xp, player_kill
    inline constexpr const char* Attack     = "attack";      // attacker, target, damage
    inline constexpr const char* PlayerDied = "player_died"; // victim
    inline constexpr const char* Notice     = "notice";      // text, tone
}

/// Event data container - key/value payload for narrative events
class EventData {
public:
    EventData() = default;

    EventData& setString(const std::string& key, const std::string& value) {
        m_strings[key] = value;
        return *this;
    }
    EventData& setInt(const std::string& key, int value) {
        m_ints[key] = value;
        return *this;
    }
    EventData& setBool(const std::string& key, bool value) {
        m_bools[key] = value;
        return *this;
    }

    std::string getString(const std::string& key, const std::string& def = "") const {
        auto it = m_strings.find(key);
        return it != m_strings.end() ? it->second : def;
    }
    int getInt(const std::string& key, int def = 0) const {
        auto it = m_ints.find(key);
        return it != m_ints.end() ? it->second : def;
    }
    bool getBool(const std::string& key, bool def = false) const {
        auto it = m_bools.find(key);
        return it != m_bools.end() ? it->second : def;
    }

private:
    std::unordered_map<std::string, std::string> m_strings;
    std::unordered_map<std::string, int> m_ints;
    std::unordered_map<std::string, bool> m_bools;
};

/// Subscription handle returned by EventBus::on
using EventHandlerId = uint64_t;

using EventHandler = std::function<void(const EventData&)>;

/// Synchronous publish/subscribe bus between the game core and whatever
/// presents it (message log, UI, tests). Handlers run in subscription order.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    EventHandlerId on(const std::string& eventName, EventHandler handler) {
        EventHandlerId id = m_nextId++;
        m_handlers[eventName].push_back({id, std::move(handler)});
        return id;
    }

    /// Unsubscribe a handler by ID. Safe to call from inside a handler.
    bool off(EventHandlerId id) {
        for (auto& [name, handlers] : m_handlers) {
            auto it = std::find_if(handlers.begin(), handlers.end(),
                [id](const Subscription& sub) { return sub.id == id; });
            if (it != handlers.end()) {
                handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    /// Call every handler subscribed to `eventName` when the emit began and
    /// still subscribed when its turn comes. Returns how many ran.
    size_t emit(const std::string& eventName, const EventData& data = {}) {
        auto it = m_handlers.find(eventName);
        if (it == m_handlers.end()) return 0;

        // Snapshot: handlers may subscribe or unsubscribe while we iterate
        std::vector<Subscription> snapshot = it->second;
        size_t called = 0;
        for (const auto& sub : snapshot) {
            if (!isSubscribed(eventName, sub.id)) continue;
            sub.callback(data);
            ++called;
        }
        return called;
    }

    size_t handlerCount(const std::string& eventName) const {
        auto it = m_handlers.find(eventName);
        return it != m_handlers.end() ? it->second.size() : 0;
    }

private:
    struct Subscription {
        EventHandlerId id;
        EventHandler callback;
    };

    bool isSubscribed(const std::string& eventName, EventHandlerId id) const {
        const auto& handlers = m_handlers.at(eventName);
        return std::any_of(handlers.begin(), handlers.end(),
                           [id](const Subscription& sub) { return sub.id == id; });
    }

    std::unordered_map<std::string, std::vector<Subscription>> m_handlers;
    EventHandlerId m_nextId = 1;
};

} // namespace delve
