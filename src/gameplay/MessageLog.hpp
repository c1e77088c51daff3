#pragma once

#include "rendering/IRenderer.hpp"
#include "events/EventBus.hpp"

#include <deque>
#include <string>
#include <vector>

namespace delve {

/// Text colors used by the message log
namespace MessageColor {
    constexpr Color Default      = Color::White();
    constexpr Color PlayerAttack = {224, 224, 224, 255};
    constexpr Color EnemyAttack  = {255, 192, 192, 255};
    constexpr Color PlayerDie    = {255, 48, 48, 255};
    constexpr Color EnemyDie     = {255, 160, 48, 255};
    constexpr Color Impossible   = {128, 128, 128, 255};
    constexpr Color Recovered    = {0, 255, 96, 255};
    constexpr Color Descend      = {159, 63, 255, 255};
    constexpr Color LevelUp      = {255, 255, 63, 255};
    constexpr Color Welcome      = {32, 160, 255, 255};
}

struct Message {
    std::string text;
    Color color = MessageColor::Default;
    int count = 1;

    /// Text with an "(xN)" suffix for repeats
    std::string fullText() const {
        return count > 1 ? text + " (x" + std::to_string(count) + ")" : text;
    }
};

/// Bounded list of narrative messages, oldest first. Identical consecutive
/// messages stack into one entry.
class MessageLog {
public:
    static constexpr size_t DefaultCapacity = 100;

    explicit MessageLog(size_t capacity = DefaultCapacity);
    ~MessageLog();

    MessageLog(const MessageLog&) = delete;
    MessageLog& operator=(const MessageLog&) = delete;

    void add(const std::string& text, Color color = MessageColor::Default, bool stack = true);

    /// Format core events into messages as they are emitted
    void subscribe(EventBus& events);
    void unsubscribe();

    const std::deque<Message>& getMessages() const { return m_messages; }
    size_t size() const { return m_messages.size(); }
    size_t capacity() const { return m_capacity; }
    bool empty() const { return m_messages.empty(); }
    void clear() { m_messages.clear(); }

    /// Most recent message text, or empty
    std::string latest() const;

private:
    size_t m_capacity;
    std::deque<Message> m_messages;
    EventBus* m_events = nullptr;
    std::vector<EventHandlerId> m_subscriptions;
};

} // namespace delve
