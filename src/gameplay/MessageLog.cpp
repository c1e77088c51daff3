#include "gameplay/MessageLog.hpp"

#include <spdlog/fmt/fmt.h>

namespace delve {

namespace {

std::string capitalized(std::string text) {
    if (!text.empty() && text[0] >= 'a' && text[0] <= 'z') {
        text[0] = static_cast<char>(text[0] - 'a' + 'A');
    }
    return text;
}

Color toneColor(const std::string& tone) {
    if (tone == "impossible") return MessageColor::Impossible;
    if (tone == "recovered")  return MessageColor::Recovered;
    if (tone == "welcome")    return MessageColor::Welcome;
    if (tone == "danger")     return MessageColor::PlayerDie;
    return MessageColor::Default;
}

} // anonymous namespace

MessageLog::MessageLog(size_t capacity)
    : m_capacity(capacity > 0 ? capacity : 1) {}

MessageLog::~MessageLog() {
    unsubscribe();
}

void MessageLog::add(const std::string& text, Color color, bool stack) {
    if (stack && !m_messages.empty() && m_messages.back().text == text) {
        m_messages.back().count++;
        return;
    }

    m_messages.push_back({text, color, 1});
    while (m_messages.size() > m_capacity) {
        m_messages.pop_front();
    }
}

std::string MessageLog::latest() const {
    return m_messages.empty() ? std::string() : m_messages.back().fullText();
}

void MessageLog::subscribe(EventBus& events) {
    unsubscribe();
    m_events = &events;

    m_subscriptions.push_back(events.on(Events::Rest, [this](const EventData& data) {
        add(fmt::format("You take a moment to rest, and recover {} health.",
                        data.getInt("healed")), MessageColor::Recovered);
    }));

    m_subscriptions.push_back(events.on(Events::Descend, [this](const EventData& data) {
        add(fmt::format("After a rare moment of peace, you descend to depth {}.",
                        data.getInt("depth")), MessageColor::Descend);
    }));

    m_subscriptions.push_back(events.on(Events::LevelUp, [this](const EventData& data) {
        add(fmt::format("Your battle skills grow stronger! You reach level {}!",
                        data.getInt("level")), MessageColor::LevelUp);
    }));

    m_subscriptions.push_back(events.on(Events::Attack, [this](const EventData& data) {
        bool byPlayer = data.getBool("player_attacker");
        Color color = byPlayer ? MessageColor::PlayerAttack : MessageColor::EnemyAttack;
        int damage = data.getInt("damage");
        std::string who = capitalized(data.getString("attacker"));
        if (damage > 0) {
            add(fmt::format("{} attacks {} for {} hit points.", who, data.getString("target"), damage), color);
        } else {
            add(fmt::format("{} attacks {} but does no damage.", who, data.getString("target")), color);
        }
    }));

    m_subscriptions.push_back(events.on(Events::Kill, [this](const EventData& data) {
        if (data.getBool("player_kill")) {
            add(fmt::format("{} is dead! You gain {} experience points.",
                            capitalized(data.getString("victim")), data.getInt("xp")),
                MessageColor::EnemyDie);
        } else {
            add(fmt::format("{} is dead!", capitalized(data.getString("victim"))),
                MessageColor::EnemyDie);
        }
    }));

    m_subscriptions.push_back(events.on(Events::PlayerDied, [this](const EventData&) {
        add("You died!", MessageColor::PlayerDie);
    }));

    m_subscriptions.push_back(events.on(Events::Notice, [this](const EventData& data) {
        add(data.getString("text"), toneColor(data.getString("tone")));
    }));
}

void MessageLog::unsubscribe() {
    if (m_events) {
        for (EventHandlerId id : m_subscriptions) {
            m_events->off(id);
        }
    }
    m_subscriptions.clear();
    m_events = nullptr;
}

} // namespace delve
