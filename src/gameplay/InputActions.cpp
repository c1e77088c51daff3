#include "gameplay/InputActions.hpp"
#include "engine/Config.hpp"
#include "engine/Log.hpp"

#include <algorithm>
#include <cctype>

namespace delve {

namespace Actions {

std::string useItem(int number) {
    return "use_item_" + std::to_string(number);
}

std::string chooseStat(int number) {
    return "choose_stat_" + std::to_string(number);
}

} // namespace Actions

// --- Registration ---

void InputActionMap::registerAction(const std::string& name, Key defaultKey, bool shift) {
    InputBinding binding;
    binding.key = defaultKey;
    binding.requireShift = shift;
    m_actions[name] = {binding};
}

void InputActionMap::addBinding(const std::string& name, Key key, bool shift) {
    InputBinding binding;
    binding.key = key;
    binding.requireShift = shift;
    m_actions[name].push_back(binding);
}

void InputActionMap::clearBindings(const std::string& name) {
    auto it = m_actions.find(name);
    if (it != m_actions.end()) {
        it->second.clear();
    }
}

void InputActionMap::rebind(const std::string& name, const InputBinding& binding) {
    m_actions[name] = {binding};
}

// --- Queries ---

bool InputActionMap::isActionPressed(const std::string& name, const Input& input, bool allowRepeat) const {
    auto it = m_actions.find(name);
    if (it == m_actions.end()) return false;
    for (const auto& binding : it->second) {
        if (!checkModifiers(binding, input)) continue;
        if (input.isKeyPressed(binding.key) || (allowRepeat && input.isKeyRepeated(binding.key))) {
            return true;
        }
    }
    return false;
}

const std::vector<InputBinding>& InputActionMap::getBindings(const std::string& name) const {
    static const std::vector<InputBinding> empty;
    auto it = m_actions.find(name);
    if (it == m_actions.end()) return empty;
    return it->second;
}

std::vector<std::string> InputActionMap::getActionNames() const {
    std::vector<std::string> names;
    names.reserve(m_actions.size());
    for (const auto& [name, _] : m_actions) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

// --- Presets ---

void InputActionMap::registerRoguelikeDefaults() {
    registerAction(Actions::MoveUp, Key::Up);
    addBinding(Actions::MoveUp, Key::K);
    registerAction(Actions::MoveDown, Key::Down);
    addBinding(Actions::MoveDown, Key::J);
    registerAction(Actions::MoveLeft, Key::Left);
    addBinding(Actions::MoveLeft, Key::H);
    registerAction(Actions::MoveRight, Key::Right);
    addBinding(Actions::MoveRight, Key::L);

    registerAction(Actions::MoveUpLeft, Key::Y);
    registerAction(Actions::MoveUpRight, Key::U);
    registerAction(Actions::MoveDownLeft, Key::B);
    registerAction(Actions::MoveDownRight, Key::N);

    registerAction(Actions::Wait, Key::Period);
    registerAction(Actions::Descend, Key::Period, true);   // '>'
    addBinding(Actions::Descend, Key::Enter);
    registerAction(Actions::PickUp, Key::G);
    registerAction(Actions::Quit, Key::Escape);

    for (int i = 1; i <= 9; ++i) {
        registerAction(Actions::useItem(i), static_cast<Key>(static_cast<int>(Key::Num0) + i));
    }
    for (int i = 1; i <= 3; ++i) {
        registerAction(Actions::chooseStat(i), static_cast<Key>(static_cast<int>(Key::Num0) + i));
        addBinding(Actions::chooseStat(i), static_cast<Key>(static_cast<int>(Key::A) + i - 1));
    }
}

int InputActionMap::applyConfig(const Config& config) {
    const auto& raw = config.raw();
    auto inputIt = raw.find("input");
    if (inputIt == raw.end() || !inputIt->is_object()) {
        return 0;
    }

    int rebound = 0;
    for (const auto& [action, value] : inputIt->items()) {
        std::vector<std::string> names;
        if (value.is_string()) {
            names.push_back(value.get<std::string>());
        } else if (value.is_array()) {
            for (const auto& entry : value) {
                if (entry.is_string()) names.push_back(entry.get<std::string>());
            }
        }

        std::vector<InputBinding> bindings;
        for (const auto& name : names) {
            if (auto binding = parseBinding(name)) {
                bindings.push_back(*binding);
            } else {
                LOG_WARN("Config: unknown key '{}' for input.{}", name, action);
            }
        }

        if (bindings.empty()) continue;
        m_actions[action] = std::move(bindings);
        ++rebound;
    }

    if (rebound > 0) {
        LOG_INFO("Applied {} input binding override(s)", rebound);
    }
    return rebound;
}

std::optional<InputBinding> InputActionMap::parseBinding(const std::string& text) {
    InputBinding binding;
    std::string rest = text;
    std::transform(rest.begin(), rest.end(), rest.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    size_t plus;
    while ((plus = rest.find('+')) != std::string::npos && plus + 1 < rest.size()) {
        std::string modifier = rest.substr(0, plus);
        if (modifier == "shift") binding.requireShift = true;
        else if (modifier == "ctrl") binding.requireCtrl = true;
        else if (modifier == "alt") binding.requireAlt = true;
        else return std::nullopt;
        rest = rest.substr(plus + 1);
    }

    auto key = parseKey(rest);
    if (!key) return std::nullopt;
    binding.key = *key;
    return binding;
}

std::optional<Key> InputActionMap::parseKey(const std::string& name) {
    if (name.size() == 1) {
        char c = static_cast<char>(std::tolower(static_cast<unsigned char>(name[0])));
        if (c >= 'a' && c <= 'z') return static_cast<Key>(static_cast<int>(Key::A) + (c - 'a'));
        if (c >= '0' && c <= '9') return static_cast<Key>(static_cast<int>(Key::Num0) + (c - '0'));
        switch (c) {
            case '.': return Key::Period;
            case ',': return Key::Comma;
            case '/': return Key::Slash;
            case ';': return Key::Semicolon;
            case '-': return Key::Minus;
            case '=': return Key::Equal;
            default: return std::nullopt;
        }
    }

    static const std::unordered_map<std::string, Key> named = {
        {"up", Key::Up}, {"down", Key::Down}, {"left", Key::Left}, {"right", Key::Right},
        {"space", Key::Space}, {"enter", Key::Enter}, {"escape", Key::Escape},
        {"tab", Key::Tab}, {"backspace", Key::Backspace},
        {"period", Key::Period}, {"comma", Key::Comma}, {"slash", Key::Slash},
        {"home", Key::Home}, {"end", Key::End}, {"pageup", Key::PageUp}, {"pagedown", Key::PageDown},
    };
    auto it = named.find(name);
    if (it != named.end()) return it->second;
    return std::nullopt;
}

// --- Private helpers ---

bool InputActionMap::checkModifiers(const InputBinding& binding, const Input& input) const {
    bool shift = input.isKeyDown(Key::LeftShift) || input.isKeyDown(Key::RightShift);
    bool ctrl = input.isKeyDown(Key::LeftControl) || input.isKeyDown(Key::RightControl);
    bool alt = input.isKeyDown(Key::LeftAlt) || input.isKeyDown(Key::RightAlt);

    // Modifiers must match exactly so '.' and '>' stay distinct
    return binding.requireShift == shift &&
           binding.requireCtrl == ctrl &&
           binding.requireAlt == alt;
}

// --- Translation ---

std::optional<PlayerAction> translateActions(const ActionQuery& isPressed, TurnState state) {
    if (state == TurnState::PlayerDead) {
        return std::nullopt;
    }

    // A key still held from the action that caused the level-up must not pick a stat
    if (state == TurnState::LevelUp) {
        for (int i = 1; i <= 3; ++i) {
            if (isPressed(Actions::chooseStat(i), false)) {
                return PlayerAction::chooseStat(i - 1);
            }
        }
        return std::nullopt;
    }

    struct Direction { const char* action; int dx; int dy; };
    static const Direction directions[] = {
        {Actions::MoveUp, 0, -1},        {Actions::MoveDown, 0, 1},
        {Actions::MoveLeft, -1, 0},      {Actions::MoveRight, 1, 0},
        {Actions::MoveUpLeft, -1, -1},   {Actions::MoveUpRight, 1, -1},
        {Actions::MoveDownLeft, -1, 1},  {Actions::MoveDownRight, 1, 1},
    };
    for (const auto& dir : directions) {
        if (isPressed(dir.action, true)) {
            return PlayerAction::move(dir.dx, dir.dy);
        }
    }

    if (isPressed(Actions::Descend, false)) return PlayerAction::descend();
    if (isPressed(Actions::Wait, true)) return PlayerAction::wait();
    if (isPressed(Actions::PickUp, false)) return PlayerAction::pickUp();

    for (int i = 1; i <= 9; ++i) {
        if (isPressed(Actions::useItem(i), false)) {
            return PlayerAction::useItem(i - 1);
        }
    }
    return std::nullopt;
}

} // namespace delve
