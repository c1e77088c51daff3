#pragma once

#include <string>
#include <vector>
#include <optional>

namespace delve {

/// Consumables carried by the player, one item definition id per slot.
/// Owned by the session rather than the player entity so that it is
/// untouched when a new level replaces the entity store.
struct Inventory {
    static constexpr int MaxSlots = 26;

    std::vector<std::string> items;

    bool isFull() const { return static_cast<int>(items.size()) >= MaxSlots; }
    bool isEmpty() const { return items.empty(); }
    int size() const { return static_cast<int>(items.size()); }

    /// Add an item to the end. Returns false when full or `itemId` is empty.
    bool add(const std::string& itemId) {
        if (itemId.empty() || isFull()) return false;
        items.push_back(itemId);
        return true;
    }

    /// Item id in a slot, or nullptr if the slot is empty
    const std::string* at(int slot) const {
        if (slot < 0 || slot >= size()) return nullptr;
        return &items[static_cast<size_t>(slot)];
    }

    /// Remove and return the item in a slot
    std::optional<std::string> take(int slot) {
        if (slot < 0 || slot >= size()) return std::nullopt;
        std::string id = items[static_cast<size_t>(slot)];
        items.erase(items.begin() + slot);
        return id;
    }

    int countOf(const std::string& itemId) const {
        int n = 0;
        for (const auto& id : items) {
            if (id == itemId) ++n;
        }
        return n;
    }
};

} // namespace delve
