#pragma once

#include <entt/entt.hpp>
#include <utility>
#include <type_traits>

namespace delve {

/// Entity handle - EnTT's generational identifier, compared by value.
/// The player keeps the same handle for the whole session.
using Entity = entt::entity;

constexpr Entity NullEntity = entt::null;

/// Component storage for one dungeon level. Thin wrapper over an EnTT
/// registry whose lookups are safe to call with dead or null handles.
class Registry {
public:
    Registry() = default;
    ~Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    Entity create() {
        return m_registry.create();
    }

    /// Create an entity carrying the given components
    template<typename... Components>
    Entity create(Components&&... components) {
        Entity entity = m_registry.create();
        (m_registry.emplace<std::decay_t<Components>>(entity, std::forward<Components>(components)), ...);
        return entity;
    }

    /// Create an entity reusing a specific handle. In a fresh registry the
    /// returned handle equals the hint, which is how an entity keeps its
    /// identity when moved between registries.
    Entity createWithHint(Entity hint) {
        return m_registry.create(hint);
    }

    void destroy(Entity entity) {
        if (valid(entity)) {
            m_registry.destroy(entity);
        }
    }

    bool valid(Entity entity) const {
        return m_registry.valid(entity);
    }

    template<typename Component, typename... Args>
    Component& add(Entity entity, Args&&... args) {
        return m_registry.emplace<Component>(entity, std::forward<Args>(args)...);
    }

    template<typename Component, typename... Args>
    Component& addOrReplace(Entity entity, Args&&... args) {
        return m_registry.emplace_or_replace<Component>(entity, std::forward<Args>(args)...);
    }

    /// Remove a component if present
    template<typename Component>
    void remove(Entity entity) {
        if (has<Component>(entity)) {
            m_registry.remove<Component>(entity);
        }
    }

    /// Component pointer, or nullptr if absent or the entity is not alive
    template<typename Component>
    Component* tryGet(Entity entity) {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    template<typename Component>
    const Component* tryGet(Entity entity) const {
        return valid(entity) ? m_registry.try_get<Component>(entity) : nullptr;
    }

    /// Component reference; the caller guarantees it exists
    template<typename Component>
    Component& get(Entity entity) {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    const Component& get(Entity entity) const {
        return m_registry.get<Component>(entity);
    }

    template<typename Component>
    bool has(Entity entity) const {
        return valid(entity) && m_registry.all_of<Component>(entity);
    }

    template<typename... Components>
    bool hasAll(Entity entity) const {
        return valid(entity) && m_registry.all_of<Components...>(entity);
    }

private:
    entt::registry m_registry;
};

} // namespace delve
