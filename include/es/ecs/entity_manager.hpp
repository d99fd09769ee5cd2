#pragma once

/// @file entity_manager.hpp
/// @brief Schema-bound entity/component store for the ECS.
///
/// EntityManager<Components...> owns one EntityAllocator and one storage
/// per declared component kind.  The template parameter pack is the
/// schema: it is fixed when the manager type is named and cannot grow
/// at runtime.  Naming a component outside the schema fails to compile.
///
/// Every accessor validates the entity handle first and reports misuse
/// through EcsResult:
///
/// | Failure           | Meaning                                         |
/// |-------------------|-------------------------------------------------|
/// | InvalidEntity     | sentinel handle or index never allocated        |
/// | StaleEntity       | entity was deleted (index may be recycled)      |
/// | MissingComponent  | entity alive but the component is absent        |
/// | DoubleDelete      | DeleteEntity on a handle that is no longer alive|

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include "es/ecs/component_storage.hpp"
#include "es/ecs/entity.hpp"
#include "es/ecs/entity_allocator.hpp"
#include "es/ecs/query.hpp"
#include "es/foundation/ecs_result.hpp"
#include "es/foundation/runtime_config.hpp"

namespace es::ecs {

namespace detail {

/// Position of @p T within @p Ts (sizeof...(Ts) when absent).
template <typename T, typename... Ts>
struct IndexOf;

template <typename T>
struct IndexOf<T> : std::integral_constant<std::size_t, 0> {};

template <typename T, typename... Ts>
struct IndexOf<T, T, Ts...> : std::integral_constant<std::size_t, 0> {};

template <typename T, typename U, typename... Ts>
struct IndexOf<T, U, Ts...>
    : std::integral_constant<std::size_t, 1 + IndexOf<T, Ts...>::value> {};

/// True when no type appears twice in @p Ts.
template <typename... Ts>
struct AllDistinct : std::true_type {};

template <typename T, typename... Ts>
struct AllDistinct<T, Ts...>
    : std::bool_constant<!(std::is_same_v<T, Ts> || ...) && AllDistinct<Ts...>::value> {};

/// Log @p error (with the handle from its context) under the Entity
/// category and hand it back for propagation.
foundation::EcsError ReportEntityError(foundation::EcsError error,
                                       std::string_view operation);

/// Build, log and return a MissingComponent error for @p component.
foundation::EcsError MissingComponentError(Entity entity, std::string_view component,
                                           std::string_view operation);

} // namespace detail

/// Entity store with a fixed component schema.
///
/// @tparam Components  Every component kind usable with this manager.
///                     Each must be default-constructible; its storage
///                     strategy comes from ComponentTraits.
///
/// Single-threaded: no internal locking.  Iteration returns an owned
/// snapshot, so entities collected by Iter() may be mutated or deleted
/// freely afterwards (collect first, then delete).
template <typename... Components>
class EntityManager {
    static_assert(sizeof...(Components) > 0,
                  "EntityManager must declare at least one component type");
    static_assert(detail::AllDistinct<Components...>::value,
                  "Component types in a schema must be distinct");
    static_assert((std::is_default_constructible_v<Components> && ...),
                  "Component types must be default-constructible");
    static_assert(foundation::kMaxInitialCapacity == Entity::kInvalidIndex,
                  "Configured capacity must fit the entity index space");
    static_assert((std::is_base_of_v<ComponentStorage<Components>, StorageFor<Components>> && ...),
                  "Component storage must implement ComponentStorage<T>");

public:
    using QueryType = Query<EntityManager>;

    /// True when @p T is part of this manager's schema.
    template <typename T>
    static constexpr bool kDeclares = (std::is_same_v<T, Components> || ...);

    /// Number of component kinds in the schema.
    static constexpr std::size_t kComponentCount = sizeof...(Components);

    EntityManager() = default;

    /// Construct with capacity reserved from @p config.  The request is
    /// clamped to foundation::kMaxInitialCapacity.
    explicit EntityManager(const foundation::RuntimeConfig& config) {
        Reserve(std::min(config.initialCapacity, foundation::kMaxInitialCapacity));
    }

    // Non-copyable, movable.
    EntityManager(const EntityManager&) = delete;
    EntityManager& operator=(const EntityManager&) = delete;
    EntityManager(EntityManager&&) noexcept = default;
    EntityManager& operator=(EntityManager&&) noexcept = default;

    // ── Entity lifecycle ─────────────────────────────────────────────

    /// Create an entity with no components.
    [[nodiscard]] Entity CreateEntity() { return allocator_.Create(); }

    /// Delete @p entity and drop every component it holds.
    ///
    /// The handle, and every copy of it, is permanently invalidated.
    foundation::EcsResult<void> DeleteEntity(Entity entity) {
        if (allocator_.IsAlive(entity)) {
            std::apply([&](auto&... storages) { (storages.Erase(entity.index), ...); },
                       storages_);
        }
        auto result = allocator_.Destroy(entity);
        if (!result) {
            return foundation::EcsResult<void>::err(
                detail::ReportEntityError(result.error(), "DeleteEntity"));
        }
        return result;
    }

    [[nodiscard]] bool IsAlive(Entity entity) const noexcept {
        return allocator_.IsAlive(entity);
    }

    /// Number of alive entities.
    [[nodiscard]] std::size_t Count() const noexcept { return allocator_.Count(); }

    // ── Component access ─────────────────────────────────────────────

    /// Attach a default-constructed @p T, replacing any previous value.
    template <typename T>
    foundation::EcsResult<T&> AddComponent(Entity entity) {
        return AddComponentWith<T>(entity, [](T&) {});
    }

    /// Attach a default-constructed @p T after applying @p init to it,
    /// replacing any previous value.
    ///
    /// @code
    ///   world.AddComponentWith<Position>(e, [](Position& p) { p.x = 5; });
    /// @endcode
    template <typename T, typename Init>
    foundation::EcsResult<T&> AddComponentWith(Entity entity, Init&& init) {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        if (auto valid = validate(entity, "AddComponent"); !valid) {
            return foundation::EcsResult<T&>::err(valid.error());
        }
        T value{};
        std::invoke(std::forward<Init>(init), value);
        return foundation::EcsResult<T&>::ok(
            storage<T>().Insert(entity.index, std::move(value)));
    }

    /// Read the @p T attached to @p entity.
    template <typename T>
    foundation::EcsResult<const T&> GetComponent(Entity entity) const {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        if (auto valid = validate(entity, "GetComponent"); !valid) {
            return foundation::EcsResult<const T&>::err(valid.error());
        }
        const T* value = storage<T>().Get(entity.index);
        if (value == nullptr) {
            return foundation::EcsResult<const T&>::err(
                detail::MissingComponentError(entity, ComponentName<T>(), "GetComponent"));
        }
        return foundation::EcsResult<const T&>::ok(*value);
    }

    /// Apply @p fn to the @p T attached to @p entity, in place.
    template <typename T, typename Fn>
    foundation::EcsResult<void> UpdateComponentWith(Entity entity, Fn&& fn) {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        if (auto valid = validate(entity, "UpdateComponentWith"); !valid) {
            return valid;
        }
        T* value = storage<T>().GetMut(entity.index);
        if (value == nullptr) {
            return foundation::EcsResult<void>::err(
                detail::MissingComponentError(entity, ComponentName<T>(), "UpdateComponentWith"));
        }
        std::invoke(std::forward<Fn>(fn), *value);
        return foundation::EcsResult<void>::ok();
    }

    /// Detach @p T from @p entity.  Absent components are not an error.
    template <typename T>
    foundation::EcsResult<void> RemoveComponent(Entity entity) {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        if (auto valid = validate(entity, "RemoveComponent"); !valid) {
            return valid;
        }
        storage<T>().Erase(entity.index);
        return foundation::EcsResult<void>::ok();
    }

    /// True when @p entity is alive and has a @p T.
    template <typename T>
    [[nodiscard]] bool HasComponent(Entity entity) const noexcept {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        return allocator_.IsAlive(entity) && storage<T>().Contains(entity.index);
    }

    /// Pointer to the @p T attached to @p entity, or nullptr when the
    /// entity is not alive or has no such component.  Never logs.
    template <typename T>
    [[nodiscard]] const T* FindComponent(Entity entity) const noexcept {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        if (!allocator_.IsAlive(entity)) {
            return nullptr;
        }
        return storage<T>().Get(entity.index);
    }

    // ── Iteration ────────────────────────────────────────────────────

    /// Every alive entity, in ascending index order.
    [[nodiscard]] std::vector<Entity> IterAll() const { return allocator_.AliveEntities(); }

    /// Every alive entity matching @p query, in ascending index order.
    ///
    /// The result is a snapshot taken now.  Calling Iter again
    /// re-evaluates against the current state.
    [[nodiscard]] std::vector<Entity> Iter(const QueryType& query) const {
        std::vector<Entity> matches;
        const auto capacity = static_cast<uint32_t>(allocator_.Capacity());
        for (uint32_t index = 0; index < capacity; ++index) {
            if (!allocator_.IsSlotAlive(index)) {
                continue;
            }
            const Entity entity(index, allocator_.GenerationAt(index));
            if (query.Check(*this, entity)) {
                matches.push_back(entity);
            }
        }
        return matches;
    }

    // ── Capacity ─────────────────────────────────────────────────────

    /// Reserve room for @p capacity entities in the allocator and every
    /// storage.
    void Reserve(std::size_t capacity) {
        allocator_.Reserve(capacity);
        std::apply([&](auto&... storages) { (storages.Reserve(capacity), ...); }, storages_);
    }

    /// Number of @p T values currently stored.
    template <typename T>
    [[nodiscard]] std::size_t ComponentCount() const {
        static_assert(kDeclares<T>, "Component type is not part of this manager's schema");
        return storage<T>().Size();
    }

private:
    template <typename T>
    StorageFor<T>& storage() noexcept {
        return std::get<detail::IndexOf<T, Components...>::value>(storages_);
    }

    template <typename T>
    const StorageFor<T>& storage() const noexcept {
        return std::get<detail::IndexOf<T, Components...>::value>(storages_);
    }

    foundation::EcsResult<void> validate(Entity entity, std::string_view operation) const {
        auto result = allocator_.Validate(entity);
        if (!result) {
            return foundation::EcsResult<void>::err(
                detail::ReportEntityError(result.error(), operation));
        }
        return result;
    }

    EntityAllocator allocator_;
    std::tuple<StorageFor<Components>...> storages_;
};

}  // namespace es::ecs
