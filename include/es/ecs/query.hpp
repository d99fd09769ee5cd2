#pragma once

/// @file query.hpp
/// @brief Conjunctive entity filter evaluated by EntityManager::Iter.
///
/// A Query is an ordered list of checks over one entity.  It owns no
/// entity data and can be reused across any number of iterations;
/// predicates are evaluated against the values stored at iteration
/// time, never against values seen when the query was built.

#include <cstddef>
#include <functional>
#include <type_traits>
#include <utility>
#include <vector>

#include "es/ecs/entity.hpp"

namespace es::ecs {

/// Conjunctive filter bound to one EntityManager schema.
///
/// All checks must pass for an entity to match.  Evaluation follows
/// insertion order and stops at the first failing check, so cheap
/// presence checks placed first keep predicate calls to a minimum.
///
/// Usage:
/// @code
///   using World = EntityManager<Position, Velocity, Shape>;
///
///   World::QueryType bullets;
///   bullets.CheckComponentBy<Shape>([](const Shape& s) { return s == Shape::Bullet; })
///          .CheckComponent<Position>();
///
///   for (Entity e : world.Iter(bullets)) { ... }
/// @endcode
template <typename Manager>
class Query {
public:
    /// A single check: true when @p entity passes.
    using Filter = std::function<bool(const Manager&, Entity)>;

    Query() = default;

    /// Entity must have a value for component @p T.
    template <typename T>
    Query& CheckComponent() {
        static_assert(Manager::template kDeclares<T>,
                      "Component type is not part of this manager's schema");
        filters_.push_back([](const Manager& manager, Entity entity) {
            return manager.template HasComponent<T>(entity);
        });
        return *this;
    }

    /// Entity must have a value for @p T for which @p predicate holds.
    ///
    /// @p predicate is called with `const T&` and must not mutate any
    /// manager state.
    template <typename T, typename Pred>
    Query& CheckComponentBy(Pred predicate) {
        static_assert(Manager::template kDeclares<T>,
                      "Component type is not part of this manager's schema");
        static_assert(std::is_invocable_r_v<bool, const Pred&, const T&>,
                      "Predicate must be callable as bool(const T&)");
        filters_.push_back(
            [pred = std::move(predicate)](const Manager& manager, Entity entity) {
                const T* value = manager.template FindComponent<T>(entity);
                return value != nullptr && pred(*value);
            });
        return *this;
    }

    /// Entity must NOT have a value for component @p T.
    template <typename T>
    Query& CheckNotComponent() {
        static_assert(Manager::template kDeclares<T>,
                      "Component type is not part of this manager's schema");
        filters_.push_back([](const Manager& manager, Entity entity) {
            return !manager.template HasComponent<T>(entity);
        });
        return *this;
    }

    /// Entity must satisfy @p predicate, called as
    /// `bool(const Manager&, Entity)`.  Useful for checks spanning
    /// several components.
    template <typename Pred>
    Query& CheckGlobal(Pred predicate) {
        static_assert(std::is_invocable_r_v<bool, const Pred&, const Manager&, Entity>,
                      "Predicate must be callable as bool(const Manager&, Entity)");
        filters_.push_back(Filter(std::move(predicate)));
        return *this;
    }

    /// Evaluate every check against @p entity, short-circuiting on the
    /// first failure.  An empty query matches every entity.
    [[nodiscard]] bool Check(const Manager& manager, Entity entity) const {
        for (const auto& filter : filters_) {
            if (!filter(manager, entity)) {
                return false;
            }
        }
        return true;
    }

    /// Number of checks.
    [[nodiscard]] std::size_t Size() const noexcept { return filters_.size(); }

    [[nodiscard]] bool Empty() const noexcept { return filters_.empty(); }

private:
    std::vector<Filter> filters_;
};

} // namespace es::ecs
