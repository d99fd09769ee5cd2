#pragma once

/// @file entity.hpp
/// @brief Entity handle type for the ECS layer.
///
/// An entity is a lightweight handle made of a slot index and a
/// generation counter.  The generation is bumped every time the slot is
/// freed, so a handle that outlives its entity never matches the slot
/// again, even after the index has been recycled.

#include <compare>
#include <cstdint>
#include <functional>
#include <limits>
#include <string>

namespace es::ecs {

/// Entity handle: 32-bit index + 32-bit generation.
///
/// Handles are plain values.  They are only meaningful relative to the
/// EntityManager that produced them.
struct Entity {
    static constexpr uint32_t kInvalidIndex = std::numeric_limits<uint32_t>::max();
    static constexpr uint32_t kInvalidGeneration = std::numeric_limits<uint32_t>::max();

    uint32_t index = kInvalidIndex;
    uint32_t generation = kInvalidGeneration;

    /// Default-construct to the invalid sentinel.
    constexpr Entity() = default;

    constexpr Entity(uint32_t idx, uint32_t gen) : index(idx), generation(gen) {}

    /// True unless this is the invalid sentinel.
    [[nodiscard]] constexpr bool isValid() const noexcept {
        return index != kInvalidIndex;
    }

    /// Return the canonical invalid entity.
    [[nodiscard]] static constexpr Entity invalid() noexcept { return Entity{}; }

    constexpr auto operator<=>(const Entity&) const = default;
};

/// Render a handle as "<index>v<generation>" for log messages.
inline std::string toString(Entity entity) {
    if (!entity.isValid()) {
        return "invalid";
    }
    return std::to_string(entity.index) + "v" + std::to_string(entity.generation);
}

} // namespace es::ecs

// Hash support for unordered containers.
template <>
struct std::hash<es::ecs::Entity> {
    std::size_t operator()(const es::ecs::Entity& e) const noexcept {
        return std::hash<uint64_t>{}(
            (static_cast<uint64_t>(e.generation) << 32) | e.index);
    }
};
