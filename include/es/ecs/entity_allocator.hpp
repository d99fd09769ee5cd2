#pragma once

/// @file entity_allocator.hpp
/// @brief Entity identity and lifecycle: creation, deletion, recycling.

#include "es/ecs/entity.hpp"
#include "es/foundation/ecs_result.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <vector>

namespace es::ecs {

/// Owns entity identity.
///
/// Each allocated index has a slot holding its current generation and
/// an alive flag.  Deleting an entity marks the slot dead, bumps the
/// generation and queues the index for reuse; the next Create() takes
/// the oldest freed index (FIFO) before growing the slot table.
class EntityAllocator {
public:
    EntityAllocator() = default;

    // Non-copyable, movable.
    EntityAllocator(const EntityAllocator&) = delete;
    EntityAllocator& operator=(const EntityAllocator&) = delete;
    EntityAllocator(EntityAllocator&&) noexcept = default;
    EntityAllocator& operator=(EntityAllocator&&) noexcept = default;

    /// Allocate an entity, recycling a freed index when one exists.
    /// Fresh indices start at generation 0.
    [[nodiscard]] Entity Create();

    /// Delete @p entity.
    ///
    /// @return InvalidEntity if the index was never allocated,
    ///         DoubleDelete if the handle is not alive (already deleted,
    ///         or its slot has since been recycled).
    foundation::EcsResult<void> Destroy(Entity entity);

    /// True when the slot exists, is alive, and has the handle's generation.
    [[nodiscard]] bool IsAlive(Entity entity) const noexcept;

    /// Classify @p entity: ok when alive, InvalidEntity for the sentinel or
    /// an unknown index, StaleEntity otherwise.
    [[nodiscard]] foundation::EcsResult<void> Validate(Entity entity) const;

    /// All alive entities in ascending index order.
    [[nodiscard]] std::vector<Entity> AliveEntities() const;

    /// Number of alive entities.
    [[nodiscard]] std::size_t Count() const noexcept { return count_; }

    /// Number of indices ever allocated (alive or on the free list).
    [[nodiscard]] std::size_t Capacity() const noexcept { return slots_.size(); }

    /// Number of indices waiting to be recycled.
    [[nodiscard]] std::size_t FreeCount() const noexcept { return freeList_.size(); }

    /// Reserve room for @p capacity slots.
    void Reserve(std::size_t capacity) { slots_.reserve(capacity); }

    /// Forget every slot, alive or free.  Indices restart at 0 with
    /// generation 0, so handles issued before the call must not be reused.
    void Clear();

    /// Slot accessors for callers that walk indices directly.
    [[nodiscard]] bool IsSlotAlive(uint32_t index) const noexcept {
        return index < slots_.size() && slots_[index].alive;
    }
    [[nodiscard]] uint32_t GenerationAt(uint32_t index) const noexcept {
        return index < slots_.size() ? slots_[index].generation : Entity::kInvalidGeneration;
    }

private:
    struct Slot {
        uint32_t generation = 0;
        bool alive = false;
    };

    std::vector<Slot> slots_;
    std::deque<uint32_t> freeList_;
    std::size_t count_ = 0;
};

} // namespace es::ecs
