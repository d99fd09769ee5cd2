/// @file entity_allocator.cpp
/// @brief Entity identity and lifecycle implementation.

#include "es/ecs/entity_allocator.hpp"

#include "es/foundation/ecs_logger.hpp"

#include <string>

namespace es::ecs {

using foundation::EcsError;
using foundation::EcsResult;
using foundation::ErrorCode;

// ── Lifecycle ────────────────────────────────────────────────────────

Entity EntityAllocator::Create() {
    uint32_t index = 0;

    if (!freeList_.empty()) {
        // Recycle the oldest destroyed index; its generation was already
        // bumped when it was freed.
        index = freeList_.front();
        freeList_.pop_front();
    } else {
        index = static_cast<uint32_t>(slots_.size());
        slots_.push_back(Slot{});
    }

    slots_[index].alive = true;
    ++count_;
    return Entity(index, slots_[index].generation);
}

EcsResult<void> EntityAllocator::Destroy(Entity entity) {
    if (!entity.isValid() || entity.index >= slots_.size()) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::InvalidEntity,
                     "cannot delete unknown entity " + toString(entity), entity));
    }

    auto& slot = slots_[entity.index];
    if (!slot.alive || slot.generation != entity.generation) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::DoubleDelete,
                     "entity " + toString(entity) + " is already deleted", entity));
    }

    slot.alive = false;
    ++slot.generation;
    freeList_.push_back(entity.index);
    --count_;

    ES_LOG_DEBUG(foundation::LogCategory::Entity, "deleted entity " + toString(entity));
    return EcsResult<void>::ok();
}

void EntityAllocator::Clear() {
    slots_.clear();
    freeList_.clear();
    count_ = 0;
}

// ── Queries ──────────────────────────────────────────────────────────

bool EntityAllocator::IsAlive(Entity entity) const noexcept {
    if (!entity.isValid() || entity.index >= slots_.size()) {
        return false;
    }
    const auto& slot = slots_[entity.index];
    return slot.alive && slot.generation == entity.generation;
}

EcsResult<void> EntityAllocator::Validate(Entity entity) const {
    if (!entity.isValid() || entity.index >= slots_.size()) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::InvalidEntity,
                     "entity " + toString(entity) + " was never allocated", entity));
    }
    if (!IsAlive(entity)) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::StaleEntity,
                     "entity " + toString(entity) + " is stale (slot generation " +
                         std::to_string(slots_[entity.index].generation) + ")",
                     entity));
    }
    return EcsResult<void>::ok();
}

std::vector<Entity> EntityAllocator::AliveEntities() const {
    std::vector<Entity> out;
    out.reserve(count_);
    for (uint32_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i].alive) {
            out.emplace_back(i, slots_[i].generation);
        }
    }
    return out;
}

} // namespace es::ecs
