#pragma once

/// @file ecs_result.hpp
/// @brief EcsResult<T> type alias for entity-system error handling.

#include "es/core/result.hpp"
#include "es/foundation/ecs_error.hpp"

namespace es::foundation {

/// Result type specialized with EcsError.
///
/// Every manager, allocator and config operation that can fail returns
/// EcsResult<T> instead of throwing exceptions.
///
/// Example:
/// @code
///   EcsResult<const Position&> pos = world.GetComponent<Position>(e);
///   if (!pos) {
///       if (pos.error().isStaleEntity()) { ... }
///   }
/// @endcode
template <typename T>
using EcsResult = es::Result<T, EcsError>;

}  // namespace es::foundation
