#pragma once

/// @file es.hpp
/// @brief Convenience header pulling in the whole entity system.

#include "es/version.hpp"

#include "es/core/result.hpp"

#include "es/foundation/config_manager.hpp"
#include "es/foundation/ecs_error.hpp"
#include "es/foundation/ecs_logger.hpp"
#include "es/foundation/ecs_result.hpp"
#include "es/foundation/error_code.hpp"
#include "es/foundation/runtime_config.hpp"

#include "es/ecs/component_storage.hpp"
#include "es/ecs/entity.hpp"
#include "es/ecs/entity_allocator.hpp"
#include "es/ecs/entity_manager.hpp"
#include "es/ecs/event_dispatcher.hpp"
#include "es/ecs/query.hpp"
#include "es/ecs/system_manager.hpp"
