/// @file entity_manager.cpp
/// @brief Non-template error reporting shared by every EntityManager schema.

#include "es/ecs/entity_manager.hpp"

#include "es/foundation/ecs_logger.hpp"

#include <string>

namespace es::ecs::detail {

using foundation::EcsError;
using foundation::EcsLogger;
using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;

EcsError ReportEntityError(EcsError error, std::string_view operation) {
    auto& logger = EcsLogger::instance();
    if (logger.isEnabled(LogLevel::Warning, LogCategory::Entity)) {
        LogContext ctx;
        if (const auto* entity = error.context<Entity>()) {
            ctx.entity = toString(*entity);
        }
        ctx.extra["operation"] = std::string(operation);
        ctx.extra["code"] = std::string(foundation::errorCodeName(error.code()));
        logger.logWithContext(LogLevel::Warning, LogCategory::Entity,
                              error.message(), ctx);
    }
    return error;
}

EcsError MissingComponentError(Entity entity, std::string_view component,
                               std::string_view operation) {
    EcsError error(ErrorCode::MissingComponent,
                   "entity " + toString(entity) + " has no " + std::string(component) +
                       " component",
                   entity);

    auto& logger = EcsLogger::instance();
    if (logger.isEnabled(LogLevel::Warning, LogCategory::Storage)) {
        LogContext ctx;
        ctx.entity = toString(entity);
        ctx.component = std::string(component);
        ctx.extra["operation"] = std::string(operation);
        logger.logWithContext(LogLevel::Warning, LogCategory::Storage,
                              error.message(), ctx);
    }
    return error;
}

} // namespace es::ecs::detail
