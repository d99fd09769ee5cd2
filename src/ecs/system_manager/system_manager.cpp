/// @file system_manager.cpp
/// @brief Sequential system execution with refresh periods.

#include "es/ecs/system_manager.hpp"

#include "es/foundation/ecs_logger.hpp"

#include <utility>

namespace es::ecs {

using foundation::EcsError;
using foundation::EcsResult;
using foundation::ErrorCode;
using foundation::LogCategory;

// ── RefreshPeriod helpers ───────────────────────────────────────────────

RefreshPeriod MostUrgent(const RefreshPeriod& a, const RefreshPeriod& b) noexcept {
    if (a.kind() != b.kind()) {
        return a > b ? a : b;
    }
    if (a.kind() == RefreshPeriod::Kind::At) {
        return a.time() <= b.time() ? a : b;
    }
    return a;
}

std::string_view refreshKindName(RefreshPeriod::Kind kind) noexcept {
    switch (kind) {
        case RefreshPeriod::Kind::Stop:      return "Stop";
        case RefreshPeriod::Kind::At:        return "At";
        case RefreshPeriod::Kind::EveryTime: return "EveryTime";
    }
    return "Unknown";
}

// ── Registration ────────────────────────────────────────────────────────

EcsResult<void> SystemManager::AddSystem(std::shared_ptr<ISystem> system) {
    if (!system) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::InvalidArgument, "cannot register a null system"));
    }

    std::string name(system->GetName());
    if (names_.count(name) != 0) {
        ES_LOG_WARN(LogCategory::System, "system '" + name + "' is already registered");
        return EcsResult<void>::err(
            EcsError(ErrorCode::AlreadyExists, "system '" + name + "' is already registered"));
    }

    names_.emplace(name, entries_.size());
    entries_.push_back(SystemEntry{std::move(system), RefreshPeriod::EveryTime()});
    ES_LOG_DEBUG(LogCategory::System, "registered system '" + name + "'");
    return EcsResult<void>::ok();
}

EcsResult<void> SystemManager::SetRefresh(std::string_view name, RefreshPeriod period) {
    auto it = names_.find(std::string(name));
    if (it == names_.end()) {
        return EcsResult<void>::err(
            EcsError(ErrorCode::NotFound, "no system named '" + std::string(name) + "'"));
    }
    entries_[it->second].refresh = period;
    return EcsResult<void>::ok();
}

EcsResult<RefreshPeriod> SystemManager::GetRefresh(std::string_view name) const {
    auto it = names_.find(std::string(name));
    if (it == names_.end()) {
        return EcsResult<RefreshPeriod>::err(
            EcsError(ErrorCode::NotFound, "no system named '" + std::string(name) + "'"));
    }
    return EcsResult<RefreshPeriod>::ok(entries_[it->second].refresh);
}

// ── Execution ───────────────────────────────────────────────────────────

RefreshPeriod SystemManager::Update(EventDispatcher& events, TimePoint now) {
    auto next = RefreshPeriod::Stop();

    // Index loop: a system may register further systems from Run().
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].refresh.IsDue(now)) {
            auto system = entries_[i].system;
            ES_LOG(foundation::LogLevel::Trace, LogCategory::System,
                   "running system '" + std::string(system->GetName()) + "'");

            const auto requested = system->Run(now);
            if (requested != entries_[i].refresh) {
                ES_LOG_DEBUG(LogCategory::System,
                             "system '" + std::string(system->GetName()) +
                                 "' refresh -> " + std::string(refreshKindName(requested.kind())));
            }
            entries_[i].refresh = requested;
            events.Dispatch();
        }
        next = MostUrgent(next, entries_[i].refresh);
    }
    return next;
}

RefreshPeriod SystemManager::Update(EventDispatcher& events) {
    return Update(events, Clock::now());
}

} // namespace es::ecs
