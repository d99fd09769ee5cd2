#pragma once

/// @file system_manager.hpp
/// @brief Sequential system runner with per-system refresh periods.
///
/// SystemManager executes registered systems in registration order.
/// Each system reports, from Run(), when it next wants to run.  After
/// every run the shared EventDispatcher is drained so that events raised
/// by one system are visible to handlers before the next system starts.

#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "es/ecs/event_dispatcher.hpp"
#include "es/foundation/ecs_result.hpp"

namespace es::ecs {

/// Clock driving system refresh decisions.
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;

// ── Refresh period ──────────────────────────────────────────────────────

/// When a system wants to run next.
///
/// Ordered `Stop < At(t) < EveryTime`; two At periods compare by time.
class RefreshPeriod {
public:
    enum class Kind : uint8_t {
        Stop,      ///< Never run again (until re-armed with SetRefresh)
        At,        ///< Run once the clock reaches time()
        EveryTime  ///< Run on every Update
    };

    constexpr RefreshPeriod() = default;

    [[nodiscard]] static constexpr RefreshPeriod EveryTime() noexcept {
        return RefreshPeriod(Kind::EveryTime, TimePoint{});
    }

    [[nodiscard]] static constexpr RefreshPeriod At(TimePoint when) noexcept {
        return RefreshPeriod(Kind::At, when);
    }

    [[nodiscard]] static constexpr RefreshPeriod Stop() noexcept {
        return RefreshPeriod(Kind::Stop, TimePoint{});
    }

    [[nodiscard]] constexpr Kind kind() const noexcept { return kind_; }

    /// Scheduled time.  Only meaningful for Kind::At.
    [[nodiscard]] constexpr TimePoint time() const noexcept { return time_; }

    /// True when a system with this period should run at @p now.
    [[nodiscard]] constexpr bool IsDue(TimePoint now) const noexcept {
        return kind_ == Kind::EveryTime || (kind_ == Kind::At && time_ <= now);
    }

    friend constexpr bool operator==(const RefreshPeriod& a, const RefreshPeriod& b) noexcept {
        return a.kind_ == b.kind_ && (a.kind_ != Kind::At || a.time_ == b.time_);
    }

    friend constexpr std::strong_ordering operator<=>(const RefreshPeriod& a,
                                                      const RefreshPeriod& b) noexcept {
        if (a.kind_ != b.kind_) {
            return static_cast<uint8_t>(a.kind_) <=> static_cast<uint8_t>(b.kind_);
        }
        if (a.kind_ != Kind::At || a.time_ == b.time_) {
            return std::strong_ordering::equal;
        }
        return a.time_ < b.time_ ? std::strong_ordering::less : std::strong_ordering::greater;
    }

private:
    constexpr RefreshPeriod(Kind kind, TimePoint when) : kind_(kind), time_(when) {}

    Kind kind_ = Kind::EveryTime;
    TimePoint time_{};
};

/// Return the period that needs attention first: EveryTime beats any
/// At, an earlier At beats a later one, and anything beats Stop.
[[nodiscard]] RefreshPeriod MostUrgent(const RefreshPeriod& a, const RefreshPeriod& b) noexcept;

/// Return a printable name ("EveryTime", "At", "Stop").
[[nodiscard]] std::string_view refreshKindName(RefreshPeriod::Kind kind) noexcept;

// ── System interface ────────────────────────────────────────────────────

/// Abstract base class for systems run by SystemManager.
///
/// Concrete systems usually hold a reference to the EntityManager they
/// operate on and to the EventDispatcher they publish into.
class ISystem {
public:
    virtual ~ISystem() = default;

    /// Unique, constant name used to address the system.
    [[nodiscard]] virtual std::string_view GetName() const = 0;

    /// Execute this system's logic.
    ///
    /// @param now  Time of the current Update.
    /// @return     When the system wants to run next.
    virtual RefreshPeriod Run(TimePoint now) = 0;
};

// ── System manager ──────────────────────────────────────────────────────

/// Owns registered systems and runs the due ones on each Update.
///
/// Usage:
/// @code
///   SystemManager systems;
///   systems.AddSystem(std::make_shared<MoveSystem>(world));
///   systems.AddSystem(std::make_shared<HitSystem>(world, events));
///
///   EventDispatcher events;
///   while (systems.Update(events) != RefreshPeriod::Stop()) {}
/// @endcode
class SystemManager {
public:
    SystemManager() = default;

    // Non-copyable, movable.
    SystemManager(const SystemManager&) = delete;
    SystemManager& operator=(const SystemManager&) = delete;
    SystemManager(SystemManager&&) noexcept = default;
    SystemManager& operator=(SystemManager&&) noexcept = default;

    /// Register @p system.  It starts with RefreshPeriod::EveryTime and
    /// runs after every previously registered system.
    ///
    /// @return AlreadyExists if a system with the same name is registered,
    ///         InvalidArgument for a null pointer.
    foundation::EcsResult<void> AddSystem(std::shared_ptr<ISystem> system);

    /// Override the refresh period of the system named @p name.
    foundation::EcsResult<void> SetRefresh(std::string_view name, RefreshPeriod period);

    /// Current refresh period of the system named @p name.
    [[nodiscard]] foundation::EcsResult<RefreshPeriod> GetRefresh(std::string_view name) const;

    /// Run every due system, draining @p events after each run.
    ///
    /// @return The most urgent period left after this pass (see
    ///         MostUrgent); Stop when nothing will ever run again.
    RefreshPeriod Update(EventDispatcher& events, TimePoint now);

    /// Update at Clock::now().
    RefreshPeriod Update(EventDispatcher& events);

    [[nodiscard]] std::size_t SystemCount() const noexcept { return entries_.size(); }

private:
    struct SystemEntry {
        std::shared_ptr<ISystem> system;
        RefreshPeriod refresh = RefreshPeriod::EveryTime();
    };

    /// Registration-ordered systems.
    std::vector<SystemEntry> entries_;

    /// System name -> position in entries_.
    std::unordered_map<std::string, std::size_t> names_;
};

} // namespace es::ecs
