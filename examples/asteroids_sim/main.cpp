/// @file main.cpp
/// @brief Headless asteroids simulation driven by the entity system.
///
/// A turret ship spins in place and fires bullets at a ring of drifting
/// asteroids.  Movement, firing, collision and cleanup are systems run
/// by a SystemManager; destroyed asteroids are reported through the
/// EventDispatcher.
///
/// Usage: asteroids_sim [--config <path.yaml>]

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "es/es.hpp"

namespace {

using es::ecs::Clock;
using es::ecs::Entity;
using es::ecs::EventDispatcher;
using es::ecs::RefreshPeriod;
using es::ecs::TimePoint;
using es::foundation::LogCategory;

constexpr float kPi = 3.14159265f;

// ── Components ──────────────────────────────────────────────────────────

struct Position {
    float x = 0.0f;
    float y = 0.0f;
    float angle = 0.0f;  ///< Degrees
};

struct Velocity {
    float dx = 0.0f;
    float dy = 0.0f;
    float dangle = 0.0f;
};

enum class Shape { Circle, Square, Triangle, Bullet };

using World = es::ecs::EntityManager<Position, Velocity, Shape>;
using WorldQuery = World::QueryType;

// ── Events ──────────────────────────────────────────────────────────────

struct AsteroidDestroyed {
    Entity asteroid;
    Entity bullet;
};

// ── Settings ────────────────────────────────────────────────────────────

struct SimulationConfig {
    unsigned int ticks = 600;
    unsigned int asteroids = 12;
    unsigned int fireInterval = 4;
    float tickMillis = 20.0f;
    float ringRadius = 120.0f;
    float arenaRadius = 400.0f;
};

SimulationConfig buildSimulationConfig(const es::foundation::ConfigManager& config) {
    SimulationConfig cfg;

    auto ticks = config.get<unsigned int>("simulation.ticks");
    if (ticks) {
        cfg.ticks = ticks.value();
    }

    auto asteroids = config.get<unsigned int>("simulation.asteroids");
    if (asteroids) {
        cfg.asteroids = asteroids.value();
    }

    auto fire = config.get<unsigned int>("simulation.fire_interval");
    if (fire && fire.value() > 0) {
        cfg.fireInterval = fire.value();
    }

    auto tick = config.get<float>("simulation.tick_ms");
    if (tick && tick.value() > 0.0f) {
        cfg.tickMillis = tick.value();
    }

    auto ring = config.get<float>("simulation.ring_radius");
    if (ring) {
        cfg.ringRadius = ring.value();
    }

    auto arena = config.get<float>("simulation.arena_radius");
    if (arena && arena.value() > 0.0f) {
        cfg.arenaRadius = arena.value();
    }

    return cfg;
}

std::string parseConfigArg(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string_view(argv[i]) == "--config") {
            return argv[i + 1];
        }
    }
    return {};
}

float distance(const Position& a, const Position& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

// ── Systems ─────────────────────────────────────────────────────────────

/// Integrates velocity into position.
class MoveSystem : public es::ecs::ISystem {
public:
    MoveSystem(World& world, Clock::duration step) : world_(world), step_(step) {
        moving_.CheckComponent<Velocity>().CheckComponent<Position>();
    }

    [[nodiscard]] std::string_view GetName() const override { return "move"; }

    RefreshPeriod Run(TimePoint now) override {
        for (Entity entity : world_.Iter(moving_)) {
            const Velocity* velocity = world_.FindComponent<Velocity>(entity);
            if (velocity == nullptr) {
                continue;
            }
            const Velocity v = *velocity;
            auto moved = world_.UpdateComponentWith<Position>(entity, [&v](Position& p) {
                p.x += v.dx;
                p.y += v.dy;
                p.angle += v.dangle;
            });
            if (!moved) {
                ES_LOG_WARN(LogCategory::System, std::string(moved.error().message()));
            }
        }
        return RefreshPeriod::At(now + step_);
    }

private:
    World& world_;
    Clock::duration step_;
    WorldQuery moving_;
};

/// Fires a bullet along the ship's heading every few runs.
class TurretSystem : public es::ecs::ISystem {
public:
    TurretSystem(World& world, Entity ship, unsigned int interval)
        : world_(world), ship_(ship), interval_(interval) {}

    [[nodiscard]] std::string_view GetName() const override { return "turret"; }

    RefreshPeriod Run(TimePoint) override {
        if (++runs_ % interval_ != 0) {
            return RefreshPeriod::EveryTime();
        }

        auto ship = world_.GetComponent<Position>(ship_);
        if (!ship) {
            return RefreshPeriod::Stop();
        }
        const Position origin = ship.value();
        const float rad = origin.angle * kPi / 180.0f;
        const float dirX = std::cos(rad);
        const float dirY = std::sin(rad);

        Entity bullet = world_.CreateEntity();
        static_cast<void>(world_.AddComponentWith<Position>(bullet, [&](Position& p) {
            p.x = origin.x + dirX * 10.0f;
            p.y = origin.y + dirY * 10.0f;
        }));
        static_cast<void>(world_.AddComponentWith<Velocity>(bullet, [&](Velocity& v) {
            v.dx = dirX * 6.0f;
            v.dy = dirY * 6.0f;
        }));
        static_cast<void>(world_.AddComponentWith<Shape>(bullet, [](Shape& s) { s = Shape::Bullet; }));
        ++fired_;
        return RefreshPeriod::EveryTime();
    }

    [[nodiscard]] unsigned int Fired() const noexcept { return fired_; }

private:
    World& world_;
    Entity ship_;
    unsigned int interval_;
    unsigned int runs_ = 0;
    unsigned int fired_ = 0;
};

/// Detects bullet/asteroid contact, deletes both and publishes an event.
class HitSystem : public es::ecs::ISystem {
public:
    HitSystem(World& world, EventDispatcher& events) : world_(world), events_(events) {
        bullets_.CheckComponentBy<Shape>([](const Shape& s) { return s == Shape::Bullet; })
            .CheckComponent<Position>();
        targets_.CheckComponentBy<Shape>([](const Shape& s) {
                    return s == Shape::Square || s == Shape::Circle;
                })
            .CheckComponent<Position>();
    }

    [[nodiscard]] std::string_view GetName() const override { return "hit"; }

    RefreshPeriod Run(TimePoint) override {
        std::vector<AsteroidDestroyed> hits;
        std::unordered_set<Entity> claimed;

        const auto targets = world_.Iter(targets_);
        for (Entity bullet : world_.Iter(bullets_)) {
            const Position* bulletPos = world_.FindComponent<Position>(bullet);
            for (Entity target : targets) {
                if (claimed.count(target) != 0) {
                    continue;
                }
                const Position* targetPos = world_.FindComponent<Position>(target);
                if (bulletPos != nullptr && targetPos != nullptr &&
                    distance(*bulletPos, *targetPos) < 10.0f) {
                    claimed.insert(target);
                    hits.push_back({target, bullet});
                    break;
                }
            }
        }

        // Collect first, then delete.
        for (const auto& hit : hits) {
            for (Entity entity : {hit.asteroid, hit.bullet}) {
                if (!world_.IsAlive(entity)) {
                    continue;
                }
                auto deleted = world_.DeleteEntity(entity);
                if (!deleted) {
                    ES_LOG_WARN(LogCategory::System, std::string(deleted.error().message()));
                }
            }
            events_.Push(hit);
        }
        return RefreshPeriod::EveryTime();
    }

private:
    World& world_;
    EventDispatcher& events_;
    WorldQuery bullets_;
    WorldQuery targets_;
};

/// Removes bullets that left the arena.
class CleanupSystem : public es::ecs::ISystem {
public:
    CleanupSystem(World& world, float arenaRadius) : world_(world) {
        strays_.CheckComponentBy<Shape>([](const Shape& s) { return s == Shape::Bullet; })
            .CheckGlobal([arenaRadius](const World& w, Entity e) {
                const Position* p = w.FindComponent<Position>(e);
                return p != nullptr && std::hypot(p->x, p->y) > arenaRadius;
            });
    }

    [[nodiscard]] std::string_view GetName() const override { return "cleanup"; }

    RefreshPeriod Run(TimePoint) override {
        for (Entity entity : world_.Iter(strays_)) {
            auto deleted = world_.DeleteEntity(entity);
            if (!deleted) {
                ES_LOG_WARN(LogCategory::System, std::string(deleted.error().message()));
            }
        }
        return RefreshPeriod::EveryTime();
    }

private:
    World& world_;
    WorldQuery strays_;
};

// ── Setup ───────────────────────────────────────────────────────────────

// Components added below go to entities created on the line before;
// those handles are alive, so the results carry no error.

Entity spawnShip(World& world) {
    Entity ship = world.CreateEntity();
    static_cast<void>(world.AddComponent<Position>(ship));
    static_cast<void>(world.AddComponentWith<Velocity>(ship, [](Velocity& v) { v.dangle = 7.0f; }));
    static_cast<void>(world.AddComponentWith<Shape>(ship, [](Shape& s) { s = Shape::Triangle; }));
    return ship;
}

void spawnAsteroids(World& world, const SimulationConfig& cfg) {
    for (unsigned int i = 0; i < cfg.asteroids; ++i) {
        const float rad = 2.0f * kPi * static_cast<float>(i) / static_cast<float>(cfg.asteroids);
        Entity rock = world.CreateEntity();
        static_cast<void>(world.AddComponentWith<Position>(rock, [&](Position& p) {
            p.x = std::cos(rad) * cfg.ringRadius;
            p.y = std::sin(rad) * cfg.ringRadius;
        }));
        static_cast<void>(world.AddComponentWith<Velocity>(rock, [&](Velocity& v) {
            v.dx = -std::sin(rad) * 0.3f;
            v.dy = std::cos(rad) * 0.3f;
            v.dangle = 2.0f;
        }));
        static_cast<void>(world.AddComponentWith<Shape>(rock, [i](Shape& s) {
            s = (i % 2 == 0) ? Shape::Circle : Shape::Square;
        }));
    }
}

} // namespace

int main(int argc, char* argv[]) {
    es::foundation::ConfigManager config;
    auto configPath = parseConfigArg(argc, argv);
    if (!configPath.empty()) {
        auto loadResult = config.load(configPath);
        if (!loadResult) {
            std::cerr << "Failed to load config: " << loadResult.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    auto runtime = es::foundation::loadRuntimeConfig(config);
    if (!runtime) {
        std::cerr << "Invalid config: " << runtime.error().message() << "\n";
        return EXIT_FAILURE;
    }
    es::foundation::applyLogLevels(runtime.value(), es::foundation::EcsLogger::instance());

    const auto simCfg = buildSimulationConfig(config);
    std::cout << "Arena radius " << simCfg.arenaRadius << ", ring radius "
              << simCfg.ringRadius << ", " << simCfg.asteroids << " asteroids\n";
    const auto step = std::chrono::duration_cast<Clock::duration>(
        std::chrono::duration<float, std::milli>(simCfg.tickMillis));

    World world(runtime.value());
    EventDispatcher events;

    Entity ship = spawnShip(world);
    spawnAsteroids(world, simCfg);

    unsigned int destroyed = 0;
    auto scoreboard = events.CreateConnection<AsteroidDestroyed>(
        [&destroyed](const AsteroidDestroyed& e) {
            ++destroyed;
            ES_LOG_INFO(LogCategory::Event, "asteroid " + es::ecs::toString(e.asteroid) +
                                                " destroyed by " + es::ecs::toString(e.bullet));
        });
    scoreboard.Connect();

    auto turret = std::make_shared<TurretSystem>(world, ship, simCfg.fireInterval);
    es::ecs::SystemManager systems;
    for (std::shared_ptr<es::ecs::ISystem> system :
         {std::shared_ptr<es::ecs::ISystem>(turret),
          std::shared_ptr<es::ecs::ISystem>(std::make_shared<MoveSystem>(world, step)),
          std::shared_ptr<es::ecs::ISystem>(std::make_shared<HitSystem>(world, events)),
          std::shared_ptr<es::ecs::ISystem>(
              std::make_shared<CleanupSystem>(world, simCfg.arenaRadius))}) {
        auto added = systems.AddSystem(system);
        if (!added) {
            std::cerr << "Failed to register system: " << added.error().message() << "\n";
            return EXIT_FAILURE;
        }
    }

    // Simulated clock: one fixed step per tick, independent of wall time.
    TimePoint now = Clock::now();
    unsigned int tick = 0;
    for (; tick < simCfg.ticks && destroyed < simCfg.asteroids; ++tick) {
        if (systems.Update(events, now) == RefreshPeriod::Stop()) {
            break;
        }
        now += step;
    }

    std::cout << "Simulated " << tick << " ticks: " << turret->Fired() << " shots, "
              << destroyed << "/" << simCfg.asteroids << " asteroids destroyed, "
              << world.Count() << " entities alive\n";

    auto flushed = es::foundation::EcsLogger::instance().flush();
    if (!flushed) {
        std::cerr << "Failed to flush log: " << flushed.error().message() << "\n";
    }
    return EXIT_SUCCESS;
}
