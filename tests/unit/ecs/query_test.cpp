#include <gtest/gtest.h>

#include <vector>

#include "es/ecs/entity_manager.hpp"

using namespace es::ecs;

// ── Test component types ────────────────────────────────────────────────────

struct Position {
    float x = 0.0f;
    float y = 0.0f;
};

struct Velocity {
    float dx = 0.0f;
    float dy = 0.0f;
};

enum class Shape { Circle, Square, Triangle, Bullet };

struct Frozen {
    using Storage = SparseStorage<Frozen>;
};

using World = EntityManager<Position, Velocity, Shape, Frozen>;
using WorldQuery = World::QueryType;

// ===========================================================================
// Query construction
// ===========================================================================

TEST(QueryTest, EmptyQueryMatchesEveryAliveEntity) {
    World world;
    Entity a = world.CreateEntity();
    Entity b = world.CreateEntity();
    Entity c = world.CreateEntity();
    ASSERT_TRUE(world.DeleteEntity(b));

    WorldQuery all;
    EXPECT_TRUE(all.Empty());
    auto result = world.Iter(all);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], a);
    EXPECT_EQ(result[1], c);
}

TEST(QueryTest, ChecksAreCounted) {
    WorldQuery query;
    query.CheckComponent<Position>()
        .CheckNotComponent<Frozen>()
        .CheckGlobal([](const World&, Entity) { return true; });
    EXPECT_EQ(query.Size(), 3u);
    EXPECT_FALSE(query.Empty());
}

// ===========================================================================
// Presence and absence checks
// ===========================================================================

TEST(QueryTest, CheckComponentMatchesExactlyHolders) {
    World world;
    std::vector<Entity> withVel;
    for (int i = 0; i < 8; ++i) {
        Entity e = world.CreateEntity();
        ASSERT_TRUE(world.AddComponent<Position>(e));
        if (i % 3 == 0) {
            ASSERT_TRUE(world.AddComponent<Velocity>(e));
            withVel.push_back(e);
        }
    }

    WorldQuery moving;
    moving.CheckComponent<Position>().CheckComponent<Velocity>();
    EXPECT_EQ(world.Iter(moving), withVel);
}

TEST(QueryTest, CheckNotComponentExcludesHolders) {
    World world;
    Entity active = world.CreateEntity();
    Entity frozen = world.CreateEntity();
    ASSERT_TRUE(world.AddComponent<Velocity>(active));
    ASSERT_TRUE(world.AddComponent<Velocity>(frozen));
    ASSERT_TRUE(world.AddComponent<Frozen>(frozen));

    WorldQuery movable;
    movable.CheckComponent<Velocity>().CheckNotComponent<Frozen>();

    auto result = world.Iter(movable);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], active);

    ASSERT_TRUE(world.RemoveComponent<Frozen>(frozen));
    EXPECT_EQ(world.Iter(movable).size(), 2u);
}

// ===========================================================================
// Predicate checks
// ===========================================================================

TEST(QueryTest, CheckComponentByMatchesOnlyPredicateHolders) {
    World world;
    Entity rock = world.CreateEntity();
    Entity bullet1 = world.CreateEntity();
    Entity plain = world.CreateEntity();
    Entity bullet2 = world.CreateEntity();
    ASSERT_TRUE(world.AddComponentWith<Shape>(rock, [](Shape& s) { s = Shape::Circle; }));
    ASSERT_TRUE(world.AddComponentWith<Shape>(bullet1, [](Shape& s) { s = Shape::Bullet; }));
    ASSERT_TRUE(world.AddComponentWith<Shape>(bullet2, [](Shape& s) { s = Shape::Bullet; }));
    ASSERT_TRUE(world.AddComponent<Position>(plain));

    WorldQuery bullets;
    bullets.CheckComponentBy<Shape>([](const Shape& s) { return s == Shape::Bullet; });

    auto result = world.Iter(bullets);
    ASSERT_EQ(result.size(), 2u);
    EXPECT_EQ(result[0], bullet1);
    EXPECT_EQ(result[1], bullet2);
}

TEST(QueryTest, PredicateSeesValuesAtIterationTime) {
    World world;
    Entity rock = world.CreateEntity();
    Entity bullet = world.CreateEntity();
    ASSERT_TRUE(world.AddComponentWith<Shape>(rock, [](Shape& s) { s = Shape::Square; }));
    ASSERT_TRUE(world.AddComponentWith<Shape>(bullet, [](Shape& s) { s = Shape::Bullet; }));

    WorldQuery bullets;
    bullets.CheckComponentBy<Shape>([](const Shape& s) { return s == Shape::Bullet; });

    auto before = world.Iter(bullets);
    ASSERT_TRUE(world.UpdateComponentWith<Shape>(rock, [](Shape& s) { s = Shape::Bullet; }));

    // The earlier snapshot is unaffected by the update.
    ASSERT_EQ(before.size(), 1u);
    EXPECT_EQ(before[0], bullet);

    auto after = world.Iter(bullets);
    ASSERT_EQ(after.size(), 2u);
    EXPECT_EQ(after[0], rock);
    EXPECT_EQ(after[1], bullet);
}

TEST(QueryTest, CheckGlobalSpansComponents) {
    World world;
    Entity fast = world.CreateEntity();
    Entity slow = world.CreateEntity();
    for (Entity e : {fast, slow}) {
        ASSERT_TRUE(world.AddComponent<Position>(e));
    }
    ASSERT_TRUE(world.AddComponentWith<Velocity>(fast, [](Velocity& v) { v.dx = 10.0f; }));
    ASSERT_TRUE(world.AddComponentWith<Velocity>(slow, [](Velocity& v) { v.dx = 1.0f; }));

    WorldQuery query;
    query.CheckComponent<Position>().CheckGlobal([](const World& w, Entity e) {
        const auto* vel = w.FindComponent<Velocity>(e);
        return vel != nullptr && vel->dx > 5.0f;
    });

    auto result = world.Iter(query);
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], fast);
}

TEST(QueryTest, EvaluationShortCircuits) {
    World world;
    Entity e = world.CreateEntity();
    ASSERT_TRUE(world.AddComponent<Position>(e));

    int calls = 0;
    WorldQuery query;
    query.CheckComponent<Velocity>().CheckGlobal([&calls](const World&, Entity) {
        ++calls;
        return true;
    });

    EXPECT_TRUE(world.Iter(query).empty());
    EXPECT_EQ(calls, 0);
}

// ===========================================================================
// Ordering and reuse
// ===========================================================================

TEST(QueryTest, DeterministicOrderAcrossIterations) {
    World world;
    std::vector<Entity> created;
    for (int i = 0; i < 20; ++i) {
        created.push_back(world.CreateEntity());
        ASSERT_TRUE(world.AddComponent<Position>(created.back()));
    }
    ASSERT_TRUE(world.DeleteEntity(created[3]));
    ASSERT_TRUE(world.DeleteEntity(created[11]));

    WorldQuery query;
    query.CheckComponent<Position>();

    auto first = world.Iter(query);
    auto second = world.Iter(query);
    EXPECT_EQ(first, second);
    for (std::size_t i = 1; i < first.size(); ++i) {
        EXPECT_LT(first[i - 1].index, first[i].index);
    }
}

TEST(QueryTest, RecycledIndexAppearsAtItsIndexPosition) {
    World world;
    Entity a = world.CreateEntity();
    Entity b = world.CreateEntity();
    Entity c = world.CreateEntity();
    ASSERT_TRUE(world.DeleteEntity(a));
    Entity d = world.CreateEntity();
    ASSERT_EQ(d.index, a.index);

    auto all = world.Iter(WorldQuery{});
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0], d);
    EXPECT_EQ(all[1], b);
    EXPECT_EQ(all[2], c);
}
