/**
 * @file main.cpp
 * @brief Collision benchmark: runs the per-tick pipeline over random entities.
 *
 * Usage: arena_collision_bench [entities] [ticks] [seed]
 */

#include <iostream>
#include <random>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "arena/components/basic.hpp"
#include "arena/core/arg_parse.hpp"
#include "arena/core/collision_config.hpp"
#include "arena/core/log.hpp"
#include "arena/core/profile.hpp"
#include "arena/entities/entity_factory.hpp"
#include "arena/systems/collision_system.hpp"

namespace {

// Player, enemies and projectiles: a mix of radius, size and default colliders.
void spawnEntities(entt::registry& registry, const CollisionConfig& cfg,
                   unsigned long count, std::default_random_engine& re) {
    std::uniform_real_distribution<double> xs(0.0, cfg.worldWidth);
    std::uniform_real_distribution<double> ys(0.0, cfg.worldHeight);
    std::uniform_real_distribution<double> extents(3.0, 25.0);
    std::uniform_int_distribution<int> kinds(0, 2);

    for (unsigned long i = 0; i < count; ++i) {
        Components::Position const pos(xs(re), ys(re));
        switch (kinds(re)) {
            case 0:  Entities::EntityFactory::createCircle(registry, pos, extents(re)); break;
            case 1:  Entities::EntityFactory::createSized(registry, pos, extents(re)); break;
            default: Entities::EntityFactory::createCollidable(registry, pos); break;
        }
    }
}

void jitter(entt::registry& registry, std::default_random_engine& re) {
    std::normal_distribution<double> step(0.0, 2.0);
    auto view = registry.view<Components::Position>();
    for (auto e : view) {
        auto& pos = view.get<Components::Position>(e);
        pos.x += step(re);
        pos.y += step(re);
    }
}

} // namespace

int main(int argc, char** argv) {
    unsigned long entityCount = 500;
    unsigned long ticks = 600;
    unsigned long seed = 42;

    if (argc > 4 ||
        (argc > 1 && !CommandLine::parseCount(argv[1], entityCount)) ||
        (argc > 2 && !CommandLine::parseCount(argv[2], ticks)) ||
        (argc > 3 && !CommandLine::parseCount(argv[3], seed))) {
        std::cerr << "usage: " << argv[0] << " [entities] [ticks] [seed]\n";
        return 1;
    }

    CollisionConfig const cfg = defaultCollisionConfig();
    std::default_random_engine re{static_cast<unsigned int>(seed)};

    entt::registry registry;
    spawnEntities(registry, cfg, entityCount, re);

    Systems::CollisionSystem collisions(cfg);
    std::size_t totalPairs = 0;
    std::size_t totalHits = 0;

    for (unsigned long t = 0; t < ticks; ++t) {
        PROFILE_SCOPE("Tick");
        jitter(registry, re);
        collisions.update(registry);
        totalPairs += collisions.getCandidatePairs().size();
        totalHits += collisions.resolveCandidatePairs(registry).size();
    }

    const auto& stats = collisions.stats();
    ARENA_LOG_INFO("entities " << entityCount << ", ticks " << stats.ticks
                   << ", grid " << collisions.grid().cols() << "x" << collisions.grid().rows());
    ARENA_LOG_INFO("candidate pairs " << totalPairs << ", confirmed collisions " << totalHits
                   << ", ticks over " << cfg.frameBudgetMs << "ms budget: " << stats.ticksOverBudget);

    Profiling::Profiler::printStats();
    return 0;
}
