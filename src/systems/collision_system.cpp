/**
 * @file collision_system.cpp
 * @brief Implementation of the per-tick collision orchestrator
 */

#include <algorithm>
#include <chrono>
#include <utility>

#include "arena/systems/collision_system.hpp"
#include "arena/collision/narrow_phase.hpp"
#include "arena/components/basic.hpp"
#include "arena/core/log.hpp"
#include "arena/core/profile.hpp"

namespace Systems
{

namespace {

Components::Collider colliderOf(const entt::registry &registry, entt::entity entity) {
    const auto *collider = registry.try_get<Components::Collider>(entity);
    return collider != nullptr ? *collider : Components::Collider{};
}

// size, else radius, else the default
double fallbackRadius(const Components::Collider &collider, double defaultRadius) {
    if (collider.hasSize()) {
        return collider.size;
    }
    if (collider.hasRadius()) {
        return collider.radius;
    }
    return defaultRadius;
}

} // namespace

CollisionSystem::CollisionSystem()
    : CollisionSystem(defaultCollisionConfig())
{
}

CollisionSystem::CollisionSystem(const CollisionConfig& config)
    : cfg(config),
      spatialGrid(config.worldWidth, config.worldHeight, config.cellSize)
{
}

void CollisionSystem::setSystemConfig(const CollisionConfig& config)
{
    // Build first so a rejected config leaves the current state untouched.
    Collision::SpatialGrid rebuilt(config.worldWidth, config.worldHeight, config.cellSize);
    spatialGrid = std::move(rebuilt);
    cfg = config;
    candidatePairs.clear();
    lastStats = CollisionStats{};

    ARENA_LOG_INFO("CollisionSystem reconfigured: world " << cfg.worldWidth << "x" << cfg.worldHeight
                   << ", " << spatialGrid.cols() << "x" << spatialGrid.rows() << " cells of "
                   << cfg.cellSize << "px");
}

void CollisionSystem::update(entt::registry& registry)
{
    tickEntities.clear();
    auto view = registry.view<const Components::Position>();
    for (auto entity : view) {
        tickEntities.push_back(entity);
    }
    update(registry, tickEntities);
}

void CollisionSystem::update(const entt::registry& registry, const std::vector<entt::entity>& entities)
{
    PROFILE_SCOPE("CollisionSystem::update");
    auto const start = Profiling::Profiler::Clock::now();

    spatialGrid.clear();
    for (auto entity : entities) {
        if (Collision::participates(registry, entity)) {
            spatialGrid.insert(registry, entity);
        }
    }

    candidatePairs.clear();
    spatialGrid.enumerateCandidatePairs(registry, candidatePairs);

    auto const elapsed = std::chrono::duration_cast<Profiling::Profiler::Duration>(
        Profiling::Profiler::Clock::now() - start);
    recordStats(Profiling::toMilliseconds(elapsed));
}

void CollisionSystem::recordStats(double elapsedMs)
{
    CollisionStats next;
    next.entitiesInserted = spatialGrid.entityCount();
    next.candidatePairs = candidatePairs.size();
    for (std::size_t i = 0; i < spatialGrid.cellCount(); ++i) {
        std::size_t const occupancy = spatialGrid.bucket(i).size();
        if (occupancy > 0) {
            ++next.occupiedCells;
        }
        next.maxBucketSize = std::max(next.maxBucketSize, occupancy);
    }
    next.lastUpdateMs = elapsedMs;
    next.ticks = lastStats.ticks + 1;
    next.ticksOverBudget = lastStats.ticksOverBudget;

    if (elapsedMs > cfg.frameBudgetMs) {
        ++next.ticksOverBudget;
        ARENA_LOG_WARN("CollisionSystem update took " << elapsedMs << "ms (budget "
                       << cfg.frameBudgetMs << "ms): " << next.entitiesInserted << " entities, "
                       << next.candidatePairs << " pairs, fullest cell " << next.maxBucketSize);
    }
    lastStats = next;
}

const std::vector<Collision::CandidatePair>& CollisionSystem::getCandidatePairs() const
{
    return candidatePairs;
}

std::vector<Collision::CollisionHit> CollisionSystem::checkEntityAgainstList(
    const entt::registry& registry,
    entt::entity entity,
    const std::vector<entt::entity>& targets) const
{
    std::vector<Collision::CollisionHit> hits;
    for (auto target : targets) {
        if (target == entity || !Collision::participates(registry, target)) {
            continue;
        }
        Collision::CollisionResult const result = checkPair(registry, entity, target);
        if (result.collided) {
            hits.push_back({target, result});
        }
    }
    return hits;
}

Collision::CollisionResult CollisionSystem::checkPair(const entt::registry& registry,
                                                      entt::entity a,
                                                      entt::entity b) const
{
    if (!registry.valid(a) || !registry.valid(b)) {
        return {};
    }
    const auto *posA = registry.try_get<Components::Position>(a);
    const auto *posB = registry.try_get<Components::Position>(b);
    if (posA == nullptr || posB == nullptr) {
        return {};
    }

    Components::Collider const ca = colliderOf(registry, a);
    Components::Collider const cb = colliderOf(registry, b);

    double radiusA = 0.0;
    double radiusB = 0.0;
    if (ca.hasRadius() && cb.hasRadius()) {
        radiusA = ca.radius;
        radiusB = cb.radius;
    } else if (ca.hasSize() && cb.hasSize()) {
        radiusA = ca.size;
        radiusB = cb.size;
    } else {
        radiusA = fallbackRadius(ca, cfg.defaultRadius);
        radiusB = fallbackRadius(cb, cfg.defaultRadius);
    }

    return Collision::checkCircleCollision(Collision::Circle{posA->x, posA->y, radiusA},
                                           Collision::Circle{posB->x, posB->y, radiusB});
}

std::vector<Collision::ResolvedPair> CollisionSystem::resolveCandidatePairs(const entt::registry& registry) const
{
    PROFILE_SCOPE("CollisionSystem::resolveCandidatePairs");

    std::vector<Collision::ResolvedPair> resolved;
    for (const auto &pair : candidatePairs) {
        Collision::CollisionResult const result = checkPair(registry, pair.eA, pair.eB);
        if (result.collided) {
            resolved.push_back({pair.eA, pair.eB, result});
        }
    }
    return resolved;
}

std::vector<entt::entity> CollisionSystem::queryNearby(const entt::registry& registry,
                                                       double x, double y, double radius) const
{
    std::vector<entt::entity> found;
    spatialGrid.queryArea(x - radius, y - radius, x + radius, y + radius, found);
    found.erase(std::remove_if(found.begin(), found.end(),
                               [&registry](entt::entity e) { return !Collision::participates(registry, e); }),
                found.end());
    return found;
}

} // namespace Systems
