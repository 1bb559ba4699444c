/**
 * @file collision_system.hpp
 * @brief Per-tick collision orchestrator
 *
 * Owns the broad-phase grid and drives it once per tick:
 * 1. Clear the grid
 * 2. Insert every participating entity by position
 * 3. Collect same-cell candidate pairs and keep them until the next tick
 *
 * Narrow-phase tests are left to the caller, either through the
 * Collision:: functions on explicit shapes or through checkPair,
 * checkEntityAgainstList and resolveCandidatePairs.
 */

#ifndef ARENA_COLLISION_SYSTEM_HPP
#define ARENA_COLLISION_SYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include <entt/entt.hpp>

#include "arena/collision/collision_data.hpp"
#include "arena/collision/spatial_grid.hpp"
#include "arena/core/collision_config.hpp"
#include "arena/systems/i_system.hpp"

namespace Systems {

/**
 * @brief Figures from the most recent update()
 */
struct CollisionStats {
    std::size_t entitiesInserted = 0;
    std::size_t candidatePairs = 0;
    std::size_t occupiedCells = 0;
    std::size_t maxBucketSize = 0;
    double lastUpdateMs = 0.0;
    std::uint64_t ticks = 0;             ///< update() calls since construction or reconfiguration
    std::uint64_t ticksOverBudget = 0;
};

/**
 * @brief Single long-lived collision subsystem of the game
 *
 * Not thread-safe and not reentrant: update() runs once per tick on the
 * thread that owns the registry, and queries in between see that tick's
 * state. Nothing on the per-tick path throws.
 */
class CollisionSystem : public ISystem {
public:
    CollisionSystem();

    /**
     * @throws std::invalid_argument if the world or cell size is unusable
     */
    explicit CollisionSystem(const CollisionConfig& config);

    /**
     * @brief Rebuilds the grid from every entity that has a Position
     */
    void update(entt::registry& registry) override;

    /**
     * @brief Rebuilds the grid from an explicit entity list
     *
     * @param registry Registry holding the entities' components
     * @param entities Entities to consider this tick; inactive or dead
     *                 ones are skipped
     */
    void update(const entt::registry& registry, const std::vector<entt::entity>& entities);

    /**
     * @brief Applies a new configuration and rebuilds the grid
     *
     * Clears the stored pairs and statistics.
     * @throws std::invalid_argument if the world or cell size is unusable
     */
    void setSystemConfig(const CollisionConfig& config) override;

    /**
     * @brief Pairs computed by the last update(); empty before the first one
     */
    const std::vector<Collision::CandidatePair>& getCandidatePairs() const;

    /**
     * @brief Tests one entity against a target list without using the grid
     *
     * Skips @p entity itself and targets that are inactive or dead.
     * Intended for small, already range-filtered target lists.
     * @return Only the targets that collided
     */
    std::vector<Collision::CollisionHit> checkEntityAgainstList(
        const entt::registry& registry,
        entt::entity entity,
        const std::vector<entt::entity>& targets) const;

    /**
     * @brief Narrow-phase test of two entities as circles
     *
     * If both carry a radius, the radii are used. Otherwise if both carry a
     * size, the sizes are used as radii. Otherwise each side independently
     * uses its size, else its radius, else the configured default radius.
     * An entity without a Position never collides.
     */
    Collision::CollisionResult checkPair(const entt::registry& registry,
                                         entt::entity a,
                                         entt::entity b) const;

    /**
     * @brief Runs checkPair over the stored candidate pairs
     * @return The pairs that actually collide
     */
    std::vector<Collision::ResolvedPair> resolveCandidatePairs(const entt::registry& registry) const;

    /**
     * @brief Participating entities stored in the cells overlapped by the
     *        square around (x, y) with half-side @p radius
     */
    std::vector<entt::entity> queryNearby(const entt::registry& registry,
                                          double x, double y, double radius) const;

    const CollisionStats& stats() const { return lastStats; }
    const CollisionConfig& config() const { return cfg; }
    const Collision::SpatialGrid& grid() const { return spatialGrid; }

private:
    void recordStats(double elapsedMs);

    CollisionConfig cfg;
    Collision::SpatialGrid spatialGrid;
    std::vector<Collision::CandidatePair> candidatePairs;
    std::vector<entt::entity> tickEntities;   ///< Reused by update(registry)
    CollisionStats lastStats;
};

} // namespace Systems

#endif // ARENA_COLLISION_SYSTEM_HPP
