#ifndef ARENA_COLLISION_DATA_HPP
#define ARENA_COLLISION_DATA_HPP

#include <entt/entt.hpp>

#include "arena/collision/shapes.hpp"

namespace Collision {

// Unordered pair proposed by the broad phase; carries no geometry
struct CandidatePair {
    entt::entity eA;
    entt::entity eB;
};

// One collided target from CollisionSystem::checkEntityAgainstList
struct CollisionHit {
    entt::entity target;
    CollisionResult result;
};

// A candidate pair confirmed by the narrow phase
struct ResolvedPair {
    entt::entity eA;
    entt::entity eB;
    CollisionResult result;
};

/**
 * @brief Participation filter shared by the grid and the orchestrator.
 *
 * @return true if @p entity is valid in @p registry, active and not dead.
 *         Entities without a Lifecycle component participate.
 */
bool participates(const entt::registry &registry, entt::entity entity);

} // namespace Collision

#endif // ARENA_COLLISION_DATA_HPP
