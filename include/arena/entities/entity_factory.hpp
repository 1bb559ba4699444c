#pragma once

#include <entt/entt.hpp>
#include "arena/components/basic.hpp"

namespace Entities {

/**
 * Factory for the collidable entities the game loop hands to the
 * collision core. Each entity gets a Position, a resolved Collider and
 * a Lifecycle.
 */
class EntityFactory {
public:
    /**
     * Creates an entity whose collider is a circle of the given radius.
     */
    static entt::entity createCircle(entt::registry& registry,
                                     const Components::Position& position,
                                     double radius);

    /**
     * Creates an entity that only carries a size (used as a radius).
     */
    static entt::entity createSized(entt::registry& registry,
                                    const Components::Position& position,
                                    double size);

    /**
     * Creates an entity from raw radius/size fields. Zero means "absent";
     * with both absent the default collider radius applies.
     */
    static entt::entity createCollidable(entt::registry& registry,
                                         const Components::Position& position,
                                         double radius = 0.0,
                                         double size = 0.0);

    static void setActive(entt::registry& registry, entt::entity entity, bool active);
    static void markDead(entt::registry& registry, entt::entity entity);
};

} // namespace Entities
