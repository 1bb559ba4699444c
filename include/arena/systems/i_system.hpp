/**
 * @file i_system.hpp
 * @brief Interface for per-tick systems driven by the game loop
 */

#pragma once

#include <entt/entt.hpp>
#include "arena/core/collision_config.hpp"

namespace Systems {

/**
 * @class ISystem
 * @brief Base interface for systems updated once per simulation tick
 */
class ISystem {
public:
    virtual ~ISystem() = default;

    /**
     * @brief Runs the system for one simulation tick
     *
     * @param registry EnTT registry containing all entities and components
     */
    virtual void update(entt::registry& registry) = 0;

    /**
     * @brief Replaces the system configuration
     */
    virtual void setSystemConfig(const CollisionConfig& config) = 0;
};

} // namespace Systems
