/**
 * @file collision_config.hpp
 * @brief Configuration for the collision core.
 */

#pragma once

#include <string>
#include <vector>

/**
 * @brief Parameters fixed for the lifetime of one spatial grid.
 *
 * World size and cell size cannot change at runtime; applying a new
 * configuration rebuilds the grid.
 */
struct CollisionConfig {
    double worldWidth;     ///< Playable width in pixels
    double worldHeight;    ///< Playable height in pixels
    double cellSize;       ///< Broad-phase cell side length in pixels
    double defaultRadius;  ///< Radius for entities without radius or size
    double frameBudgetMs;  ///< Update time above which a warning is logged
};

/**
 * @brief Returns the configuration used by the game: 800x600 world, 50px cells.
 */
CollisionConfig defaultCollisionConfig();

/**
 * @brief Checks the dimensions a grid is built from.
 *
 * Each of the three values must be positive and finite, and the resulting
 * columns x rows may not exceed CollisionConstants::MaxGridCells.
 * @return One human-readable message per problem; empty when a grid can
 *         be built.
 */
std::vector<std::string> gridDimensionProblems(double worldWidth, double worldHeight, double cellSize);

/**
 * @brief Checks a configuration before a grid is built from it.
 *
 * @param cfg Configuration to inspect
 * @return One human-readable message per problem; empty when the
 *         configuration is usable.
 */
std::vector<std::string> validateConfig(const CollisionConfig &cfg);
