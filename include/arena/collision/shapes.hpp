/**
 * @file shapes.hpp
 * @brief Shape primitives and the result type of the narrow phase
 *
 * All coordinates are world pixels. Shapes are plain values built for a
 * single test and discarded afterwards.
 */

#ifndef ARENA_COLLISION_SHAPES_HPP
#define ARENA_COLLISION_SHAPES_HPP

#include "arena/math/vector_math.hpp"

namespace Collision {

/**
 * @brief Circle given by its center and radius (radius >= 0)
 */
struct Circle {
    double x;
    double y;
    double radius;
};

/**
 * @brief Axis-aligned box given by its top-left corner and extents
 */
struct BoundingBox {
    double x;
    double y;
    double width;
    double height;
};

/**
 * @brief Unit contact direction, or the zero vector when the two shapes
 *        share an exact center point
 */
using CollisionNormal = Vector;

/**
 * @brief Outcome of a narrow-phase test
 */
struct CollisionResult {
    bool collided = false;
    double distance = 0.0;    ///< Center-to-center or center-to-nearest-point distance
    CollisionNormal normal;   ///< Points from the first shape towards the second
    double overlap = 0.0;     ///< Separation needed to resolve; 0 when not colliding
};

} // namespace Collision

#endif // ARENA_COLLISION_SHAPES_HPP
