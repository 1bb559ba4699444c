/**
 * @file narrow_phase.hpp
 * @brief Exact collision tests between circles, axis-aligned boxes and points
 *
 * Every function is pure. Malformed input (NaN, negative extents) is not
 * validated; NaN propagates into the result and compares as "no collision".
 */

#ifndef ARENA_COLLISION_NARROW_PHASE_HPP
#define ARENA_COLLISION_NARROW_PHASE_HPP

#include "arena/collision/shapes.hpp"

namespace Collision {

/**
 * @brief Circle against circle
 *
 * Collides when the center distance is strictly less than the sum of the
 * radii, so touching circles do not collide. The normal points from
 * @p a towards @p b.
 */
CollisionResult checkCircleCollision(const Circle &a, const Circle &b);

/**
 * @brief Box against box
 *
 * @return overlap is the smaller of the X and Y penetrations. The normal
 *         is taken from the vector between the box centers, not from the
 *         axis that produced the overlap, so for non-square boxes the two
 *         can disagree. distance is always 0.
 */
CollisionResult checkBoxCollision(const BoundingBox &a, const BoundingBox &b);

/**
 * @brief Circle against box
 *
 * Uses the point of the box nearest to the circle center. The normal
 * points from that point towards the circle center and is zero when the
 * center lies inside the box.
 */
CollisionResult checkCircleBoxCollision(const Circle &circle, const BoundingBox &box);

// Boundary points count as inside.
bool isPointInCircle(double px, double py, const Circle &circle);
bool isPointInBox(double px, double py, const BoundingBox &box);

double getDistance(double x1, double y1, double x2, double y2);

/**
 * @brief atan2 heading from (x1, y1) towards (x2, y2), in radians
 */
double getAngle(double x1, double y1, double x2, double y2);

} // namespace Collision

#endif // ARENA_COLLISION_NARROW_PHASE_HPP
