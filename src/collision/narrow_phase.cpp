/**
 * @file narrow_phase.cpp
 * @brief Circle, box and point tests
 */

#include <algorithm>

#include "arena/collision/narrow_phase.hpp"

namespace Collision
{

namespace {

Position centerOf(const BoundingBox &box) {
    return {box.x + box.width / 2.0, box.y + box.height / 2.0};
}

} // namespace

CollisionResult checkCircleCollision(const Circle &a, const Circle &b)
{
    Vector const offset = Position(b.x, b.y) - Position(a.x, a.y);
    double const distance = offset.length();
    double const minDistance = a.radius + b.radius;

    CollisionResult result;
    result.collided = distance < minDistance;
    result.distance = distance;
    result.overlap = result.collided ? minDistance - distance : 0.0;
    result.normal = offset.normalized();
    return result;
}

CollisionResult checkBoxCollision(const BoundingBox &a, const BoundingBox &b)
{
    CollisionResult result;
    result.collided = a.x < b.x + b.width &&
                      a.x + a.width > b.x &&
                      a.y < b.y + b.height &&
                      a.y + a.height > b.y;
    if (!result.collided) {
        return result;
    }

    double const overlapX = std::min(a.x + a.width, b.x + b.width) - std::max(a.x, b.x);
    double const overlapY = std::min(a.y + a.height, b.y + b.height) - std::max(a.y, b.y);
    result.overlap = std::min(overlapX, overlapY);
    result.normal = (centerOf(b) - centerOf(a)).normalized();
    return result;
}

CollisionResult checkCircleBoxCollision(const Circle &circle, const BoundingBox &box)
{
    // Nearest point of the box to the circle center
    Position const closest(std::max(box.x, std::min(circle.x, box.x + box.width)),
                           std::max(box.y, std::min(circle.y, box.y + box.height)));

    Vector const offset = Position(circle.x, circle.y) - closest;
    double const distance = offset.length();

    CollisionResult result;
    result.collided = distance < circle.radius;
    result.distance = distance;
    result.overlap = result.collided ? circle.radius - distance : 0.0;
    result.normal = offset.normalized();
    return result;
}

bool isPointInCircle(double px, double py, const Circle &circle)
{
    return getDistance(circle.x, circle.y, px, py) <= circle.radius;
}

bool isPointInBox(double px, double py, const BoundingBox &box)
{
    return px >= box.x && px <= box.x + box.width &&
           py >= box.y && py <= box.y + box.height;
}

double getDistance(double x1, double y1, double x2, double y2)
{
    return pointDistance(x1, y1, x2, y2);
}

double getAngle(double x1, double y1, double x2, double y2)
{
    return pointAngle(x1, y1, x2, y2);
}

} // namespace Collision
