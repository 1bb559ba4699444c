#ifndef ARENA_COLLISION_CONSTANTS_HPP
#define ARENA_COLLISION_CONSTANTS_HPP

#include <cstddef>

namespace CollisionConstants {

    // Playable world, in pixels
    extern const double DefaultWorldWidth;
    extern const double DefaultWorldHeight;

    // Side length of one broad-phase grid cell, in pixels
    extern const double DefaultCellSize;

    // Upper bound on columns x rows of one grid
    extern const std::size_t MaxGridCells;

    // Radius used for entities that carry neither a radius nor a size
    extern const double DefaultColliderRadius;

    // Time the per-tick update may take before a warning is logged
    extern const double FrameBudgetMs;

} // namespace CollisionConstants

#endif // ARENA_COLLISION_CONSTANTS_HPP
