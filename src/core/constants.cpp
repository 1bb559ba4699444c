#include "arena/core/constants.hpp"

namespace CollisionConstants {

    const double DefaultWorldWidth     = 800.0;
    const double DefaultWorldHeight    = 600.0;
    const double DefaultCellSize       = 50.0;
    const std::size_t MaxGridCells     = std::size_t(1) << 24;
    const double DefaultColliderRadius = 10.0;
    const double FrameBudgetMs         = 3.0;

} // namespace CollisionConstants
