#include "arena/core/collision_config.hpp"
#include "arena/core/constants.hpp"

#include <cmath>
#include <sstream>

namespace {

bool isPositiveFinite(double value) {
    return std::isfinite(value) && value > 0.0;
}

void requirePositive(std::vector<std::string> &problems, const char *name, double value) {
    if (!isPositiveFinite(value)) {
        std::ostringstream msg;
        msg << name << " must be a positive finite number (got " << value << ")";
        problems.push_back(msg.str());
    }
}

} // namespace

CollisionConfig defaultCollisionConfig() {
    using namespace CollisionConstants;

    CollisionConfig cfg{};
    cfg.worldWidth    = DefaultWorldWidth;
    cfg.worldHeight   = DefaultWorldHeight;
    cfg.cellSize      = DefaultCellSize;
    cfg.defaultRadius = DefaultColliderRadius;
    cfg.frameBudgetMs = FrameBudgetMs;
    return cfg;
}

std::vector<std::string> gridDimensionProblems(double worldWidth, double worldHeight, double cellSize) {
    std::vector<std::string> problems;
    requirePositive(problems, "worldWidth", worldWidth);
    requirePositive(problems, "worldHeight", worldHeight);
    requirePositive(problems, "cellSize", cellSize);
    if (!problems.empty()) {
        return problems;
    }

    // Counted in double so huge ratios cannot overflow before the check.
    double const cols = std::ceil(worldWidth / cellSize);
    double const rows = std::ceil(worldHeight / cellSize);
    double const maxCells = static_cast<double>(CollisionConstants::MaxGridCells);
    if (!(cols <= maxCells && rows <= maxCells && cols * rows <= maxCells)) {
        std::ostringstream msg;
        msg << "grid of " << cols << "x" << rows << " cells exceeds the limit of "
            << CollisionConstants::MaxGridCells << " cells";
        problems.push_back(msg.str());
    }
    return problems;
}

std::vector<std::string> validateConfig(const CollisionConfig &cfg) {
    std::vector<std::string> problems = gridDimensionProblems(cfg.worldWidth, cfg.worldHeight, cfg.cellSize);

    // A zero default radius is legal; it only makes fallback colliders points.
    if (!std::isfinite(cfg.defaultRadius) || cfg.defaultRadius < 0.0) {
        std::ostringstream msg;
        msg << "defaultRadius must be a non-negative finite number (got " << cfg.defaultRadius << ")";
        problems.push_back(msg.str());
    }
    if (std::isnan(cfg.frameBudgetMs) || cfg.frameBudgetMs < 0.0) {
        std::ostringstream msg;
        msg << "frameBudgetMs must not be negative (got " << cfg.frameBudgetMs << ")";
        problems.push_back(msg.str());
    }
    return problems;
}
