/**
 * @file spatial_grid.cpp
 * @brief Implementation of the uniform-grid broad phase
 */

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "arena/collision/spatial_grid.hpp"
#include "arena/components/basic.hpp"
#include "arena/core/collision_config.hpp"
#include "arena/core/log.hpp"
#include "arena/core/profile.hpp"

namespace Collision
{

namespace {

// Only called once gridDimensionProblems() has bounded the result.
int cellsAlong(double extent, double cellSize) {
    return static_cast<int>(std::ceil(extent / cellSize));
}

} // namespace

SpatialGrid::SpatialGrid(double worldWidth, double worldHeight, double cellSize)
    : world_width(worldWidth),
      world_height(worldHeight),
      cell_size(cellSize),
      num_cols(0),
      num_rows(0),
      entity_count(0)
{
    std::vector<std::string> const problems = gridDimensionProblems(worldWidth, worldHeight, cellSize);
    if (!problems.empty()) {
        std::ostringstream msg;
        msg << "SpatialGrid:";
        for (const auto &problem : problems) {
            msg << " " << problem << ";";
        }
        throw std::invalid_argument(msg.str());
    }

    num_cols = cellsAlong(worldWidth, cellSize);
    num_rows = cellsAlong(worldHeight, cellSize);
    buckets.resize(static_cast<std::size_t>(num_cols) * static_cast<std::size_t>(num_rows));

    ARENA_LOG_DEBUG("SpatialGrid " << world_width << "x" << world_height
                    << " cell " << cell_size << " -> " << num_cols << "x" << num_rows);
}

void SpatialGrid::clear()
{
    for (auto &bucket : buckets) {
        bucket.clear();
    }
    entity_count = 0;
}

// NaN fails both comparisons and lands in column/row 0.
int SpatialGrid::clampColumn(double x) const
{
    double const col = std::floor(x / cell_size);
    if (!(col >= 0.0)) return 0;
    if (col >= num_cols - 1) return num_cols - 1;
    return static_cast<int>(col);
}

int SpatialGrid::clampRow(double y) const
{
    double const row = std::floor(y / cell_size);
    if (!(row >= 0.0)) return 0;
    if (row >= num_rows - 1) return num_rows - 1;
    return static_cast<int>(row);
}

SpatialGrid::Cell SpatialGrid::cellFor(double x, double y) const
{
    return Cell{clampColumn(x), clampRow(y)};
}

std::size_t SpatialGrid::cellIndexFor(double x, double y) const
{
    Cell const cell = cellFor(x, y);
    return static_cast<std::size_t>(cell.row) * static_cast<std::size_t>(num_cols) +
           static_cast<std::size_t>(cell.col);
}

void SpatialGrid::insert(const entt::registry &registry, entt::entity entity)
{
    const auto *pos = registry.try_get<Components::Position>(entity);
    if (pos == nullptr || std::isnan(pos->x) || std::isnan(pos->y)) {
        return;
    }
    buckets[cellIndexFor(pos->x, pos->y)].push_back(entity);
    ++entity_count;
}

std::vector<CandidatePair> SpatialGrid::enumerateCandidatePairs(const entt::registry &registry) const
{
    std::vector<CandidatePair> pairs;
    enumerateCandidatePairs(registry, pairs);
    return pairs;
}

void SpatialGrid::enumerateCandidatePairs(const entt::registry &registry,
                                          std::vector<CandidatePair> &pairs) const
{
    PROFILE_SCOPE("SpatialGrid::enumerateCandidatePairs");

    for (const auto &bucket : buckets) {
        for (std::size_t i = 0; i < bucket.size(); ++i) {
            entt::entity const eA = bucket[i];
            if (!participates(registry, eA)) {
                continue;
            }
            for (std::size_t j = i + 1; j < bucket.size(); ++j) {
                entt::entity const eB = bucket[j];
                if (eA != eB && participates(registry, eB)) {
                    pairs.push_back({eA, eB});
                }
            }
        }
    }
}

void SpatialGrid::queryArea(double minX, double minY, double maxX, double maxY,
                            std::vector<entt::entity> &found) const
{
    int const c0 = clampColumn(minX);
    int const c1 = clampColumn(maxX);
    int const r0 = clampRow(minY);
    int const r1 = clampRow(maxY);

    for (int row = r0; row <= r1; ++row) {
        for (int col = c0; col <= c1; ++col) {
            const auto &bucket = buckets[static_cast<std::size_t>(row) * static_cast<std::size_t>(num_cols) +
                                         static_cast<std::size_t>(col)];
            found.insert(found.end(), bucket.begin(), bucket.end());
        }
    }
}

} // namespace Collision
