/**
 * @file spatial_grid.hpp
 * @brief Uniform-grid broad phase
 *
 * The playable world is split into fixed square cells. Each tick the grid
 * is cleared, every entity is dropped into the one cell containing its
 * center, and only entities sharing a cell are proposed as candidate
 * pairs. This turns the all-pairs O(n^2) scan into roughly O(n * k) for
 * an average cell occupancy k.
 *
 * Entities are indexed by a single point. Two entities whose shapes
 * overlap across a cell boundary are not proposed; callers that need
 * extent-aware lookups use queryArea.
 */

#ifndef ARENA_SPATIAL_GRID_HPP
#define ARENA_SPATIAL_GRID_HPP

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "arena/collision/collision_data.hpp"

namespace Collision {

class SpatialGrid {
public:
    // Column/row coordinates of a cell
    struct Cell {
        int col;
        int row;
    };

    /**
     * @brief Builds a grid of ceil(width / cellSize) x ceil(height / cellSize) cells
     *
     * @throws std::invalid_argument if any argument is not a positive finite
     *         number, or the grid would exceed CollisionConstants::MaxGridCells
     */
    SpatialGrid(double worldWidth, double worldHeight, double cellSize);

    /**
     * @brief Empties every cell. Cell storage keeps its capacity, so a
     *        steady-state tick does not allocate.
     */
    void clear();

    /**
     * @brief Cell containing a world point
     *
     * floor(coord / cellSize) per axis, clamped into the grid, so points
     * outside the world are pinned to the nearest edge cell.
     */
    Cell cellFor(double x, double y) const;

    /**
     * @brief Flat bucket index of cellFor(x, y): row * cols + col
     */
    std::size_t cellIndexFor(double x, double y) const;

    /**
     * @brief Adds @p entity to the cell of its current Position.
     *
     * Entities without a Position or with a NaN coordinate are skipped.
     */
    void insert(const entt::registry &registry, entt::entity entity);

    /**
     * @brief Every unordered same-cell pair whose members both participate
     */
    std::vector<CandidatePair> enumerateCandidatePairs(const entt::registry &registry) const;

    /**
     * @brief Appends same-cell pairs to @p pairs (which is not cleared first).
     */
    void enumerateCandidatePairs(const entt::registry &registry,
                                 std::vector<CandidatePair> &pairs) const;

    /**
     * @brief Appends every entity stored in a cell overlapping the rectangle.
     *
     * The rectangle is clamped into the grid like cellFor. No geometric
     * filtering happens beyond cell overlap.
     */
    void queryArea(double minX, double minY, double maxX, double maxY,
                   std::vector<entt::entity> &found) const;

    int cols() const { return num_cols; }
    int rows() const { return num_rows; }
    double cellSize() const { return cell_size; }
    double worldWidth() const { return world_width; }
    double worldHeight() const { return world_height; }
    std::size_t cellCount() const { return buckets.size(); }

    /** @brief Entities inserted since the last clear() */
    std::size_t entityCount() const { return entity_count; }

    const std::vector<entt::entity> &bucket(std::size_t index) const { return buckets.at(index); }

private:
    int clampColumn(double x) const;
    int clampRow(double y) const;

    double world_width;
    double world_height;
    double cell_size;
    int num_cols;
    int num_rows;
    std::vector<std::vector<entt::entity>> buckets;
    std::size_t entity_count;
};

} // namespace Collision

#endif // ARENA_SPATIAL_GRID_HPP
