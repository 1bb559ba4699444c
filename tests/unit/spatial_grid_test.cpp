#include <gtest/gtest.h>
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <vector>

#include <entt/entt.hpp>

#include "arena/collision/spatial_grid.hpp"
#include "arena/components/basic.hpp"
#include "arena/core/constants.hpp"
#include "arena/entities/entity_factory.hpp"

using namespace Collision;

class SpatialGridTest : public ::testing::Test {
protected:
    entt::registry registry;
    SpatialGrid grid{800.0, 600.0, 50.0};

    // Helper to create an entity and insert it into the grid
    entt::entity addEntity(double x, double y, double radius = 5.0) {
        auto entity = Entities::EntityFactory::createCircle(registry, Components::Position(x, y), radius);
        grid.insert(registry, entity);
        return entity;
    }

    static bool samePair(const CandidatePair &p, entt::entity a, entt::entity b) {
        return (p.eA == a && p.eB == b) || (p.eA == b && p.eB == a);
    }
};

TEST_F(SpatialGridTest, Dimensions) {
    EXPECT_EQ(grid.cols(), 16);
    EXPECT_EQ(grid.rows(), 12);
    EXPECT_EQ(grid.cellCount(), 192u);
    EXPECT_DOUBLE_EQ(grid.cellSize(), 50.0);

    // Partial cells round up
    SpatialGrid uneven(810.0, 601.0, 50.0);
    EXPECT_EQ(uneven.cols(), 17);
    EXPECT_EQ(uneven.rows(), 13);
}

TEST_F(SpatialGridTest, CellMapping) {
    SpatialGrid::Cell farCorner = grid.cellFor(799.0, 599.0);
    EXPECT_EQ(farCorner.col, 15);
    EXPECT_EQ(farCorner.row, 11);
    EXPECT_EQ(grid.cellIndexFor(799.0, 599.0), 11u * 16u + 15u);

    SpatialGrid::Cell origin = grid.cellFor(0.0, 0.0);
    EXPECT_EQ(origin.col, 0);
    EXPECT_EQ(origin.row, 0);

    EXPECT_EQ(grid.cellIndexFor(50.0, 0.0), 1u);    // cell boundaries belong to the next cell
    EXPECT_EQ(grid.cellIndexFor(0.0, 50.0), 16u);
    EXPECT_EQ(grid.cellIndexFor(125.0, 260.0), 5u * 16u + 2u);
}

TEST_F(SpatialGridTest, OutOfBoundsPointsAreClamped) {
    SpatialGrid::Cell negative = grid.cellFor(-5.0, -5.0);
    EXPECT_EQ(negative.col, 0);
    EXPECT_EQ(negative.row, 0);

    SpatialGrid::Cell beyond = grid.cellFor(5000.0, 650.0);
    EXPECT_EQ(beyond.col, 15);
    EXPECT_EQ(beyond.row, 11);

    SpatialGrid::Cell mixed = grid.cellFor(-100.0, 300.0);
    EXPECT_EQ(mixed.col, 0);
    EXPECT_EQ(mixed.row, 6);

    double const inf = std::numeric_limits<double>::infinity();
    EXPECT_EQ(grid.cellIndexFor(inf, inf), grid.cellCount() - 1);
}

TEST_F(SpatialGridTest, OutOfBoundsEntityStillIndexed) {
    auto a = addEntity(-20.0, -30.0);
    auto b = addEntity(10.0, 10.0);

    auto pairs = grid.enumerateCandidatePairs(registry);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_TRUE(samePair(pairs[0], a, b));
}

TEST_F(SpatialGridTest, DistantEntitiesProduceNoPairs) {
    addEntity(25.0, 25.0);
    addEntity(225.0, 25.0);
    addEntity(25.0, 225.0);
    addEntity(425.0, 425.0);
    addEntity(775.0, 575.0);

    EXPECT_EQ(grid.entityCount(), 5u);
    EXPECT_TRUE(grid.enumerateCandidatePairs(registry).empty());
}

TEST_F(SpatialGridTest, SamePositionYieldsExactlyOnePair) {
    auto a = addEntity(333.0, 222.0);
    auto b = addEntity(333.0, 222.0);

    auto pairs = grid.enumerateCandidatePairs(registry);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_TRUE(samePair(pairs[0], a, b));
}

TEST_F(SpatialGridTest, CrowdedCellYieldsAllUnorderedPairs) {
    std::vector<entt::entity> crowd;
    for (int i = 0; i < 5; ++i) {
        crowd.push_back(addEntity(101.0 + i, 101.0 + i));
    }

    auto pairs = grid.enumerateCandidatePairs(registry);
    EXPECT_EQ(pairs.size(), 10u);  // 5 choose 2

    for (std::size_t i = 0; i < crowd.size(); ++i) {
        for (std::size_t j = i + 1; j < crowd.size(); ++j) {
            auto count = std::count_if(pairs.begin(), pairs.end(), [&](const CandidatePair &p) {
                return samePair(p, crowd[i], crowd[j]);
            });
            EXPECT_EQ(count, 1);
        }
    }
}

TEST_F(SpatialGridTest, NeighbouringCellsAreNotPaired) {
    // Overlapping circles that straddle a cell boundary are not proposed.
    addEntity(49.0, 25.0, 10.0);
    addEntity(51.0, 25.0, 10.0);

    EXPECT_TRUE(grid.enumerateCandidatePairs(registry).empty());
}

TEST_F(SpatialGridTest, ClearIsIdempotent) {
    addEntity(10.0, 10.0);
    addEntity(12.0, 12.0);
    ASSERT_EQ(grid.enumerateCandidatePairs(registry).size(), 1u);

    grid.clear();
    grid.clear();

    EXPECT_EQ(grid.entityCount(), 0u);
    EXPECT_EQ(grid.cellCount(), 192u);
    EXPECT_TRUE(grid.enumerateCandidatePairs(registry).empty());
}

TEST_F(SpatialGridTest, FilteredEntitiesAreNotPaired) {
    auto alive = addEntity(10.0, 10.0);
    auto dead = addEntity(10.0, 10.0);
    auto inactive = addEntity(10.0, 10.0);
    Entities::EntityFactory::markDead(registry, dead);
    Entities::EntityFactory::setActive(registry, inactive, false);

    EXPECT_TRUE(grid.enumerateCandidatePairs(registry).empty());

    auto other = addEntity(11.0, 11.0);
    auto pairs = grid.enumerateCandidatePairs(registry);
    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_TRUE(samePair(pairs[0], alive, other));
}

TEST_F(SpatialGridTest, EntitiesWithoutLifecycleParticipate) {
    auto a = registry.create();
    registry.emplace<Components::Position>(a, 5.0, 5.0);
    auto b = registry.create();
    registry.emplace<Components::Position>(b, 6.0, 6.0);
    grid.insert(registry, a);
    grid.insert(registry, b);

    EXPECT_EQ(grid.enumerateCandidatePairs(registry).size(), 1u);
}

TEST_F(SpatialGridTest, EntitiesWithoutPositionOrWithNaNAreSkipped) {
    auto bare = registry.create();
    grid.insert(registry, bare);

    auto nan = registry.create();
    registry.emplace<Components::Position>(nan, std::numeric_limits<double>::quiet_NaN(), 5.0);
    grid.insert(registry, nan);

    EXPECT_EQ(grid.entityCount(), 0u);
}

TEST_F(SpatialGridTest, PositionIsSampledAtInsertion) {
    auto a = addEntity(10.0, 10.0);
    auto b = addEntity(400.0, 400.0);

    // Moving after insertion does not re-bucket the entity
    registry.get<Components::Position>(b) = Components::Position(10.0, 10.0);
    EXPECT_TRUE(grid.enumerateCandidatePairs(registry).empty());
    EXPECT_EQ(grid.bucket(grid.cellIndexFor(400.0, 400.0)).size(), 1u);
    EXPECT_EQ(grid.bucket(grid.cellIndexFor(10.0, 10.0)).front(), a);
}

TEST_F(SpatialGridTest, QueryAreaCollectsOverlappedCells) {
    auto centre = addEntity(125.0, 125.0);
    auto east = addEntity(175.0, 125.0);
    auto far = addEntity(500.0, 500.0);

    std::vector<entt::entity> found;
    grid.queryArea(110.0, 110.0, 160.0, 140.0, found);

    EXPECT_EQ(found.size(), 2u);
    EXPECT_NE(std::find(found.begin(), found.end(), centre), found.end());
    EXPECT_NE(std::find(found.begin(), found.end(), east), found.end());
    EXPECT_EQ(std::find(found.begin(), found.end(), far), found.end());
}

TEST_F(SpatialGridTest, QueryAreaClampsToGrid) {
    auto corner = addEntity(-40.0, -40.0);

    std::vector<entt::entity> found;
    grid.queryArea(-500.0, -500.0, -400.0, -400.0, found);

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0], corner);
}

TEST(SpatialGridConstructionTest, RejectsUnusableDimensions) {
    EXPECT_THROW(SpatialGrid(0.0, 600.0, 50.0), std::invalid_argument);
    EXPECT_THROW(SpatialGrid(800.0, -1.0, 50.0), std::invalid_argument);
    EXPECT_THROW(SpatialGrid(800.0, 600.0, 0.0), std::invalid_argument);
    EXPECT_THROW(SpatialGrid(800.0, 600.0, std::numeric_limits<double>::quiet_NaN()),
                 std::invalid_argument);
    EXPECT_THROW(SpatialGrid(800.0, 600.0, 1e-300), std::invalid_argument);
    EXPECT_THROW(SpatialGrid(1e10, 10.0, 1.0), std::invalid_argument);
    EXPECT_THROW(SpatialGrid(1e300, 1e300, 1e-300), std::invalid_argument);
    EXPECT_NO_THROW(SpatialGrid(10.0, 10.0, 50.0));

    // Largest grid allowed: 4096 x 4096 cells
    SpatialGrid largest(4096.0, 4096.0, 1.0);
    EXPECT_EQ(largest.cellCount(), CollisionConstants::MaxGridCells);
    EXPECT_THROW(SpatialGrid(4097.0, 4096.0, 1.0), std::invalid_argument);

    SpatialGrid tiny(10.0, 10.0, 50.0);
    EXPECT_EQ(tiny.cols(), 1);
    EXPECT_EQ(tiny.rows(), 1);
}
