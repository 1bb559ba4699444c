#include <gtest/gtest.h>
#include <limits>

#include "arena/core/collision_config.hpp"
#include "arena/core/constants.hpp"

TEST(CollisionConfigTest, DefaultsDescribeGameWorld) {
    CollisionConfig cfg = defaultCollisionConfig();

    EXPECT_DOUBLE_EQ(cfg.worldWidth, 800.0);
    EXPECT_DOUBLE_EQ(cfg.worldHeight, 600.0);
    EXPECT_DOUBLE_EQ(cfg.cellSize, 50.0);
    EXPECT_DOUBLE_EQ(cfg.defaultRadius, CollisionConstants::DefaultColliderRadius);
    EXPECT_DOUBLE_EQ(cfg.frameBudgetMs, 3.0);
    EXPECT_TRUE(validateConfig(cfg).empty());
}

TEST(CollisionConfigTest, ReportsEachProblem) {
    CollisionConfig cfg = defaultCollisionConfig();
    cfg.worldWidth = 0.0;
    cfg.cellSize = -50.0;
    cfg.defaultRadius = -1.0;

    auto problems = validateConfig(cfg);
    ASSERT_EQ(problems.size(), 3u);
    EXPECT_NE(problems[0].find("worldWidth"), std::string::npos);
    EXPECT_NE(problems[1].find("cellSize"), std::string::npos);
    EXPECT_NE(problems[2].find("defaultRadius"), std::string::npos);
}

TEST(CollisionConfigTest, RejectsNonFiniteSizes) {
    CollisionConfig cfg = defaultCollisionConfig();
    cfg.worldHeight = std::numeric_limits<double>::infinity();
    cfg.frameBudgetMs = std::numeric_limits<double>::quiet_NaN();

    auto problems = validateConfig(cfg);
    ASSERT_EQ(problems.size(), 2u);
    EXPECT_NE(problems[0].find("worldHeight"), std::string::npos);
    EXPECT_NE(problems[1].find("frameBudgetMs"), std::string::npos);
}

TEST(CollisionConfigTest, ZeroDefaultRadiusAndUnlimitedBudgetAreAllowed) {
    CollisionConfig cfg = defaultCollisionConfig();
    cfg.defaultRadius = 0.0;
    cfg.frameBudgetMs = std::numeric_limits<double>::infinity();

    EXPECT_TRUE(validateConfig(cfg).empty());
}

TEST(CollisionConfigTest, RejectsGridsBeyondCellLimit) {
    CollisionConfig cfg = defaultCollisionConfig();
    cfg.cellSize = 1e-300;

    auto problems = validateConfig(cfg);
    ASSERT_EQ(problems.size(), 1u);
    EXPECT_NE(problems[0].find("exceeds the limit"), std::string::npos);

    cfg.cellSize = 1.0;
    cfg.worldWidth = 1e10;
    EXPECT_EQ(validateConfig(cfg).size(), 1u);

    EXPECT_TRUE(gridDimensionProblems(4096.0, 4096.0, 1.0).empty());
    EXPECT_EQ(gridDimensionProblems(4096.0, 4097.0, 1.0).size(), 1u);
}
