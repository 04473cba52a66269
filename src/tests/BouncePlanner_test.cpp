#include "core/BinaryImage.h"
#include "core/BouncePlanner.h"
#include "core/Errors.h"
#include "core/Grid.h"
#include "core/SimulationConfig.h"

#include <cmath>
#include <gtest/gtest.h>
#include <limits>
#include <numbers>
#include <random>

using namespace CarveSim;

namespace {

// 7x7 grid: one edge ring around a 5x5 field of background.
Grid openField()
{
    return Grid::build(BinaryImage::fromRows({ ".....", ".....", ".....", ".....", "....." }), 1);
}

// Carve every background cell except `keep`.
void carveAll(Grid& grid, const Vector2i& keep = { -1, -1 })
{
    for (int y = 0; y < grid.getHeight(); ++y) {
        for (int x = 0; x < grid.getWidth(); ++x) {
            if (grid.at(x, y).isCarveable() && Vector2i{ x, y } != keep) {
                grid.setState(x, y, CellState::CarvedOpen);
            }
        }
    }
}

} // namespace

// Test that the ray ignores the cell it starts in.
TEST(BouncePlannerTest, CastRaySkipsStartCell)
{
    const Grid grid = openField();
    BouncePlanner planner;

    const RayCast ray = planner.castRay(grid, { 3.5, 3.5 }, 0.0, 10.0);

    ASSERT_TRUE(ray.firstHit.has_value());
    EXPECT_EQ(ray.firstHit->cell, (Vector2i{ 4, 3 }));
    EXPECT_EQ(ray.firstHit->state, CellState::CarveableBackground);
    EXPECT_EQ(ray.firstHit->edge, SquareEdge::Left);
    EXPECT_NEAR(ray.firstHit->distance, 0.5, 1e-9);
    EXPECT_NEAR(ray.firstHit->point.x, 4.0, 1e-9);
    EXPECT_NEAR(ray.firstHit->point.y, 3.5, 1e-9);
}

// Test that carved cells and the inner edge ring are transparent.
TEST(BouncePlannerTest, CastRayPassesOpenCells)
{
    Grid grid = Grid::build(BinaryImage::fromRows({ "...", "...", "..." }), 2);
    carveAll(grid);
    BouncePlanner planner;

    // Heading up from the middle: carved cells, the inner ring, then the outer ring.
    const RayCast ray = planner.castRay(grid, { 3.5, 3.5 }, -std::numbers::pi / 2.0, 20.0);

    ASSERT_TRUE(ray.firstHit.has_value());
    EXPECT_EQ(ray.firstHit->cell, (Vector2i{ 3, 0 }));
    EXPECT_EQ(ray.firstHit->state, CellState::EdgeBoundary);
    EXPECT_EQ(ray.firstHit->edge, SquareEdge::Bottom);
    EXPECT_NEAR(ray.firstHit->distance, 2.5, 1e-9);
}

// Test the look-ahead limit.
TEST(BouncePlannerTest, CastRayRespectsMaxDistance)
{
    Grid grid = openField();
    carveAll(grid);
    BouncePlanner planner;

    EXPECT_FALSE(planner.castRay(grid, { 3.5, 3.5 }, 0.0, 2.0).firstHit.has_value());
    EXPECT_TRUE(planner.castRay(grid, { 3.5, 3.5 }, 0.0, 3.0).firstHit.has_value());
}

TEST(BouncePlannerTest, CastRayRejectsBadInput)
{
    const Grid grid = openField();
    BouncePlanner planner;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    EXPECT_THROW(planner.castRay(grid, { nan, 1.0 }, 0.0, 5.0), RayCastError);
    EXPECT_THROW(planner.castRay(grid, { 1.5, 1.5 }, nan, 5.0), RayCastError);
    EXPECT_THROW(planner.castRay(grid, { 1.5, 1.5 }, 0.0, 0.0), RayCastError);
}

// Test that a carveable cell along the perfect reflection is taken as-is.
TEST(BouncePlannerTest, PerfectReflectionTargetsCarveable)
{
    const Grid grid = openField();
    BouncePlanner planner;
    SimulationConfig config = getDefaultSimulationConfig();
    std::mt19937 rng(1);

    // Travelling right, bounced off a wall facing left.
    const BounceAngle bounce = planner.findOptimalBounceAngle(
        grid, { 3.5, 3.5 }, { 1.0, 0.0 }, { -1.0, 0.0 }, config, rng);

    EXPECT_TRUE(bounce.isOptimal);
    EXPECT_DOUBLE_EQ(bounce.deviationDegrees, 0.0);
    EXPECT_NEAR(std::abs(bounce.angle), std::numbers::pi, 1e-9);
    ASSERT_TRUE(bounce.target.has_value());
    EXPECT_EQ(*bounce.target, (Vector2i{ 2, 3 }));
}

// Test that the search moves off the perfect angle to find work.
TEST(BouncePlannerTest, DeviationFindsNearbyTarget)
{
    // 12x10 grid, everything carved except (1, 4).
    Grid grid = Grid::build(
        BinaryImage::fromRows({ "..........",
                                "..........",
                                "..........",
                                "..........",
                                "..........",
                                "..........",
                                "..........",
                                ".........." }),
        1);
    carveAll(grid, { 1, 4 });
    BouncePlanner planner;
    SimulationConfig config = getDefaultSimulationConfig();
    config.deviation_angle_degrees = 20.0;
    std::mt19937 rng(3);

    // Straight back to the left runs along row 5 into the edge; the target
    // is first reached 4 degrees up.
    const BounceAngle bounce = planner.findOptimalBounceAngle(
        grid, { 8.5, 5.5 }, { 1.0, 0.0 }, { -1.0, 0.0 }, config, rng);

    ASSERT_TRUE(bounce.isOptimal);
    ASSERT_TRUE(bounce.target.has_value());
    EXPECT_EQ(*bounce.target, (Vector2i{ 1, 4 }));
    EXPECT_DOUBLE_EQ(bounce.deviationDegrees, 4.0);
}

// Test the random fallback when nothing carveable is in range.
TEST(BouncePlannerTest, FallbackStaysWithinDeviation)
{
    Grid grid = openField();
    carveAll(grid);
    BouncePlanner planner;
    SimulationConfig config = getDefaultSimulationConfig();
    config.deviation_angle_degrees = 10.0;
    std::mt19937 rng(5);

    for (int i = 0; i < 50; ++i) {
        const BounceAngle bounce = planner.findOptimalBounceAngle(
            grid, { 3.5, 3.5 }, { 0.0, 1.0 }, { 0.0, -1.0 }, config, rng);

        EXPECT_FALSE(bounce.isOptimal);
        EXPECT_FALSE(bounce.target.has_value());
        EXPECT_LE(std::abs(bounce.deviationDegrees), 10.0);

        // Perfect reflection points straight up (-pi/2).
        const double offset = bounce.angle + std::numbers::pi / 2.0;
        EXPECT_NEAR(offset, degreesToRadians(bounce.deviationDegrees), 1e-9);
    }
}
