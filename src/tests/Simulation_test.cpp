#include "core/BinaryImage.h"
#include "core/PresentationLayer.h"
#include "core/Simulation.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace CarveSim;

namespace {

SimulationConfig seededConfig(int ballCount, int padding)
{
    SimulationConfig config = getDefaultSimulationConfig();
    config.ball_count = ballCount;
    config.padding = padding;
    config.seed = 42;
    return config;
}

BinaryImage blankImage(int width, int height)
{
    return BinaryImage::fromRows(
        std::vector<std::string>(static_cast<size_t>(height), std::string(width, '.')));
}

// Run until complete or the cap, checking per-frame invariants along the way.
uint32_t runToCompletion(Simulation& sim, uint32_t maxFrames)
{
    const size_t protectedCount = sim.getGrid().countByState(CellState::ProtectedText);
    size_t lastCarveable = sim.getGrid().countByState(CellState::CarveableBackground);

    while (!sim.isComplete() && sim.getFrame() < maxFrames) {
        const FrameStats stats = sim.advanceFrame();
        const Grid& grid = sim.getGrid();

        EXPECT_LE(stats.carveableRemaining, lastCarveable);
        lastCarveable = stats.carveableRemaining;
        EXPECT_EQ(grid.countByState(CellState::ProtectedText), protectedCount);
        EXPECT_EQ(stats.activeBalls, sim.getBalls().size());
        EXPECT_LE(sim.getBalls().size(), static_cast<size_t>(sim.getConfig().ball_count));
        EXPECT_EQ(stats.ballsFaulted, 0u);

        for (const auto& ball : sim.getBalls()) {
            EXPECT_TRUE(ball.isActive());
            const Vector2i cell = ball.cell();
            EXPECT_TRUE(grid.inBounds(cell.x, cell.y));
        }

        if (::testing::Test::HasFailure()) {
            break;
        }
    }
    return sim.getFrame();
}

} // namespace

// Test that a blank canvas is carved away completely.
TEST(SimulationTest, BlankCanvasCompletes)
{
    Simulation sim(blankImage(10, 10), seededConfig(10, 2));
    EXPECT_EQ(sim.getGrid().getWidth(), 14);
    EXPECT_TRUE(sim.getIslands().empty());
    EXPECT_EQ(sim.getGrid().countByState(CellState::CarveableBackground), 100u);

    EXPECT_EQ(sim.spawnInitialBalls(), 10);
    for (const auto& ball : sim.getBalls()) {
        EXPECT_TRUE(sim.getGrid().at(ball.cell()).isEdge());
        EXPECT_NEAR(ball.getSpeed(), 0.5, 1e-9);
    }

    const uint32_t frames = runToCompletion(sim, 100000);

    EXPECT_TRUE(sim.isComplete());
    EXPECT_LT(frames, 100000u);
    EXPECT_EQ(sim.getLastStats().carveableRemaining, 0u);
    EXPECT_EQ(sim.getGrid().countByState(CellState::CarvedOpen), 100u);
}

// Test that a lone text pixel survives while everything around it is carved.
TEST(SimulationTest, SinglePixelSurvives)
{
    Simulation sim(BinaryImage::fromRows({ ".....", ".....", "..#..", ".....", "....." }),
                   seededConfig(8, 1));
    PresentationLayer presentation;
    sim.setEventSink(&presentation);

    ASSERT_EQ(sim.getIslands().size(), 1u);
    EXPECT_EQ(sim.getIslands()[0].cells.size(), 1u);
    EXPECT_EQ(sim.getIslands()[0].boundary.size(), 4u);

    sim.spawnInitialBalls();
    runToCompletion(sim, 100000);
    ASSERT_TRUE(sim.isComplete());

    // The reveal finishes within a start frame plus one cell's worth of frames.
    for (int i = 0; i <= IslandAnalyzer::FRAMES_PER_CELL; ++i) {
        sim.advanceFrame();
    }

    EXPECT_TRUE(sim.getIslands()[0].completed);
    EXPECT_EQ(sim.getGrid().at(3, 3).state, CellState::ProtectedText);
    EXPECT_EQ(presentation.overlayAt(3, 3), OverlayTag::Revealed);
    EXPECT_EQ(presentation.eventCount(CellEventType::IslandFlash), 3u);
    EXPECT_EQ(presentation.eventCount(CellEventType::Carved), 24u);
}

// Test that a pocket sealed off by text and the single padding ring is still
// carved, whatever the seed.
TEST(SimulationTest, RingPocketCompletes)
{
    const BinaryImage image = BinaryImage::fromRows(
        { "....#.", "...#.#", "......", "......", "......", "......" });

    for (uint32_t seed = 1; seed <= 5; ++seed) {
        SimulationConfig config = seededConfig(10, 1);
        config.seed = seed;
        Simulation sim(image, config);

        // The pocket is grouped with the text around it.
        ASSERT_EQ(sim.getIslands().size(), 2u) << "seed " << seed;

        sim.spawnInitialBalls();
        runToCompletion(sim, 100000);

        EXPECT_TRUE(sim.isComplete()) << "seed " << seed;
        EXPECT_EQ(sim.getGrid().countByState(CellState::CarveableBackground), 0u);
        EXPECT_EQ(sim.getGrid().at(6, 1).state, CellState::CarvedOpen) << "seed " << seed;
        if (::testing::Test::HasFailure()) {
            break;
        }
    }
}

// Test that a ball that wanders into an island from the outer ring is retired.
TEST(SimulationTest, StrandedBallIsRetired)
{
    const BinaryImage image = BinaryImage::fromRows(
        { "....#.", "...#.#", "......", "......", "......", "......" });
    SimulationConfig config = seededConfig(1, 1);
    Simulation sim(image, config);

    // Inside the pocket cell, drifting slowly so it stays there this frame.
    sim.getGrid().setState(6, 1, CellState::CarvedOpen);
    sim.addBall(Ball(7, Vector2d{ 6.5, 1.5 }, Vector2d{ 0.0, 0.01 }, config.ball_diameter));

    const FrameStats stats = sim.advanceFrame();

    EXPECT_EQ(stats.ballsStranded, 1u);
    EXPECT_EQ(stats.ballsSpawned, 1u);
    ASSERT_EQ(sim.getBalls().size(), 1u);
    EXPECT_NE(sim.getBalls()[0].getId(), 7u);
}

TEST(SimulationTest, InvalidConfigThrows)
{
    SimulationConfig config = getDefaultSimulationConfig();
    config.ball_count = 0;
    EXPECT_THROW(Simulation(blankImage(3, 3), config), std::invalid_argument);

    config = getDefaultSimulationConfig();
    config.deviation_angle_degrees = 90.0;
    EXPECT_THROW(Simulation(blankImage(3, 3), config), std::invalid_argument);
}

TEST(SimulationTest, MalformedImageThrows)
{
    BinaryImage image;
    image.width = 3;
    image.height = 3;
    image.pixels.assign(4, false);
    EXPECT_THROW(Simulation(image, seededConfig(1, 1)), GridError);
}

// Test that without edge cells nothing spawns and nothing is carved.
TEST(SimulationTest, ZeroPaddingSpawnsNothing)
{
    Simulation sim(blankImage(4, 4), seededConfig(5, 0));

    EXPECT_EQ(sim.spawnInitialBalls(), 0);
    const FrameStats stats = sim.advanceFrame();

    EXPECT_EQ(stats.ballsSpawned, 0u);
    EXPECT_EQ(stats.activeBalls, 0u);
    EXPECT_EQ(stats.carveableRemaining, 16u);
    EXPECT_FALSE(sim.isComplete());
}

// Test that exited balls are culled and replaced within the same frame.
TEST(SimulationTest, ExitedBallIsReplaced)
{
    SimulationConfig config = seededConfig(1, 2);
    Simulation sim(blankImage(4, 4), config);
    sim.addBall(Ball(7, Vector2d{ 0.2, 3.5 }, Vector2d{ -0.5, 0.0 }, config.ball_diameter));

    const FrameStats stats = sim.advanceFrame();

    EXPECT_EQ(stats.frame, 1u);
    EXPECT_EQ(stats.ballsExited, 1u);
    EXPECT_EQ(stats.ballsSpawned, 1u);
    ASSERT_EQ(sim.getBalls().size(), 1u);
    EXPECT_NE(sim.getBalls()[0].getId(), 7u);
    EXPECT_TRUE(sim.getGrid().at(sim.getBalls()[0].cell()).isEdge());
}

TEST(SimulationTest, SkipToEndResolvesEverything)
{
    Simulation sim(BinaryImage::fromRows({ ".....", ".###.", ".#.#.", ".###.", "....." }),
                   seededConfig(5, 1));
    PresentationLayer presentation;
    sim.setEventSink(&presentation);
    sim.spawnInitialBalls();
    sim.advanceFrame();

    const size_t carveable = sim.getGrid().countByState(CellState::CarveableBackground);
    const int carved = sim.skipToEnd();

    EXPECT_EQ(static_cast<size_t>(carved), carveable);
    EXPECT_TRUE(sim.isComplete());
    EXPECT_TRUE(sim.getBalls().empty());
    // The enclosed centre was reclassified as protected at construction.
    EXPECT_EQ(sim.getGrid().countByState(CellState::ProtectedText), 9u);
    for (const auto& island : sim.getIslands()) {
        EXPECT_TRUE(island.completed);
    }
    EXPECT_EQ(presentation.eventCount(CellEventType::IslandRevealed), 9u);
}

// Test that the snapshot carries grid, balls and overlays in renderer-ready JSON.
TEST(SimulationTest, SnapshotJson)
{
    Simulation sim(BinaryImage::fromRows({ "#." }), seededConfig(2, 1));
    PresentationLayer presentation;
    sim.setEventSink(&presentation);
    sim.spawnInitialBalls();
    presentation.queueEvent(CellEvent{ 1, 1, CellEventType::Exposed });

    const RenderSnapshot snapshot = sim.snapshot(&presentation);
    EXPECT_EQ(snapshot.width, 4);
    EXPECT_EQ(snapshot.height, 3);
    EXPECT_EQ(snapshot.cells.size(), 12u);
    EXPECT_EQ(snapshot.balls.size(), 2u);

    const nlohmann::json j = snapshot;
    EXPECT_EQ(j["padding"], 1);
    EXPECT_EQ(j["frame"], 0);
    EXPECT_EQ(j["cells"].size(), 12u);

    const auto& textCell = j["cells"][5];
    EXPECT_EQ(textCell["x"], 1);
    EXPECT_EQ(textCell["y"], 1);
    EXPECT_EQ(textCell["state"], "ProtectedText");
    EXPECT_EQ(textCell["overlay"], "exposed");

    EXPECT_EQ(j["balls"][0]["id"], 1);
    EXPECT_EQ(j["balls"][0]["isActive"], true);
}

// Test the free-function frame API over caller-owned state.
TEST(SimulationTest, FreeFunctionFrame)
{
    SimulationConfig config = seededConfig(5, 2);
    config.max_initial_balls = 3;

    Grid grid = buildGrid(blankImage(6, 6), config.padding);
    grid.markIsolatedCarveableAsProtected();
    std::vector<Island> islands = IslandAnalyzer().initializeIslands(grid);
    std::mt19937 rng(7);

    std::vector<Ball> balls = spawnInitialBalls(grid, config, rng);
    ASSERT_EQ(balls.size(), 3u);
    for (size_t i = 0; i < balls.size(); ++i) {
        EXPECT_EQ(balls[i].getId(), i + 1);
    }

    const FrameStats stats = advanceFrame(balls, grid, islands, config, rng);

    EXPECT_EQ(balls.size(), 5u);
    EXPECT_GE(stats.ballsSpawned, 2u);

    std::set<uint32_t> ids;
    for (const auto& ball : balls) {
        ids.insert(ball.getId());
    }
    EXPECT_EQ(ids.size(), balls.size());
    // Newcomers continue after the largest initial id.
    EXPECT_EQ(*ids.rbegin(), 3u + stats.ballsSpawned);
    EXPECT_EQ(isComplete(grid), grid.isComplete());

    auto single = spawnBall(grid, config, rng, 99);
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->getId(), 99u);
}
