#pragma once

#include "Ball.h"
#include "BinaryImage.h"
#include "CellEvent.h"
#include "CollisionEngine.h"
#include "FrameStats.h"
#include "Grid.h"
#include "IslandAnalyzer.h"
#include "RenderSnapshot.h"
#include "SimulationConfig.h"
#include "Timers.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace CarveSim {

class PresentationLayer;

/**
 * @brief Build a grid from a bitmap. Thin alias for Grid::build().
 * @throws GridError on malformed input.
 */
Grid buildGrid(const BinaryImage& image, int padding);

/**
 * @brief Create one ball at the centre of a random EdgeBoundary cell, heading
 * in a uniformly random direction at base_speed * movement_speed_multiplier.
 * @return nullopt when the grid has no edge cells.
 */
std::optional<Ball> spawnBall(
    const Grid& grid, const SimulationConfig& config, std::mt19937& rng, uint32_t id);

/**
 * @brief First spawn wave: min(ball_count, max_initial_balls) balls with ids 1..n.
 */
std::vector<Ball> spawnInitialBalls(
    const Grid& grid, const SimulationConfig& config, std::mt19937& rng);

/**
 * @brief One frame over caller-owned state. New balls continue the id sequence
 * after the largest id in `balls`.
 */
FrameStats advanceFrame(
    std::vector<Ball>& balls,
    Grid& grid,
    std::vector<Island>& islands,
    const SimulationConfig& config,
    std::mt19937& rng);

bool isComplete(const Grid& grid);

/**
 * @brief Owns everything one carving run needs: grid, balls, islands, RNG and
 * timers. Nothing here outlives the run or is shared between runs.
 *
 * Frame order: step every active ball, cull inactive ones, top the population
 * back up to ball_count, advance island animations, then count what is left
 * to carve. Grid and balls are consistent whenever advanceFrame() returns.
 */
class Simulation {
public:
    /**
     * @throws GridError for a malformed bitmap.
     * @throws std::invalid_argument for a config that fails validation.
     */
    Simulation(const BinaryImage& image, const SimulationConfig& config);

    Simulation(const Simulation&) = delete;
    Simulation& operator=(const Simulation&) = delete;

    /**
     * @return Number of balls spawned.
     */
    int spawnInitialBalls();

    FrameStats advanceFrame();

    bool isComplete() const { return grid_.isComplete(); }

    /**
     * @brief Finish instantly: complete every island, carve every remaining
     * carveable cell and retire all balls.
     * @return Number of cells carved.
     */
    int skipToEnd();

    RenderSnapshot snapshot(const PresentationLayer* presentation = nullptr) const;

    // Cosmetic events (carves, exposures, island flashes) go to `sink`.
    void setEventSink(CellEventSink* sink) { grid_.setEventSink(sink); }

    void setRandomSeed(uint32_t seed) { rng_->seed(seed); }

    // Insert a caller-made ball (scripted scenarios, tests).
    void addBall(const Ball& ball) { balls_.push_back(ball); }

    const SimulationConfig& getConfig() const { return config_; }
    const Grid& getGrid() const { return grid_; }
    Grid& getGrid() { return grid_; }
    const std::vector<Ball>& getBalls() const { return balls_; }
    const std::vector<Island>& getIslands() const { return islands_; }
    uint32_t getFrame() const { return frame_; }
    const FrameStats& getLastStats() const { return lastStats_; }
    Timers& getTimers() { return timers_; }
    std::mt19937& getRng() { return *rng_; }

private:
    SimulationConfig config_;
    Grid grid_;
    std::vector<Ball> balls_;
    std::vector<Island> islands_;
    std::unique_ptr<std::mt19937> rng_;
    Timers timers_;
    IslandAnalyzer islandAnalyzer_;
    uint32_t frame_ = 0;
    uint32_t nextBallId_ = 1;
    FrameStats lastStats_;
    bool completionLogged_ = false;
};

} // namespace CarveSim
