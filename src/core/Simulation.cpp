#include "Simulation.h"
#include "LoggingChannels.h"
#include "ScopeTimer.h"

#include <algorithm>
#include <numbers>
#include <stdexcept>

namespace CarveSim {

namespace {

const CollisionEngine& collisionEngine()
{
    static const CollisionEngine engine;
    return engine;
}

SimulationConfig checkedConfig(const SimulationConfig& config)
{
    auto valid = validateSimulationConfig(config);
    if (valid.isError()) {
        throw std::invalid_argument("Invalid simulation config: " + valid.errorValue().message);
    }
    return config;
}

std::unique_ptr<std::mt19937> makeRng(uint32_t seed)
{
    if (seed == 0) {
        std::random_device rd;
        seed = rd();
    }
    LoggingChannels::sim()->debug("Random seed: {}", seed);
    return std::make_unique<std::mt19937>(seed);
}

std::optional<Ball> spawnFromEdges(
    const std::vector<Vector2i>& edges,
    const SimulationConfig& config,
    std::mt19937& rng,
    uint32_t id)
{
    if (edges.empty()) {
        return std::nullopt;
    }

    std::uniform_int_distribution<size_t> pick(0, edges.size() - 1);
    std::uniform_real_distribution<double> heading(0.0, 2.0 * std::numbers::pi);

    const Vector2i& cell = edges[pick(rng)];
    const Vector2d position{ cell.x + 0.5, cell.y + 0.5 };
    const double speed = config.base_speed * config.movement_speed_multiplier;
    const Vector2d velocity = Vector2d::fromAngle(heading(rng), speed);

    return Ball(id, position, velocity, config.ball_diameter);
}

uint32_t countActive(const std::vector<Ball>& balls)
{
    return static_cast<uint32_t>(
        std::count_if(balls.begin(), balls.end(), [](const Ball& b) { return b.isActive(); }));
}

/**
 * @brief Shared frame body for Simulation and the free-function API.
 */
FrameStats runFrame(
    std::vector<Ball>& balls,
    Grid& grid,
    std::vector<Island>& islands,
    const SimulationConfig& config,
    std::mt19937& rng,
    const std::vector<Vector2i>& edges,
    uint32_t& nextBallId,
    Timers& timers)
{
    ScopeTimer frameTimer(timers, FrameTimer::FRAME);
    FrameStats stats;

    {
        ScopeTimer timer(timers, FrameTimer::ADVANCE_BALLS);
        for (auto& ball : balls) {
            if (!ball.isActive()) {
                continue;
            }

            stats.ballsUpdated++;
            auto result = collisionEngine().advanceBall(ball, grid, config, rng);
            if (result.isError()) {
                LoggingChannels::collision()->warn(
                    "Deactivating ball: {}", result.errorValue().message);
                ball.deactivate();
                stats.ballsFaulted++;
                continue;
            }

            switch (result.value().kind) {
                case BallStepKind::Carved:
                    stats.ballsCarved++;
                    break;
                case BallStepKind::Bounced:
                    stats.ballsBounced++;
                    break;
                case BallStepKind::Exited:
                    stats.ballsExited++;
                    break;
                case BallStepKind::Moved:
                case BallStepKind::Inactive:
                    break;
            }
        }
    }

    {
        ScopeTimer timer(timers, FrameTimer::CULL_BALLS);

        // A ball that slipped into an island from the outer ring can never
        // reach the open region again. Retire it so a fresh one spawns.
        if (!islands.empty()) {
            const CellBitmap inIsland = IslandAnalyzer().islandMask(grid, islands);
            for (auto& ball : balls) {
                const Vector2i cell = ball.cell();
                if (ball.isActive() && inIsland.isSetSafe(cell.x, cell.y)) {
                    LoggingChannels::sim()->debug(
                        "Retiring ball {} stranded at {}", ball.getId(), cell.toString());
                    ball.deactivate();
                    stats.ballsStranded++;
                }
            }
        }

        balls.erase(
            std::remove_if(
                balls.begin(), balls.end(), [](const Ball& b) { return !b.isActive(); }),
            balls.end());
    }

    {
        ScopeTimer timer(timers, FrameTimer::SPAWN_BALLS);
        while (balls.size() < static_cast<size_t>(config.ball_count)) {
            auto ball = spawnFromEdges(edges, config, rng, nextBallId);
            if (!ball) {
                break;
            }
            nextBallId++;
            balls.push_back(*ball);
            stats.ballsSpawned++;
        }
    }

    {
        ScopeTimer timer(timers, FrameTimer::UPDATE_ISLANDS);
        stats.islandsCompleted =
            static_cast<uint32_t>(IslandAnalyzer().updateIslands(grid, islands));
    }

    {
        ScopeTimer timer(timers, FrameTimer::COUNT_CELLS);
        stats.activeBalls = countActive(balls);
        stats.carveableRemaining =
            static_cast<uint32_t>(grid.countByState(CellState::CarveableBackground));
    }
    return stats;
}

} // namespace

Grid buildGrid(const BinaryImage& image, int padding)
{
    return Grid::build(image, padding);
}

std::optional<Ball> spawnBall(
    const Grid& grid, const SimulationConfig& config, std::mt19937& rng, uint32_t id)
{
    return spawnFromEdges(grid.edgeCells(), config, rng, id);
}

std::vector<Ball> spawnInitialBalls(
    const Grid& grid, const SimulationConfig& config, std::mt19937& rng)
{
    const auto edges = grid.edgeCells();
    const int count = std::min(config.ball_count, config.max_initial_balls);

    std::vector<Ball> balls;
    balls.reserve(count);
    for (int i = 0; i < count; ++i) {
        auto ball = spawnFromEdges(edges, config, rng, static_cast<uint32_t>(i + 1));
        if (!ball) {
            LoggingChannels::sim()->warn("Grid has no edge cells, cannot spawn balls");
            break;
        }
        balls.push_back(*ball);
    }
    return balls;
}

FrameStats advanceFrame(
    std::vector<Ball>& balls,
    Grid& grid,
    std::vector<Island>& islands,
    const SimulationConfig& config,
    std::mt19937& rng)
{
    uint32_t nextBallId = 1;
    for (const auto& ball : balls) {
        nextBallId = std::max(nextBallId, ball.getId() + 1);
    }

    Timers timers;
    return runFrame(balls, grid, islands, config, rng, grid.edgeCells(), nextBallId, timers);
}

bool isComplete(const Grid& grid)
{
    return grid.isComplete();
}

Simulation::Simulation(const BinaryImage& image, const SimulationConfig& config)
    : config_(checkedConfig(config)),
      grid_(Grid::build(image, config_.padding)),
      rng_(makeRng(config_.seed))
{
    grid_.markIsolatedCarveableAsProtected();
    islands_ = islandAnalyzer_.initializeIslands(grid_);

    LoggingChannels::sim()->info(
        "Simulation ready: {}x{} grid, {} carveable cells, {} islands, target {} balls",
        grid_.getWidth(),
        grid_.getHeight(),
        grid_.countByState(CellState::CarveableBackground),
        islands_.size(),
        config_.ball_count);
}

int Simulation::spawnInitialBalls()
{
    ScopeTimer timer(timers_, FrameTimer::SPAWN_BALLS);

    auto spawned = CarveSim::spawnInitialBalls(grid_, config_, *rng_);
    for (auto& ball : spawned) {
        balls_.emplace_back(
            nextBallId_++, ball.getPosition(), ball.getVelocity(), ball.getDiameter());
    }

    LoggingChannels::sim()->debug("Spawned {} initial balls", spawned.size());
    return static_cast<int>(spawned.size());
}

FrameStats Simulation::advanceFrame()
{
    frame_++;
    const auto edges = grid_.edgeCells();
    FrameStats stats =
        runFrame(balls_, grid_, islands_, config_, *rng_, edges, nextBallId_, timers_);
    stats.frame = frame_;
    lastStats_ = stats;

    LoggingChannels::sim()->debug(
        "Frame {}: {} active, {} carved, {} bounced, {} faulted, {} carveable left",
        frame_,
        stats.activeBalls,
        stats.ballsCarved,
        stats.ballsBounced,
        stats.ballsFaulted,
        stats.carveableRemaining);

    if (stats.carveableRemaining == 0 && !completionLogged_) {
        completionLogged_ = true;
        LoggingChannels::sim()->info("Carving complete after {} frames", frame_);
    }

    return stats;
}

int Simulation::skipToEnd()
{
    for (auto& island : islands_) {
        islandAnalyzer_.completeImmediately(grid_, island);
    }

    int carved = 0;
    for (int y = 0; y < grid_.getHeight(); ++y) {
        for (int x = 0; x < grid_.getWidth(); ++x) {
            if (grid_.cellUnchecked(x, y).isCarveable()) {
                grid_.setState(x, y, CellState::CarvedOpen);
                carved++;
            }
        }
    }

    for (auto& ball : balls_) {
        ball.deactivate();
    }
    balls_.clear();

    LoggingChannels::sim()->info("Skipped to end at frame {}, carved {} cells", frame_, carved);
    return carved;
}

RenderSnapshot Simulation::snapshot(const PresentationLayer* presentation) const
{
    return makeRenderSnapshot(grid_, balls_, frame_, presentation);
}

} // namespace CarveSim
