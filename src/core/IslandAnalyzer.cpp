#include "IslandAnalyzer.h"
#include "Grid.h"
#include "LoggingChannels.h"

#include <algorithm>
#include <deque>

namespace CarveSim {

namespace {

bool passable(CellState state)
{
    return state != CellState::ProtectedText;
}

bool islandMaterial(CellState state)
{
    return state == CellState::CarveableBackground || state == CellState::ProtectedText;
}

// Open space a roaming ball can cross. The outer ring is a wall once inside.
bool roamable(const Grid& grid, int x, int y)
{
    return grid.inBounds(x, y) && passable(grid.cellUnchecked(x, y).state)
        && !grid.isBoundaryCoordinate(x, y);
}

// BFS through roamable cells. Seeds must already be marked; returns every
// cell visited, seeds included.
std::vector<Vector2i> fillRoamable(const Grid& grid, std::deque<Vector2i> queue, CellBitmap& mask)
{
    std::vector<Vector2i> region;
    while (!queue.empty()) {
        const Vector2i pos = queue.front();
        queue.pop_front();
        region.push_back(pos);

        for (const auto& dir : GridCalculatorBase::NEIGHBORS_4) {
            const int nx = pos.x + dir.x;
            const int ny = pos.y + dir.y;
            if (roamable(grid, nx, ny) && mask.testAndSet(nx, ny)) {
                queue.push_back({ nx, ny });
            }
        }
    }
    return region;
}

} // namespace

CellBitmap IslandAnalyzer::findReachableSquares(const Grid& grid) const
{
    const int width = grid.getWidth();
    const int height = grid.getHeight();
    CellBitmap reachable(width, height);

    // Every edge cell is a spawn point. Only the inner padding rings carry
    // traffic onward.
    const auto edges = grid.edgeCells();
    std::deque<Vector2i> innerSeeds;
    for (const auto& pos : edges) {
        reachable.set(pos.x, pos.y);
        if (!grid.isBoundaryCoordinate(pos.x, pos.y)) {
            innerSeeds.push_back(pos);
        }
    }

    if (!innerSeeds.empty() || edges.empty()) {
        fillRoamable(grid, std::move(innerSeeds), reachable);
        return reachable;
    }

    // A single padding ring. Balls that step inside never leave, so the
    // largest open region touching the ring is where they roam; smaller
    // pockets are left to the island animation.
    CellBitmap visited(width, height);
    std::vector<Vector2i> largest;
    for (const auto& pos : edges) {
        for (const auto& dir : NEIGHBORS_4) {
            const int nx = pos.x + dir.x;
            const int ny = pos.y + dir.y;
            if (!roamable(grid, nx, ny) || !visited.testAndSet(nx, ny)) {
                continue;
            }
            auto region = fillRoamable(grid, std::deque<Vector2i>{ Vector2i{ nx, ny } }, visited);
            if (region.size() > largest.size()) {
                largest = std::move(region);
            }
        }
    }

    for (const auto& pos : largest) {
        reachable.set(pos.x, pos.y);
    }
    if (!largest.empty()) {
        LoggingChannels::island()->debug(
            "Single padding ring: roaming region of {} cells", largest.size());
    }
    return reachable;
}

CellBitmap IslandAnalyzer::islandMask(const Grid& grid, const std::vector<Island>& islands) const
{
    CellBitmap mask(grid.getWidth(), grid.getHeight());
    for (const auto& island : islands) {
        for (const auto& pos : island.cells) {
            mask.set(pos.x, pos.y);
        }
    }
    return mask;
}

std::vector<Island> IslandAnalyzer::findIslands(
    const Grid& grid, const CellBitmap& reachable) const
{
    const int width = grid.getWidth();
    const int height = grid.getHeight();

    // Island index per cell, -1 when the cell belongs to none.
    std::vector<int> label(static_cast<size_t>(width) * height, -1);
    auto labelAt = [&](int x, int y) -> int& { return label[static_cast<size_t>(y) * width + x]; };

    auto isCandidate = [&](int x, int y) {
        if (reachable.isSet(x, y)) return false;
        const Cell& cell = grid.cellUnchecked(x, y);
        return !cell.isEdge() && islandMaterial(cell.state);
    };

    std::vector<Island> islands;

    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            if (labelAt(x, y) >= 0 || !isCandidate(x, y)) {
                continue;
            }

            Island island;
            island.id = static_cast<uint32_t>(islands.size());
            const int index = static_cast<int>(islands.size());

            std::vector<Vector2i> stack;
            stack.push_back({ x, y });
            labelAt(x, y) = index;

            while (!stack.empty()) {
                const Vector2i pos = stack.back();
                stack.pop_back();
                island.cells.push_back(pos);

                for (const auto& dir : NEIGHBORS_4) {
                    const int nx = pos.x + dir.x;
                    const int ny = pos.y + dir.y;
                    if (!isValidCell(grid, nx, ny) || labelAt(nx, ny) >= 0) {
                        continue;
                    }
                    if (!isCandidate(nx, ny)) {
                        continue;
                    }
                    labelAt(nx, ny) = index;
                    stack.push_back({ nx, ny });
                }
            }

            islands.push_back(std::move(island));
        }
    }

    // Boundary: carveable cells outside each island that touch it.
    for (auto& island : islands) {
        CellBitmap seen(width, height);
        for (const auto& pos : island.cells) {
            for (const auto& dir : NEIGHBORS_4) {
                const int nx = pos.x + dir.x;
                const int ny = pos.y + dir.y;
                if (!isValidCell(grid, nx, ny) || labelAt(nx, ny) == static_cast<int>(island.id)) {
                    continue;
                }
                if (grid.cellUnchecked(nx, ny).isCarveable() && seen.testAndSet(nx, ny)) {
                    island.boundary.push_back({ nx, ny });
                }
            }
        }

        std::sort(island.cells.begin(), island.cells.end(), [](const auto& a, const auto& b) {
            return a.y != b.y ? a.y < b.y : a.x < b.x;
        });

        LoggingChannels::island()->debug(
            "Island {}: {} cells, {} boundary cells",
            island.id,
            island.cells.size(),
            island.boundary.size());
    }

    return islands;
}

std::vector<Island> IslandAnalyzer::initializeIslands(const Grid& grid) const
{
    const CellBitmap reachable = findReachableSquares(grid);
    auto islands = findIslands(grid, reachable);

    LoggingChannels::island()->info(
        "Found {} islands ({} of {} cells reachable from the edge)",
        islands.size(),
        reachable.count(),
        grid.getWidth() * grid.getHeight());
    return islands;
}

bool IslandAnalyzer::isIslandBoundaryCarved(const Grid& grid, const Island& island) const
{
    return std::none_of(island.boundary.begin(), island.boundary.end(), [&](const Vector2i& pos) {
        return getCellAt(grid, pos.x, pos.y).isCarveable();
    });
}

int IslandAnalyzer::updateIslands(Grid& grid, std::vector<Island>& islands) const
{
    int completedNow = 0;

    for (auto& island : islands) {
        if (island.completed) {
            continue;
        }

        if (island.animating) {
            advanceAnimation(grid, island);
            if (island.completed) {
                completedNow++;
            }
        }
        else if (isIslandBoundaryCarved(grid, island)) {
            startAnimation(island);
        }
    }

    return completedNow;
}

void IslandAnalyzer::startAnimation(Island& island) const
{
    // Cells are already kept in row-major order.
    island.sortedSquares = island.cells;
    island.animationIndex = 0;
    island.flashFrame = 0;
    island.animating = true;

    LoggingChannels::island()->info(
        "Island {} boundary carved, animating {} cells", island.id, island.sortedSquares.size());
}

void IslandAnalyzer::advanceAnimation(Grid& grid, Island& island) const
{
    auto& squares = island.sortedSquares;

    while (island.animationIndex < squares.size()) {
        const Vector2i& pos = squares[island.animationIndex];
        if (!getCellAt(grid, pos.x, pos.y).isCarved()) {
            break;
        }
        island.animationIndex++;
        island.flashFrame = 0;
    }

    if (island.animationIndex < squares.size()) {
        const Vector2i pos = squares[island.animationIndex];
        island.flashFrame++;

        if (island.flashFrame <= HOLD_FRAMES) {
            if (getCellAt(grid, pos.x, pos.y).isProtected()) {
                grid.emit(CellEvent{ pos.x, pos.y, CellEventType::IslandFlash, island.flashFrame });
            }
            return;
        }

        resolveCell(grid, pos);
        island.animationIndex++;
        island.flashFrame = 0;
    }

    if (island.animationIndex >= squares.size()) {
        island.completed = true;
        island.animating = false;
        LoggingChannels::island()->info("Island {} completed", island.id);
    }
}

void IslandAnalyzer::completeImmediately(Grid& grid, Island& island) const
{
    if (island.completed) {
        return;
    }

    for (const auto& pos : island.cells) {
        resolveCell(grid, pos);
    }

    island.animating = false;
    island.animationIndex = island.cells.size();
    island.flashFrame = 0;
    island.completed = true;
}

void IslandAnalyzer::resolveCell(Grid& grid, const Vector2i& pos) const
{
    const Cell& cell = getCellAt(grid, pos.x, pos.y);
    if (cell.isProtected()) {
        grid.emit(CellEvent{ pos.x, pos.y, CellEventType::IslandRevealed });
    }
    else if (cell.isCarveable()) {
        auto result = grid.trySetState(pos.x, pos.y, CellState::CarvedOpen);
        if (result.isError()) {
            LoggingChannels::island()->error(
                "Island cell ({}, {}) could not be carved: {}",
                pos.x,
                pos.y,
                result.errorValue().what());
        }
    }
}

} // namespace CarveSim
