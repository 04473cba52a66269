#pragma once

#include "GridCalculatorBase.h"
#include "Vector2.h"
#include "bitmaps/CellBitmap.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace CarveSim {

class Grid;

/**
 * @brief A pocket of CarveableBackground/ProtectedText cells that balls cannot
 * reach from the edge.
 *
 * `boundary` holds the reachable carveable cells touching the island; once
 * none of them is carveable, the island's staged completion animation runs.
 */
struct Island {
    uint32_t id = 0;
    std::vector<Vector2i> cells;
    std::vector<Vector2i> boundary;
    bool completed = false;

    // Completion animation cursor.
    bool animating = false;
    std::vector<Vector2i> sortedSquares; // Top-to-bottom, left-to-right.
    size_t animationIndex = 0;
    int flashFrame = 0;
};

/**
 * @brief Flood-fill topology over the grid plus the per-frame island
 * completion state machine.
 *
 * Topology is computed once, before any carving. Carving only removes
 * boundary cells, so islands are never created or merged afterwards.
 */
class IslandAnalyzer : public GridCalculatorBase {
public:
    // Frames a cell is held (flashing, if protected) before it resolves.
    static constexpr int HOLD_FRAMES = 3;
    static constexpr int FRAMES_PER_CELL = HOLD_FRAMES + 1;

    IslandAnalyzer() = default;

    /**
     * @brief Cells a roaming ball can get to.
     *
     * Every EdgeBoundary cell is reachable. The BFS continues from the inner
     * padding rings through EdgeBoundary, CarveableBackground and CarvedOpen
     * cells, never through the outer ring (balls bounce off it) and never
     * through ProtectedText. With a single padding ring only the largest
     * open region touching the ring is reachable.
     */
    CellBitmap findReachableSquares(const Grid& grid) const;

    // Every cell that belongs to some island.
    CellBitmap islandMask(const Grid& grid, const std::vector<Island>& islands) const;

    /**
     * @brief Group every unreachable CarveableBackground/ProtectedText cell
     * into 4-connected islands and compute each island's boundary.
     */
    std::vector<Island> findIslands(const Grid& grid, const CellBitmap& reachable) const;

    // Reachability plus extraction in one call.
    std::vector<Island> initializeIslands(const Grid& grid) const;

    /**
     * @brief True when no boundary cell is still CarveableBackground.
     */
    bool isIslandBoundaryCarved(const Grid& grid, const Island& island) const;

    /**
     * @brief Per-frame step for every unfinished island.
     * @return Number of islands that completed during this call.
     */
    int updateIslands(Grid& grid, std::vector<Island>& islands) const;

    void startAnimation(Island& island) const;

    /**
     * @brief Advance the completion cursor by one frame.
     *
     * CarvedOpen cells are skipped immediately. Any other cell is held for
     * HOLD_FRAMES frames, then resolved on the next: protected cells are
     * revealed, carveable cells are carved.
     */
    void advanceAnimation(Grid& grid, Island& island) const;

    /**
     * @brief Resolve every remaining cell at once (skip-to-end).
     */
    void completeImmediately(Grid& grid, Island& island) const;

private:
    void resolveCell(Grid& grid, const Vector2i& pos) const;
};

} // namespace CarveSim
