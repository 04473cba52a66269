#pragma once

#include "BinaryImage.h"
#include "Cell.h"
#include "CellEvent.h"
#include "Errors.h"
#include "Result.h"
#include "Vector2.h"

#include <array>
#include <cstddef>
#include <variant>
#include <vector>

namespace CarveSim {

/**
 * @brief Rectangular cell container and the cell state machine.
 *
 * Layout: `padding` rings of EdgeBoundary around an interior copied from a
 * BinaryImage (true -> ProtectedText, false -> CarveableBackground). Cells
 * are stored row-major and never move; only their state changes, and only
 * through setState()/trySetState().
 *
 * When an event sink is attached, carving emits CellEvent::Carved for the
 * cell and CellEvent::Exposed for each orthogonally adjacent protected cell.
 */
class Grid {
public:
    /**
     * @brief Build a grid from a bitmap.
     * @throws GridError on non-positive dimensions, negative padding, or a
     *         pixel count that does not match width * height.
     */
    static Grid build(const BinaryImage& image, int padding);

    int getWidth() const { return width_; }
    int getHeight() const { return height_; }
    int getPadding() const { return padding_; }

    bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < width_ && y < height_; }

    // True for the outermost ring only.
    bool isBoundaryCoordinate(int x, int y) const
    {
        return x == 0 || y == 0 || x == width_ - 1 || y == height_ - 1;
    }

    /**
     * @brief Cell access with bounds checking.
     * @throws GridError when (x, y) is outside the grid.
     */
    const Cell& at(int x, int y) const;
    const Cell& at(const Vector2i& pos) const { return at(pos.x, pos.y); }

    // Unchecked access for hot loops that already validated bounds.
    const Cell& cellUnchecked(int x, int y) const
    {
        return cells_[static_cast<size_t>(y) * width_ + x];
    }

    /**
     * @brief Whether a ball entering (x, y) collides with it.
     *
     * Carveable and protected cells always collide; EdgeBoundary only on the
     * outermost ring. Out-of-bounds coordinates are not collidable.
     */
    bool isCollidable(int x, int y) const;

    /**
     * @brief Apply a state transition.
     * @throws GridError on invalid coordinates or an illegal transition.
     */
    void setState(int x, int y, CellState newState);

    /**
     * @brief Same as setState() but reports failure as a value.
     */
    Result<std::monostate, GridError> trySetState(int x, int y, CellState newState);

    /**
     * @brief Reclassify carveable pockets walled in by text.
     *
     * A CarveableBackground cell whose 8 neighbours include ProtectedText but
     * no CarveableBackground or EdgeBoundary becomes ProtectedText. Build-time
     * only; this bypasses the transition table.
     *
     * @return Number of reclassified cells.
     */
    int markIsolatedCarveableAsProtected();

    size_t countByState(CellState state) const
    {
        return stateCounts_[static_cast<size_t>(state)];
    }

    bool isComplete() const { return countByState(CellState::CarveableBackground) == 0; }

    std::vector<Vector2i> edgeCells() const;

    const std::vector<Cell>& getCells() const { return cells_; }

    void setEventSink(CellEventSink* sink) { eventSink_ = sink; }
    CellEventSink* getEventSink() const { return eventSink_; }

    // Forward an event to the attached sink, if any.
    void emit(const CellEvent& event) const;

private:
    Grid(int width, int height, int padding);

    Cell& mutableAt(int x, int y) { return cells_[static_cast<size_t>(y) * width_ + x]; }
    void reclassify(Cell& cell, CellState newState);

    int width_ = 0;
    int height_ = 0;
    int padding_ = 0;
    std::vector<Cell> cells_;
    std::array<size_t, 4> stateCounts_{};
    CellEventSink* eventSink_ = nullptr;
};

} // namespace CarveSim
