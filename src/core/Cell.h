#pragma once

#include "CellState.h"
#include "Vector2.h"

namespace CarveSim {

/**
 * @brief One grid unit. Identity is fixed at build time; only `state`
 * changes, and only through Grid::setState().
 */
struct Cell {
    int x = 0;
    int y = 0;
    CellState state = CellState::CarveableBackground;

    Vector2i position() const { return { x, y }; }

    bool isCarveable() const { return state == CellState::CarveableBackground; }
    bool isProtected() const { return state == CellState::ProtectedText; }
    bool isCarved() const { return state == CellState::CarvedOpen; }
    bool isEdge() const { return state == CellState::EdgeBoundary; }

    // Cell centre in continuous grid space.
    Vector2d center() const { return { x + 0.5, y + 0.5 }; }
};

} // namespace CarveSim
