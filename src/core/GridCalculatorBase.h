#pragma once

#include "Vector2.h"

#include <array>

namespace CarveSim {

class Grid;
struct Cell;

/**
 * @brief Base class for the stateless calculators that read and mutate a Grid
 * (collision engine, bounce planner, island analyzer).
 *
 * Provides shared bounds-checked access and neighbourhood tables.
 */
class GridCalculatorBase {
public:
    GridCalculatorBase() = default;
    virtual ~GridCalculatorBase() = default;

    // Orthogonal neighbour offsets: up, right, down, left.
    static constexpr std::array<Vector2i, 4> NEIGHBORS_4 = {
        { { 0, -1 }, { 1, 0 }, { 0, 1 }, { -1, 0 } }
    };

    // Offset to the surface of a struck square when resolving a collision.
    static constexpr double RESOLVE_EPSILON = 1e-6;

protected:
    /**
     * @brief Get cell at specific coordinates.
     * @throws GridError when (x, y) is outside the grid.
     */
    static const Cell& getCellAt(const Grid& grid, int x, int y);

    static bool isValidCell(const Grid& grid, int x, int y);

    // Cell containing a continuous position.
    static Vector2i cellOf(const Vector2d& position);
};

} // namespace CarveSim
