#include "GridCalculatorBase.h"
#include "Grid.h"

#include <cmath>

namespace CarveSim {

const Cell& GridCalculatorBase::getCellAt(const Grid& grid, int x, int y)
{
    return grid.at(x, y);
}

bool GridCalculatorBase::isValidCell(const Grid& grid, int x, int y)
{
    return grid.inBounds(x, y);
}

Vector2i GridCalculatorBase::cellOf(const Vector2d& position)
{
    return { static_cast<int>(std::floor(position.x)), static_cast<int>(std::floor(position.y)) };
}

} // namespace CarveSim
