#include "Grid.h"
#include "LoggingChannels.h"

#include <string>

namespace CarveSim {

namespace {

std::string coordString(int x, int y)
{
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

} // namespace

Grid::Grid(int width, int height, int padding) : width_(width), height_(height), padding_(padding)
{
    cells_.reserve(static_cast<size_t>(width) * height);
}

Grid Grid::build(const BinaryImage& image, int padding)
{
    if (image.width <= 0 || image.height <= 0) {
        throw GridError(
            "Bitmap dimensions must be positive, got " + std::to_string(image.width) + "x"
            + std::to_string(image.height));
    }
    if (padding < 0) {
        throw GridError("Padding must be non-negative, got " + std::to_string(padding));
    }

    const size_t expected = static_cast<size_t>(image.width) * image.height;
    if (image.pixels.size() != expected) {
        throw GridError(
            "Bitmap has " + std::to_string(image.pixels.size()) + " pixels, expected "
            + std::to_string(expected));
    }

    Grid grid(image.width + 2 * padding, image.height + 2 * padding, padding);

    for (int y = 0; y < grid.height_; ++y) {
        for (int x = 0; x < grid.width_; ++x) {
            const int ix = x - padding;
            const int iy = y - padding;

            CellState state = CellState::EdgeBoundary;
            if (ix >= 0 && iy >= 0 && ix < image.width && iy < image.height) {
                state = image.at(ix, iy) ? CellState::ProtectedText
                                         : CellState::CarveableBackground;
            }

            grid.cells_.push_back(Cell{ x, y, state });
            grid.stateCounts_[static_cast<size_t>(state)]++;
        }
    }

    LoggingChannels::grid()->debug(
        "Built {}x{} grid (padding {}): {} carveable, {} protected, {} edge",
        grid.width_,
        grid.height_,
        padding,
        grid.countByState(CellState::CarveableBackground),
        grid.countByState(CellState::ProtectedText),
        grid.countByState(CellState::EdgeBoundary));

    return grid;
}

const Cell& Grid::at(int x, int y) const
{
    if (!inBounds(x, y)) {
        throw GridError("Coordinates " + coordString(x, y) + " outside grid");
    }
    return cellUnchecked(x, y);
}

bool Grid::isCollidable(int x, int y) const
{
    if (!inBounds(x, y)) {
        return false;
    }

    switch (cellUnchecked(x, y).state) {
        case CellState::CarveableBackground:
        case CellState::ProtectedText:
            return true;
        case CellState::EdgeBoundary:
            return isBoundaryCoordinate(x, y);
        case CellState::CarvedOpen:
            return false;
    }
    return false;
}

void Grid::setState(int x, int y, CellState newState)
{
    auto result = trySetState(x, y, newState);
    if (result.isError()) {
        throw result.errorValue();
    }
}

Result<std::monostate, GridError> Grid::trySetState(int x, int y, CellState newState)
{
    if (!inBounds(x, y)) {
        return Result<std::monostate, GridError>::error(
            GridError("Cannot set state at " + coordString(x, y) + ": outside grid"));
    }

    Cell& cell = mutableAt(x, y);
    if (!isValidTransition(cell.state, newState)) {
        return Result<std::monostate, GridError>::error(GridError(
            std::string("Illegal transition ") + getCellStateName(cell.state) + " -> "
            + getCellStateName(newState) + " at " + coordString(x, y)));
    }

    reclassify(cell, newState);
    LoggingChannels::grid()->trace("Carved {}", coordString(x, y));

    // Cosmetic side effects.
    emit(CellEvent{ x, y, CellEventType::Carved });

    static constexpr int dirs[4][2] = { { 0, -1 }, { 1, 0 }, { 0, 1 }, { -1, 0 } };
    for (const auto& dir : dirs) {
        const int nx = x + dir[0];
        const int ny = y + dir[1];
        if (inBounds(nx, ny) && cellUnchecked(nx, ny).isProtected()) {
            emit(CellEvent{ nx, ny, CellEventType::Exposed });
        }
    }

    return Result<std::monostate, GridError>::okay();
}

int Grid::markIsolatedCarveableAsProtected()
{
    // Collect first so the outcome does not depend on scan order.
    std::vector<size_t> isolated;

    for (int y = 0; y < height_; ++y) {
        for (int x = 0; x < width_; ++x) {
            if (!cellUnchecked(x, y).isCarveable()) {
                continue;
            }

            bool hasProtected = false;
            bool hasOpenNeighbor = false;
            for (int dy = -1; dy <= 1 && !hasOpenNeighbor; ++dy) {
                for (int dx = -1; dx <= 1; ++dx) {
                    if (dx == 0 && dy == 0) continue;
                    const int nx = x + dx;
                    const int ny = y + dy;
                    if (!inBounds(nx, ny)) continue;

                    const CellState s = cellUnchecked(nx, ny).state;
                    if (s == CellState::ProtectedText) {
                        hasProtected = true;
                    }
                    else if (s == CellState::CarveableBackground || s == CellState::EdgeBoundary) {
                        hasOpenNeighbor = true;
                        break;
                    }
                }
            }

            if (hasProtected && !hasOpenNeighbor) {
                isolated.push_back(static_cast<size_t>(y) * width_ + x);
            }
        }
    }

    for (size_t index : isolated) {
        reclassify(cells_[index], CellState::ProtectedText);
    }

    if (!isolated.empty()) {
        LoggingChannels::grid()->debug(
            "Reclassified {} isolated carveable cells as protected", isolated.size());
    }
    return static_cast<int>(isolated.size());
}

std::vector<Vector2i> Grid::edgeCells() const
{
    std::vector<Vector2i> result;
    result.reserve(countByState(CellState::EdgeBoundary));
    for (const auto& cell : cells_) {
        if (cell.isEdge()) {
            result.push_back(cell.position());
        }
    }
    return result;
}

void Grid::emit(const CellEvent& event) const
{
    if (eventSink_) {
        eventSink_->queueEvent(event);
    }
}

void Grid::reclassify(Cell& cell, CellState newState)
{
    stateCounts_[static_cast<size_t>(cell.state)]--;
    stateCounts_[static_cast<size_t>(newState)]++;
    cell.state = newState;
}

} // namespace CarveSim
