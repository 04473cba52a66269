#include "GridDiagramGenerator.h"
#include "Ball.h"
#include "Grid.h"
#include "PresentationLayer.h"

#include <sstream>
#include <unordered_set>

namespace CarveSim {

namespace {

std::unordered_set<Vector2i> ballCells(const Grid& grid, const std::vector<Ball>& balls)
{
    std::unordered_set<Vector2i> cells;
    for (const auto& ball : balls) {
        if (!ball.isActive()) {
            continue;
        }
        const Vector2i cell = ball.cell();
        if (grid.inBounds(cell.x, cell.y)) {
            cells.insert(cell);
        }
    }
    return cells;
}

char stateChar(CellState state)
{
    switch (state) {
        case CellState::CarveableBackground:
            return '.';
        case CellState::ProtectedText:
            return '#';
        case CellState::CarvedOpen:
            return ' ';
        case CellState::EdgeBoundary:
            return '+';
    }
    return '?';
}

const char* stateEmoji(CellState state, OverlayTag overlay)
{
    switch (state) {
        case CellState::CarveableBackground:
            return "🟫";
        case CellState::ProtectedText:
            switch (overlay) {
                case OverlayTag::Exposed:
                    return "🟨";
                case OverlayTag::Flash:
                    return "🟧";
                case OverlayTag::Revealed:
                    return "🟩";
                case OverlayTag::None:
                    break;
            }
            return "⬛";
        case CellState::CarvedOpen:
            return "⬜";
        case CellState::EdgeBoundary:
            return "🧱";
    }
    return "❓";
}

} // namespace

std::string GridDiagramGenerator::generateAsciiDiagram(
    const Grid& grid, const std::vector<Ball>& balls)
{
    const auto occupied = ballCells(grid, balls);

    std::ostringstream diagram;
    for (int y = 0; y < grid.getHeight(); ++y) {
        for (int x = 0; x < grid.getWidth(); ++x) {
            if (occupied.contains(Vector2i{ x, y })) {
                diagram << 'o';
            }
            else {
                diagram << stateChar(grid.cellUnchecked(x, y).state);
            }
        }
        diagram << '\n';
    }
    return diagram.str();
}

std::string GridDiagramGenerator::generateEmojiDiagram(
    const Grid& grid, const std::vector<Ball>& balls, const PresentationLayer* presentation)
{
    const auto occupied = ballCells(grid, balls);
    const int width = grid.getWidth();

    std::ostringstream diagram;

    diagram << "┏";
    for (int x = 0; x < width; ++x) {
        diagram << "━━";
    }
    diagram << "┓\n";

    for (int y = 0; y < grid.getHeight(); ++y) {
        diagram << "┃";
        for (int x = 0; x < width; ++x) {
            if (occupied.contains(Vector2i{ x, y })) {
                diagram << "⚪";
                continue;
            }
            const OverlayTag overlay =
                presentation ? presentation->overlayAt(x, y) : OverlayTag::None;
            diagram << stateEmoji(grid.cellUnchecked(x, y).state, overlay);
        }
        diagram << "┃\n";
    }

    diagram << "┗";
    for (int x = 0; x < width; ++x) {
        diagram << "━━";
    }
    diagram << "┛\n";

    return diagram.str();
}

} // namespace CarveSim
