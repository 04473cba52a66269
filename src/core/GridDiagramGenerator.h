#pragma once

#include <string>
#include <vector>

namespace CarveSim {

class Ball;
class Grid;
class PresentationLayer;

/**
 * @brief Text renderings of a grid for logs, tests and the CLI.
 */
class GridDiagramGenerator {
public:
    /**
     * @brief One character per cell: '#' protected, '.' carveable, ' ' carved,
     * '+' edge boundary, 'o' where an active ball centre sits. Rows end in '\n'.
     */
    static std::string generateAsciiDiagram(
        const Grid& grid, const std::vector<Ball>& balls = {});

    // Framed emoji rendering. Overlays from `presentation` tint protected cells.
    static std::string generateEmojiDiagram(
        const Grid& grid,
        const std::vector<Ball>& balls = {},
        const PresentationLayer* presentation = nullptr);
};

} // namespace CarveSim
