#include "RenderSnapshot.h"
#include "Ball.h"
#include "Grid.h"

namespace CarveSim {

RenderSnapshot makeRenderSnapshot(
    const Grid& grid,
    const std::vector<Ball>& balls,
    uint32_t frame,
    const PresentationLayer* presentation)
{
    RenderSnapshot snapshot{ grid.getWidth(), grid.getHeight(), grid.getPadding(), frame, {}, {} };

    snapshot.cells.reserve(grid.getCells().size());
    for (const auto& cell : grid.getCells()) {
        const OverlayTag overlay =
            presentation ? presentation->overlayAt(cell.x, cell.y) : OverlayTag::None;
        snapshot.cells.push_back(CellView{ cell.x, cell.y, cell.state, overlay });
    }

    snapshot.balls.reserve(balls.size());
    for (const auto& ball : balls) {
        snapshot.balls.push_back(BallView{ ball.getId(),
                                           ball.getPosition().x,
                                           ball.getPosition().y,
                                           ball.getDiameter(),
                                           ball.isActive() });
    }

    return snapshot;
}

} // namespace CarveSim
