#include "PresentationLayer.h"

namespace CarveSim {

const char* getOverlayTagName(OverlayTag tag)
{
    switch (tag) {
        case OverlayTag::None:
            return "none";
        case OverlayTag::Exposed:
            return "exposed";
        case OverlayTag::Flash:
            return "flash";
        case OverlayTag::Revealed:
            return "revealed";
    }
    return "unknown";
}

void to_json(nlohmann::json& j, OverlayTag tag)
{
    j = getOverlayTagName(tag);
}

void PresentationLayer::queueEvent(const CellEvent& event)
{
    eventCounts_[static_cast<size_t>(event.type)]++;

    const Vector2i pos{ event.x, event.y };
    switch (event.type) {
        case CellEventType::Carved:
            overlays_.erase(pos);
            break;
        case CellEventType::Exposed: {
            auto& entry = overlays_[pos];
            if (entry.tag != OverlayTag::Revealed) {
                entry.tag = OverlayTag::Exposed;
            }
            break;
        }
        case CellEventType::IslandFlash: {
            auto& entry = overlays_[pos];
            entry.tag = OverlayTag::Flash;
            entry.flashFrame = event.flashFrame;
            break;
        }
        case CellEventType::IslandRevealed: {
            auto& entry = overlays_[pos];
            entry.tag = OverlayTag::Revealed;
            entry.flashFrame = 0;
            break;
        }
    }
}

OverlayTag PresentationLayer::overlayAt(int x, int y) const
{
    auto it = overlays_.find({ x, y });
    return it == overlays_.end() ? OverlayTag::None : it->second.tag;
}

int PresentationLayer::flashFrameAt(int x, int y) const
{
    auto it = overlays_.find({ x, y });
    return it == overlays_.end() ? 0 : it->second.flashFrame;
}

void PresentationLayer::clear()
{
    overlays_.clear();
    eventCounts_.fill(0);
}

} // namespace CarveSim
