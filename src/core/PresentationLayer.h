#pragma once

#include "CellEvent.h"
#include "Vector2.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <unordered_map>

namespace CarveSim {

enum class OverlayTag : uint8_t {
    None = 0,
    Exposed,  // Protected cell uncovered by a neighbouring carve.
    Flash,    // Island cell mid-reveal.
    Revealed, // Island cell finished revealing. Sticky.
};

const char* getOverlayTagName(OverlayTag tag);

void to_json(nlohmann::json& j, OverlayTag tag);

/**
 * @brief Coordinate-keyed cosmetic overlay, fed only by CellEvents.
 *
 * Keeps renderer-facing decoration out of simulation state. Attach it to a
 * Simulation (or Grid) as the event sink.
 */
class PresentationLayer : public CellEventSink {
public:
    void queueEvent(const CellEvent& event) override;

    OverlayTag overlayAt(int x, int y) const;

    // Last flash frame seen for a cell (0 if none).
    int flashFrameAt(int x, int y) const;

    size_t eventCount(CellEventType type) const
    {
        return eventCounts_[static_cast<size_t>(type)];
    }

    size_t overlayCount() const { return overlays_.size(); }

    void clear();

private:
    struct Entry {
        OverlayTag tag = OverlayTag::None;
        int flashFrame = 0;
    };

    std::unordered_map<Vector2i, Entry> overlays_;
    std::array<size_t, 4> eventCounts_{};
};

} // namespace CarveSim
