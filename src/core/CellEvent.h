#pragma once

#include "EventSink.h"
#include <cstdint>

namespace CarveSim {

enum class CellEventType : uint8_t {
    Carved = 0,     // Cell went CarveableBackground -> CarvedOpen.
    Exposed,        // Protected cell next to a fresh carve.
    IslandFlash,    // Protected island cell during its hold frames.
    IslandRevealed, // Protected island cell after its hold frames.
};

/**
 * @brief Cosmetic notification about a single cell. Carries no simulation
 * state; the receiver decides how (or whether) to draw it.
 */
struct CellEvent {
    int x = 0;
    int y = 0;
    CellEventType type = CellEventType::Carved;
    int flashFrame = 0; // 1..3 for IslandFlash, otherwise 0.
};

using CellEventSink = EventSink<CellEvent>;

} // namespace CarveSim
