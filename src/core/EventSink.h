#pragma once

namespace CarveSim {

/**
 * @brief Receiver for cosmetic events (carves, exposures, flashes).
 *
 * The grid and island analyzer emit through this so they never depend on
 * whoever draws them. A null sink means nobody is listening.
 */
template <typename EventType>
class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void queueEvent(const EventType& event) = 0;
};

} // namespace CarveSim
