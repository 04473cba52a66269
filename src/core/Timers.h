#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace CarveSim {

// Timer names used by the frame driver. Sections nest inside FRAME.
namespace FrameTimer {
inline constexpr const char* FRAME = "advance_frame";
inline constexpr const char* ADVANCE_BALLS = "advance_balls";
inline constexpr const char* CULL_BALLS = "cull_balls";
inline constexpr const char* SPAWN_BALLS = "spawn_balls";
inline constexpr const char* UPDATE_ISLANDS = "update_islands";
inline constexpr const char* COUNT_CELLS = "count_cells";

inline constexpr std::array<const char*, 5> SECTIONS = {
    ADVANCE_BALLS, CULL_BALLS, SPAWN_BALLS, UPDATE_ISLANDS, COUNT_CELLS
};
} // namespace FrameTimer

/**
 * @brief Named accumulating wall-clock timers for frame sections.
 *
 * Not thread-safe; owned by the single simulation thread.
 */
class Timers {
public:
    // Starting an already-running timer is a no-op.
    void startTimer(const std::string& name);

    // Returns the accumulated milliseconds, or -1 for an unknown timer.
    double stopTimer(const std::string& name);

    bool hasTimer(const std::string& name) const;

    // Includes the in-flight session of a running timer. -1 for an unknown timer.
    double getAccumulatedTime(const std::string& name) const;

    uint32_t getCallCount(const std::string& name) const;

    void clear() { entries_.clear(); }

    // Frame total, then each FrameTimer section as a share of it.
    void dumpTimerStats(std::ostream& out) const;
    void dumpTimerStats() const;

    std::vector<std::string> getAllTimerNames() const;

    // {name: {total_ms, avg_ms, calls}}.
    nlohmann::json exportAllTimersAsJson() const;

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        Clock::time_point runningSince;
        double totalMs = 0.0;
        uint32_t calls = 0;
        bool running = false;

        double totalIncludingRunning() const;
        double averageMs() const;
    };

    const Entry* find(const std::string& name) const;

    std::unordered_map<std::string, Entry> entries_;
};

} // namespace CarveSim
