#include "Timers.h"

#include <iostream>
#include <nlohmann/json.hpp>
#include <spdlog/fmt/fmt.h>

namespace CarveSim {

double Timers::Entry::totalIncludingRunning() const
{
    if (!running) {
        return totalMs;
    }
    const std::chrono::duration<double, std::milli> inFlight = Clock::now() - runningSince;
    return totalMs + inFlight.count();
}

double Timers::Entry::averageMs() const
{
    return calls > 0 ? totalIncludingRunning() / calls : 0.0;
}

const Timers::Entry* Timers::find(const std::string& name) const
{
    const auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

void Timers::startTimer(const std::string& name)
{
    Entry& entry = entries_[name];
    if (entry.running) {
        return;
    }
    entry.runningSince = Clock::now();
    entry.running = true;
    entry.calls++;
}

double Timers::stopTimer(const std::string& name)
{
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return -1.0;
    }

    Entry& entry = it->second;
    entry.totalMs = entry.totalIncludingRunning();
    entry.running = false;
    return entry.totalMs;
}

bool Timers::hasTimer(const std::string& name) const
{
    return find(name) != nullptr;
}

double Timers::getAccumulatedTime(const std::string& name) const
{
    const Entry* entry = find(name);
    return entry ? entry->totalIncludingRunning() : -1.0;
}

uint32_t Timers::getCallCount(const std::string& name) const
{
    const Entry* entry = find(name);
    return entry ? entry->calls : 0;
}

void Timers::dumpTimerStats(std::ostream& out) const
{
    const Entry* frame = find(FrameTimer::FRAME);
    const double frameMs = frame ? frame->totalIncludingRunning() : 0.0;
    const uint32_t frames = frame ? frame->calls : 0;

    out << "\nTimer Statistics:\n----------------\n";
    out << fmt::format(
        "Frame Time: {:.3f}ms ({:.4f}ms avg per frame, {} frames)\n",
        frameMs,
        frame ? frame->averageMs() : 0.0,
        frames);

    for (const char* section : FrameTimer::SECTIONS) {
        const Entry* entry = find(section);
        if (!entry) {
            continue;
        }
        const double ms = entry->totalIncludingRunning();
        out << fmt::format(
            "  {}: {:.3f}ms ({:.1f}% of frame, {:.4f}ms avg, {} calls)\n",
            section,
            ms,
            frameMs > 0.0 ? ms / frameMs * 100.0 : 0.0,
            entry->averageMs(),
            entry->calls);
    }

    out << "----------------" << std::endl;
}

void Timers::dumpTimerStats() const
{
    dumpTimerStats(std::cout);
}

std::vector<std::string> Timers::getAllTimerNames() const
{
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) {
        names.push_back(name);
    }
    return names;
}

nlohmann::json Timers::exportAllTimersAsJson() const
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [name, entry] : entries_) {
        j[name] = { { "total_ms", entry.totalIncludingRunning() },
                    { "avg_ms", entry.averageMs() },
                    { "calls", entry.calls } };
    }
    return j;
}

} // namespace CarveSim
