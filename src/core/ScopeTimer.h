#pragma once

#include "Timers.h"

#include <string>
#include <utility>

namespace CarveSim {

// Runs a named Timers entry for the lifetime of the enclosing scope.
class ScopeTimer {
public:
    ScopeTimer(Timers& timers, std::string name) : timers_(timers), name_(std::move(name))
    {
        timers_.startTimer(name_);
    }

    ~ScopeTimer() { timers_.stopTimer(name_); }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    Timers& timers_;
    const std::string name_;
};

} // namespace CarveSim
