#include "core/ScopeTimer.h"
#include "core/Timers.h"

#include <algorithm>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <sstream>

using namespace CarveSim;

TEST(TimersTest, UnknownTimer)
{
    Timers timers;
    EXPECT_FALSE(timers.hasTimer("missing"));
    EXPECT_EQ(timers.getAccumulatedTime("missing"), -1.0);
    EXPECT_EQ(timers.stopTimer("missing"), -1.0);
    EXPECT_EQ(timers.getCallCount("missing"), 0u);
}

// Test that restarting a running timer does not count a second call.
TEST(TimersTest, StartIsIdempotentWhileRunning)
{
    Timers timers;
    timers.startTimer("frame");
    timers.startTimer("frame");
    EXPECT_EQ(timers.getCallCount("frame"), 1u);

    const double total = timers.stopTimer("frame");
    EXPECT_GE(total, 0.0);
    EXPECT_EQ(timers.getAccumulatedTime("frame"), total);
}

TEST(TimersTest, ScopeTimerAccumulates)
{
    Timers timers;
    for (int i = 0; i < 3; ++i) {
        ScopeTimer timer(timers, "section");
    }

    EXPECT_EQ(timers.getCallCount("section"), 3u);

    const auto names = timers.getAllTimerNames();
    EXPECT_NE(std::find(names.begin(), names.end(), "section"), names.end());

    const nlohmann::json j = timers.exportAllTimersAsJson();
    ASSERT_TRUE(j.contains("section"));
    EXPECT_EQ(j["section"]["calls"], 3);
    EXPECT_GE(j["section"]["total_ms"].get<double>(), 0.0);

    timers.clear();
    EXPECT_FALSE(timers.hasTimer("section"));
}

// Test that the stats dump lists only the frame sections that ran.
TEST(TimersTest, DumpListsRecordedSections)
{
    Timers timers;
    {
        ScopeTimer frame(timers, FrameTimer::FRAME);
        ScopeTimer section(timers, FrameTimer::UPDATE_ISLANDS);
    }

    std::ostringstream out;
    timers.dumpTimerStats(out);
    const std::string text = out.str();

    EXPECT_NE(text.find("1 frames"), std::string::npos);
    EXPECT_NE(text.find("update_islands"), std::string::npos);
    EXPECT_EQ(text.find("advance_balls"), std::string::npos);
}
