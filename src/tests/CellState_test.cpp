#include "core/Cell.h"
#include "core/CellState.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace CarveSim;

// Test that carving is the only legal transition.
TEST(CellStateTest, OnlyCarvingIsLegal)
{
    const CellState states[] = { CellState::CarveableBackground,
                                 CellState::ProtectedText,
                                 CellState::CarvedOpen,
                                 CellState::EdgeBoundary };

    for (CellState from : states) {
        for (CellState to : states) {
            const bool expected =
                from == CellState::CarveableBackground && to == CellState::CarvedOpen;
            EXPECT_EQ(isValidTransition(from, to), expected)
                << getCellStateName(from) << " -> " << getCellStateName(to);
        }
    }
}

TEST(CellStateTest, JsonUsesStateNames)
{
    nlohmann::json j = CellState::ProtectedText;
    EXPECT_EQ(j, "ProtectedText");

    EXPECT_EQ(nlohmann::json("EdgeBoundary").get<CellState>(), CellState::EdgeBoundary);
    EXPECT_THROW(nlohmann::json("Lava").get<CellState>(), std::runtime_error);
    EXPECT_THROW(nlohmann::json(3).get<CellState>(), std::runtime_error);
}

TEST(CellStateTest, CellHelpers)
{
    const Cell cell{ 3, 7, CellState::CarvedOpen };

    EXPECT_TRUE(cell.isCarved());
    EXPECT_FALSE(cell.isCarveable());
    EXPECT_EQ(cell.position(), (Vector2i{ 3, 7 }));
    EXPECT_DOUBLE_EQ(cell.center().x, 3.5);
    EXPECT_DOUBLE_EQ(cell.center().y, 7.5);
}
