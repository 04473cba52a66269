#include "CellState.h"

#include <array>
#include <stdexcept>
#include <string>

namespace CarveSim {

static const std::array<const char*, 4> CELL_STATE_NAMES = {
    { "CarveableBackground", "ProtectedText", "CarvedOpen", "EdgeBoundary" }
};

const char* getCellStateName(CellState state)
{
    const auto index = static_cast<size_t>(state);
    if (index >= CELL_STATE_NAMES.size()) {
        return "Unknown";
    }
    return CELL_STATE_NAMES[index];
}

bool isValidTransition(CellState from, CellState to)
{
    return from == CellState::CarveableBackground && to == CellState::CarvedOpen;
}

void to_json(nlohmann::json& j, CellState state)
{
    j = getCellStateName(state);
}

void from_json(const nlohmann::json& j, CellState& state)
{
    if (!j.is_string()) {
        throw std::runtime_error("CellState::from_json: JSON value must be a string");
    }

    std::string name = j.get<std::string>();

    for (size_t i = 0; i < CELL_STATE_NAMES.size(); ++i) {
        if (name == CELL_STATE_NAMES[i]) {
            state = static_cast<CellState>(i);
            return;
        }
    }

    throw std::runtime_error("CellState::from_json: Unknown cell state '" + name + "'");
}

} // namespace CarveSim
