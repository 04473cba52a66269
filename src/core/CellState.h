#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace CarveSim {

/**
 * \file
 * Cell carving states. CarveableBackground -> CarvedOpen is the only legal
 * transition; every other state is terminal.
 */

enum class CellState : uint8_t {
    CarveableBackground = 0, // Background ink, removed by ball contact.
    ProtectedText,           // Text shape, never carved.
    CarvedOpen,              // Background already removed.
    EdgeBoundary             // Padding ring where balls spawn and bounce.
};

/**
 * Get a human-readable name for a cell state.
 */
const char* getCellStateName(CellState state);

/**
 * Check whether `from -> to` is a legal transition.
 */
bool isValidTransition(CellState from, CellState to);

/**
 * JSON serialization support for CellState (ADL convention for nlohmann::json).
 */
void to_json(nlohmann::json& j, CellState state);
void from_json(const nlohmann::json& j, CellState& state);

} // namespace CarveSim
