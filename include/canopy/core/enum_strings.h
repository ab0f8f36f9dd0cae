#pragma once

#include <string>

#include "canopy/core/config.h"
#include "canopy/core/simulation.h"
#include "canopy/core/spawn.h"

namespace canopy {

// Shared string <-> enum conversion helpers for the CLI, the viewer and logs.
//
// The *_from_string parsers return false (leaving `out` untouched) for unknown
// strings so callers can report a usage error.

std::string terminal_condition_to_string(TerminalCondition t);

std::string neighbor_mode_to_string(NeighborMode m);
bool neighbor_mode_from_string(const std::string& s, NeighborMode& out);

std::string spawn_shape_to_string(SpawnShape s);
bool spawn_shape_from_string(const std::string& s, SpawnShape& out);

} // namespace canopy
