#include "canopy/core/enum_strings.h"

namespace canopy {

std::string terminal_condition_to_string(TerminalCondition t) {
  switch (t) {
    case TerminalCondition::AllAttractorsDead: return "all_attractors_dead";
    case TerminalCondition::MaxIterations: return "max_iterations";
    case TerminalCondition::StopRequested: return "stop_requested";
    case TerminalCondition::Stalled: return "stalled";
  }
  return "unknown";
}

std::string neighbor_mode_to_string(NeighborMode m) {
  switch (m) {
    case NeighborMode::Global: return "global";
    case NeighborMode::Local: return "local";
  }
  return "global";
}

bool neighbor_mode_from_string(const std::string& s, NeighborMode& out) {
  if (s == "global") {
    out = NeighborMode::Global;
    return true;
  }
  if (s == "local") {
    out = NeighborMode::Local;
    return true;
  }
  return false;
}

std::string spawn_shape_to_string(SpawnShape s) {
  switch (s) {
    case SpawnShape::Rect: return "rect";
    case SpawnShape::Oval: return "oval";
    case SpawnShape::Annulus: return "annulus";
  }
  return "oval";
}

bool spawn_shape_from_string(const std::string& s, SpawnShape& out) {
  if (s == "rect") {
    out = SpawnShape::Rect;
    return true;
  }
  if (s == "oval" || s == "circle") {
    out = SpawnShape::Oval;
    return true;
  }
  if (s == "annulus") {
    out = SpawnShape::Annulus;
    return true;
  }
  return false;
}

} // namespace canopy
