#pragma once

#include <cstddef>

namespace canopy {

// Index of a node in a Tree's arena. Assigned in creation order and never
// reused or renumbered while the tree lives (cleared trees start again at 0).
using NodeId = std::size_t;

// Index of an attractor in an AttractorSet. Stable because dead attractors are
// tombstoned rather than erased.
using AttractorIndex = std::size_t;

} // namespace canopy
