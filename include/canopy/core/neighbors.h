#pragma once

#include <optional>

#include "canopy/core/ids.h"
#include "canopy/core/tree.h"
#include "canopy/core/vec2.h"

namespace canopy {

struct NeighborHit {
  NodeId id{0};
  float dist_sq{0.0f};
};

// Brute-force k-th nearest node to `query` over the whole tree (k = 1 is the nearest).
//
// Ranking is by (squared distance, node id), so equidistant nodes rank the lower
// id first and results are reproducible. k larger than the node count clamps to
// the farthest node (lowest id among equally far nodes). k < 1 is treated as 1.
// Empty tree => nullopt.
std::optional<NeighborHit> find_kth_nearest(const Tree& tree, Vec2 query, int k);

// Same ranking restricted to nodes with dist_sq <= radius_sq. k larger than the
// number of in-radius nodes clamps to the farthest in-radius node. No node in
// range => nullopt.
std::optional<NeighborHit> find_kth_nearest_within(const Tree& tree, Vec2 query, int k, float radius_sq);

} // namespace canopy
