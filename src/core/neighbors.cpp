#include "canopy/core/neighbors.h"

#include <algorithm>
#include <vector>

namespace canopy {

namespace {

bool rank_less(const NeighborHit& a, const NeighborHit& b) {
  if (a.dist_sq != b.dist_sq) return a.dist_sq < b.dist_sq;
  return a.id < b.id;
}

// k-th entry in rank order. Past the end, the farthest candidate; equidistant
// farthest candidates resolve to the lower id like any other tie.
std::optional<NeighborHit> select_kth(std::vector<NeighborHit>& cands, int k) {
  if (cands.empty()) return std::nullopt;
  const std::size_t want = static_cast<std::size_t>(std::max(k, 1));
  if (want > cands.size()) {
    return *std::max_element(cands.begin(), cands.end(), [](const NeighborHit& a, const NeighborHit& b) {
      if (a.dist_sq != b.dist_sq) return a.dist_sq < b.dist_sq;
      return a.id > b.id;
    });
  }
  const std::size_t nth = want - 1;
  std::nth_element(cands.begin(), cands.begin() + static_cast<std::ptrdiff_t>(nth), cands.end(), rank_less);
  return cands[nth];
}

} // namespace

std::optional<NeighborHit> find_kth_nearest(const Tree& tree, Vec2 query, int k) {
  const auto& nodes = tree.nodes();
  if (nodes.empty()) return std::nullopt;

  // Fast path for the common k = 1 case: one linear scan, no scratch vector.
  if (k <= 1) {
    const auto id = tree.find_nearest_node(query);
    if (!id) return std::nullopt;
    return NeighborHit{*id, distance_squared(nodes[*id].pos, query)};
  }

  std::vector<NeighborHit> cands;
  cands.reserve(nodes.size());
  for (NodeId id = 0; id < nodes.size(); ++id) {
    cands.push_back(NeighborHit{id, distance_squared(nodes[id].pos, query)});
  }
  return select_kth(cands, k);
}

std::optional<NeighborHit> find_kth_nearest_within(const Tree& tree, Vec2 query, int k, float radius_sq) {
  const auto& nodes = tree.nodes();
  std::vector<NeighborHit> cands;
  for (NodeId id = 0; id < nodes.size(); ++id) {
    const float d2 = distance_squared(nodes[id].pos, query);
    if (d2 <= radius_sq) cands.push_back(NeighborHit{id, d2});
  }
  return select_kth(cands, k);
}

} // namespace canopy
