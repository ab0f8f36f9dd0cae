#pragma once

#include <optional>
#include <vector>

#include "canopy/core/ids.h"
#include "canopy/core/vec2.h"

namespace canopy {

struct Node {
  Vec2 pos;
  float radius{1.0f};

  // Unset only for roots. The structure is a forest: every spawned root starts
  // its own tree inside the same arena.
  std::optional<NodeId> parent;

  // Appended in creation order, so always ascending.
  std::vector<NodeId> children;
};

// Flat, append-only node arena with parent/child index links.
//
// Invariants:
// - ids are dense and equal to the arena index
// - a child's id is strictly greater than its parent's id, so index order is a
//   valid topological order
// - nodes are never removed and their position/radius never change
class Tree {
 public:
  Tree() = default;

  // Convenience: a tree with a single root.
  Tree(Vec2 root_pos, float root_radius);

  // Append a parentless node. Returns its id.
  NodeId add_root(Vec2 pos, float radius);

  // Append a child of `parent`. Throws std::out_of_range if `parent` does not exist.
  NodeId add_child(NodeId parent, Vec2 pos, float radius);

  // True if `parent` already has a child strictly closer than `min_dist` to `pos`.
  // Throws std::out_of_range if `parent` does not exist.
  bool has_child_near(NodeId parent, Vec2 pos, float min_dist) const;

  // Nearest node to `pos` (lowest id on ties). Empty tree => nullopt.
  std::optional<NodeId> find_nearest_node(Vec2 pos) const;

  // Throws std::out_of_range for unknown ids.
  const Node& node(NodeId id) const;

  const std::vector<Node>& nodes() const { return nodes_; }
  std::size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }

  void clear() { nodes_.clear(); }

 private:
  std::vector<Node> nodes_;
};

} // namespace canopy
