#include "canopy/core/tree.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace canopy {

namespace {

void check_id(std::size_t size, NodeId id, const char* what) {
  if (id >= size) {
    throw std::out_of_range(std::string(what) + ": unknown node id " + std::to_string(id) + " (tree has " +
                            std::to_string(size) + " nodes)");
  }
}

} // namespace

Tree::Tree(Vec2 root_pos, float root_radius) { add_root(root_pos, root_radius); }

NodeId Tree::add_root(Vec2 pos, float radius) {
  const NodeId id = nodes_.size();
  Node n;
  n.pos = pos;
  n.radius = radius;
  nodes_.push_back(std::move(n));
  return id;
}

NodeId Tree::add_child(NodeId parent, Vec2 pos, float radius) {
  check_id(nodes_.size(), parent, "add_child");
  const NodeId id = nodes_.size();
  Node n;
  n.pos = pos;
  n.radius = radius;
  n.parent = parent;
  nodes_.push_back(std::move(n));
  // Note: push_back above may have reallocated; index again.
  nodes_[parent].children.push_back(id);
  return id;
}

bool Tree::has_child_near(NodeId parent, Vec2 pos, float min_dist) const {
  check_id(nodes_.size(), parent, "has_child_near");
  const float min_d2 = min_dist * min_dist;
  for (NodeId cid : nodes_[parent].children) {
    if (distance_squared(nodes_[cid].pos, pos) < min_d2) return true;
  }
  return false;
}

std::optional<NodeId> Tree::find_nearest_node(Vec2 pos) const {
  std::optional<NodeId> best;
  float best_d2 = 0.0f;
  for (NodeId id = 0; id < nodes_.size(); ++id) {
    const float d2 = distance_squared(nodes_[id].pos, pos);
    // Strict < keeps the lower id on ties.
    if (!best || d2 < best_d2) {
      best = id;
      best_d2 = d2;
    }
  }
  return best;
}

const Node& Tree::node(NodeId id) const {
  check_id(nodes_.size(), id, "node");
  return nodes_[id];
}

} // namespace canopy
