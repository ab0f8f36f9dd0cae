#include <iostream>
#include <stdexcept>
#include <vector>

#include "canopy/core/tree.h"

#define CANOPY_ASSERT(expr)                                                                         \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

int test_tree() {
  using canopy::NodeId;
  using canopy::Tree;
  using canopy::Vec2;

  {
    Tree t(Vec2{0.0f, 0.0f}, 2.0f);
    CANOPY_ASSERT(t.size() == 1);
    CANOPY_ASSERT(!t.node(0).parent.has_value());
    CANOPY_ASSERT(t.node(0).radius == 2.0f);

    const NodeId a = t.add_child(0, Vec2{1.0f, 0.0f}, 2.0f);
    const NodeId b = t.add_child(0, Vec2{0.0f, 1.0f}, 2.0f);
    const NodeId c = t.add_child(a, Vec2{2.0f, 0.0f}, 2.0f);
    const NodeId r = t.add_root(Vec2{50.0f, 50.0f}, 1.0f);

    // Dense ids in creation order.
    CANOPY_ASSERT(a == 1 && b == 2 && c == 3 && r == 4);
    CANOPY_ASSERT((t.node(0).children == std::vector<NodeId>{1, 2}));
    CANOPY_ASSERT((t.node(1).children == std::vector<NodeId>{3}));
    CANOPY_ASSERT(t.node(3).parent == NodeId{1});
    CANOPY_ASSERT(!t.node(4).parent.has_value());

    // Every child id exceeds its parent id.
    for (NodeId id = 0; id < t.size(); ++id) {
      const auto& n = t.node(id);
      if (n.parent) CANOPY_ASSERT(*n.parent < id);
      for (NodeId cid : n.children) CANOPY_ASSERT(cid > id);
    }
  }

  // Unknown parents / ids throw.
  {
    Tree t;
    CANOPY_ASSERT(t.empty());
    bool threw = false;
    try {
      t.add_child(0, Vec2{1.0f, 1.0f}, 1.0f);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    CANOPY_ASSERT(threw);
    CANOPY_ASSERT(t.empty());

    threw = false;
    try {
      (void)t.node(3);
    } catch (const std::out_of_range&) {
      threw = true;
    }
    CANOPY_ASSERT(threw);
  }

  // has_child_near uses a strict threshold over the parent's children only.
  {
    Tree t(Vec2{0.0f, 0.0f}, 1.0f);
    t.add_child(0, Vec2{5.0f, 0.0f}, 1.0f);
    const NodeId other = t.add_root(Vec2{5.0f, 0.5f}, 1.0f);

    CANOPY_ASSERT(t.has_child_near(0, Vec2{5.0f, 0.05f}, 0.1f));
    CANOPY_ASSERT(!t.has_child_near(0, Vec2{5.0f, 0.5f}, 0.5f));
    CANOPY_ASSERT(t.has_child_near(0, Vec2{5.0f, 0.49f}, 0.5f));
    CANOPY_ASSERT(!t.has_child_near(other, Vec2{5.0f, 0.0f}, 1.0f));
  }

  // Nearest node prefers the lower id on ties.
  {
    Tree t;
    CANOPY_ASSERT(!t.find_nearest_node(Vec2{0.0f, 0.0f}).has_value());
    t.add_root(Vec2{-1.0f, 0.0f}, 1.0f);
    t.add_root(Vec2{1.0f, 0.0f}, 1.0f);
    t.add_root(Vec2{0.0f, 3.0f}, 1.0f);
    CANOPY_ASSERT(t.find_nearest_node(Vec2{0.0f, 0.0f}) == NodeId{0});
    CANOPY_ASSERT(t.find_nearest_node(Vec2{0.9f, 0.0f}) == NodeId{1});
    CANOPY_ASSERT(t.find_nearest_node(Vec2{0.0f, 10.0f}) == NodeId{2});

    t.clear();
    CANOPY_ASSERT(t.empty());
    CANOPY_ASSERT(t.add_root(Vec2{0.0f, 0.0f}, 1.0f) == 0);
  }

  return 0;
}
