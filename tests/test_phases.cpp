#include <cmath>
#include <iostream>
#include <vector>

#include "canopy/core/attractor.h"
#include "canopy/core/config.h"
#include "canopy/core/influence_buffer.h"
#include "canopy/core/phases.h"
#include "canopy/core/tree.h"

#define CANOPY_ASSERT(expr)                                                                         \
  do {                                                                                              \
    if (!(expr)) {                                                                                  \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n";            \
      return 1;                                                                                     \
    }                                                                                               \
  } while (0)

namespace {

bool near(float a, float b, float eps = 1e-5f) { return std::fabs(a - b) <= eps; }

} // namespace

int test_phases() {
  using namespace canopy;

  // --- attraction ---

  // Owner + unit direction for an attractor in range; out of range clears the owner.
  {
    Tree tree(Vec2{0.0f, 0.0f}, 1.0f);
    auto atts = AttractorSet::from_positions({Vec2{3.0f, 4.0f}, Vec2{100.0f, 0.0f}});
    atts.set_owner(1, NodeId{0});

    Config cfg;
    cfg.influence_radius = 10.0f;

    InfluenceBuffer acc;
    const auto rep = attraction_phase(tree, atts, cfg, acc);

    CANOPY_ASSERT(rep.owned_attractors == 1);
    CANOPY_ASSERT(rep.influenced_nodes == 1);
    CANOPY_ASSERT(acc.size() == 1);
    CANOPY_ASSERT(acc.count(0) == 1);
    CANOPY_ASSERT(near(acc.avg_dir(0).x, 0.6f));
    CANOPY_ASSERT(near(acc.avg_dir(0).y, 0.8f));
    CANOPY_ASSERT(atts.at(0).owner == NodeId{0});
    CANOPY_ASSERT(!atts.at(1).owner.has_value());
    CANOPY_ASSERT(atts.at(1).alive);
  }

  // Influence radius is inclusive; dead attractors are ignored; stale contributions are cleared.
  {
    Tree tree(Vec2{0.0f, 0.0f}, 1.0f);
    auto atts = AttractorSet::from_positions({Vec2{0.0f, 10.0f}, Vec2{-5.0f, 0.0f}});
    atts.kill(1);

    Config cfg;
    cfg.influence_radius = 10.0f;

    auto acc = InfluenceBuffer::with_len(1);
    acc.add(0, Vec2{-1.0f, 0.0f});
    acc.add(0, Vec2{-1.0f, 0.0f});

    const auto rep = attraction_phase(tree, atts, cfg, acc);
    CANOPY_ASSERT(rep.owned_attractors == 1);
    CANOPY_ASSERT(acc.count(0) == 1);
    CANOPY_ASSERT(acc.sum(0) == (Vec2{0.0f, 1.0f}));
    CANOPY_ASSERT(!atts.at(1).owner.has_value());
  }

  // An attractor sitting on a node contributes a zero vector without dividing by zero.
  {
    Tree tree(Vec2{2.0f, 2.0f}, 1.0f);
    auto atts = AttractorSet::from_positions({Vec2{2.0f, 2.0f}});
    Config cfg;
    InfluenceBuffer acc;
    attraction_phase(tree, atts, cfg, acc);
    CANOPY_ASSERT(acc.count(0) == 1);
    CANOPY_ASSERT(acc.sum(0) == (Vec2{0.0f, 0.0f}));
    CANOPY_ASSERT(acc.sum(0).is_finite());
  }

  // Empty tree: nothing to attract to.
  {
    Tree tree;
    auto atts = AttractorSet::from_positions({Vec2{1.0f, 1.0f}});
    Config cfg;
    InfluenceBuffer acc;
    const auto rep = attraction_phase(tree, atts, cfg, acc);
    CANOPY_ASSERT(rep.owned_attractors == 0);
    CANOPY_ASSERT(acc.size() == 0);
    CANOPY_ASSERT(!atts.at(0).owner.has_value());
  }

  // Global vs local neighbor evaluation with k = 2.
  {
    Tree tree;
    tree.add_root(Vec2{0.0f, 0.0f}, 1.0f);
    tree.add_root(Vec2{50.0f, 0.0f}, 1.0f);

    Config cfg;
    cfg.influence_radius = 10.0f;
    cfg.attract_from_kn = 2;

    // Global: the 2nd nearest is node 0 at distance 45, outside the radius.
    {
      auto atts = AttractorSet::from_positions({Vec2{45.0f, 0.0f}});
      InfluenceBuffer acc;
      const auto rep = attraction_phase(tree, atts, cfg, acc);
      CANOPY_ASSERT(rep.owned_attractors == 0);
      CANOPY_ASSERT(!atts.at(0).owner.has_value());
    }

    // Local: only node 1 is in range, k clamps to it.
    {
      cfg.attract_mode = NeighborMode::Local;
      auto atts = AttractorSet::from_positions({Vec2{45.0f, 0.0f}});
      InfluenceBuffer acc;
      const auto rep = attraction_phase(tree, atts, cfg, acc);
      CANOPY_ASSERT(rep.owned_attractors == 1);
      CANOPY_ASSERT(atts.at(0).owner == NodeId{1});
      CANOPY_ASSERT(acc.avg_dir(1) == (Vec2{-1.0f, 0.0f}));
    }
  }

  // --- growth ---

  // One step along the normalized average; radius inherited from the parent.
  {
    Tree tree(Vec2{0.0f, 0.0f}, 3.0f);
    auto acc = InfluenceBuffer::with_len(1);
    acc.add(0, Vec2{1.0f, 0.0f});

    Config cfg;
    cfg.step_len = 2.0f;

    const auto rep = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT((rep.new_nodes == std::vector<NodeId>{1}));
    CANOPY_ASSERT(tree.size() == 2);
    CANOPY_ASSERT(tree.node(1).pos == (Vec2{2.0f, 0.0f}));
    CANOPY_ASSERT(tree.node(1).parent == NodeId{0});
    CANOPY_ASSERT(tree.node(1).radius == 3.0f);
    CANOPY_ASSERT((tree.node(0).children == std::vector<NodeId>{1}));
  }

  // New ids follow parent order.
  {
    Tree tree;
    tree.add_root(Vec2{0.0f, 0.0f}, 1.0f);
    tree.add_root(Vec2{10.0f, 0.0f}, 2.0f);
    auto acc = InfluenceBuffer::with_len(2);
    acc.add(1, Vec2{0.0f, 1.0f});
    acc.add(0, Vec2{0.0f, 1.0f});

    Config cfg;
    cfg.step_len = 1.0f;

    const auto rep = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT((rep.new_nodes == std::vector<NodeId>{2, 3}));
    CANOPY_ASSERT(tree.node(2).parent == NodeId{0});
    CANOPY_ASSERT(tree.node(2).pos == (Vec2{0.0f, 1.0f}));
    CANOPY_ASSERT(tree.node(3).parent == NodeId{1});
    CANOPY_ASSERT(tree.node(3).pos == (Vec2{10.0f, 1.0f}));
    CANOPY_ASSERT(tree.node(3).radius == 2.0f);
  }

  // A candidate on top of an existing sibling is dropped; spacing 0 disables the check.
  {
    Tree tree(Vec2{0.0f, 0.0f}, 1.0f);
    tree.add_child(0, Vec2{2.0f, 0.0f}, 1.0f);
    auto acc = InfluenceBuffer::with_len(2);
    acc.add(0, Vec2{1.0f, 0.0f});

    Config cfg;
    cfg.step_len = 2.0f;
    cfg.min_child_spacing = 0.1f;

    const auto rep = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT(rep.new_nodes.empty());
    CANOPY_ASSERT(rep.skipped_crowded == 1);
    CANOPY_ASSERT(tree.size() == 2);

    cfg.min_child_spacing = 0.0f;
    const auto rep2 = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT(rep2.new_nodes.size() == 1);
    CANOPY_ASSERT(tree.size() == 3);
  }

  // Symmetric pull cancels out and is skipped; tropism breaks the tie.
  {
    Tree tree(Vec2{0.0f, 0.0f}, 1.0f);
    auto acc = InfluenceBuffer::with_len(1);
    acc.add(0, Vec2{0.0f, 1.0f});
    acc.add(0, Vec2{0.0f, -1.0f});

    Config cfg;
    cfg.step_len = 1.0f;

    const auto rep = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT(rep.new_nodes.empty());
    CANOPY_ASSERT(rep.skipped_degenerate == 1);
    CANOPY_ASSERT(tree.size() == 1);

    cfg.tropism = Vec2{1.0f, 0.0f};
    const auto rep2 = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT(rep2.skipped_degenerate == 0);
    CANOPY_ASSERT((rep2.new_nodes == std::vector<NodeId>{1}));
    CANOPY_ASSERT(tree.node(1).pos == (Vec2{1.0f, 0.0f}));
  }

  // Tropism that exactly cancels the pull is also degenerate.
  {
    Tree tree(Vec2{0.0f, 0.0f}, 1.0f);
    auto acc = InfluenceBuffer::with_len(1);
    acc.add(0, Vec2{1.0f, 0.0f});
    Config cfg;
    cfg.tropism = Vec2{-1.0f, 0.0f};
    const auto rep = growth_phase(tree, acc, cfg);
    CANOPY_ASSERT(rep.skipped_degenerate == 1);
    CANOPY_ASSERT(tree.size() == 1);
  }

  // --- kill ---

  {
    Tree tree(Vec2{0.0f, 0.0f}, 1.0f);
    auto atts = AttractorSet::from_positions({Vec2{1.0f, 0.0f}, Vec2{1.5f, 0.0f}, Vec2{0.0f, -0.5f}});
    atts.kill(2);

    Config cfg;
    cfg.kill_radius = 1.0f;

    const auto rep = kill_phase(tree, atts, cfg);
    // Inclusive radius; already-dead attractors are not reported again.
    CANOPY_ASSERT((rep.killed == std::vector<AttractorIndex>{0}));
    CANOPY_ASSERT(!atts.at(0).alive);
    CANOPY_ASSERT(atts.at(1).alive);
    CANOPY_ASSERT(!atts.at(2).alive);
  }

  // kill_from_kn ranks globally.
  {
    Tree tree;
    tree.add_root(Vec2{0.0f, 0.0f}, 1.0f);
    tree.add_root(Vec2{20.0f, 0.0f}, 1.0f);
    auto atts = AttractorSet::from_positions({Vec2{0.5f, 0.0f}});

    Config cfg;
    cfg.kill_radius = 1.0f;
    cfg.kill_from_kn = 2;

    const auto rep = kill_phase(tree, atts, cfg);
    CANOPY_ASSERT(rep.killed.empty());
    CANOPY_ASSERT(atts.at(0).alive);
  }

  // Empty tree: nothing dies.
  {
    Tree tree;
    auto atts = AttractorSet::from_positions({Vec2{0.0f, 0.0f}});
    Config cfg;
    const auto rep = kill_phase(tree, atts, cfg);
    CANOPY_ASSERT(rep.killed.empty());
    CANOPY_ASSERT(atts.any_alive());
  }

  return 0;
}
