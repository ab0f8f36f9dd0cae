#include "canopy/core/phases.h"

#include <algorithm>
#include <optional>

#include "canopy/core/neighbors.h"

namespace canopy {

namespace {

struct GrowthCandidate {
  NodeId parent{0};
  Vec2 pos;
  float radius{1.0f};
};

std::optional<NeighborHit> attraction_neighbor(const Tree& tree, Vec2 pos, const Config& cfg, float r2) {
  switch (cfg.attract_mode) {
    case NeighborMode::Local: return find_kth_nearest_within(tree, pos, cfg.attract_from_kn, r2);
    case NeighborMode::Global: break;
  }
  return find_kth_nearest(tree, pos, cfg.attract_from_kn);
}

} // namespace

AttractionReport attraction_phase(const Tree& tree, AttractorSet& attractors, const Config& cfg,
                                  InfluenceBuffer& acc) {
  AttractionReport rep;
  const float r2 = cfg.influence_radius * cfg.influence_radius;

  acc.ensure_len(tree.size());

  const auto& points = attractors.points();
  for (AttractorIndex i = 0; i < points.size(); ++i) {
    if (!points[i].alive) continue;
    const Vec2 apos = points[i].pos;

    const auto hit = attraction_neighbor(tree, apos, cfg, r2);
    if (!hit || hit->dist_sq > r2) {
      attractors.set_owner(i, std::nullopt);
      continue;
    }

    // A node sitting exactly on the attractor contributes a zero vector but
    // still counts as influenced.
    const Vec2 dir = (apos - tree.nodes()[hit->id].pos).normalized();
    acc.add(hit->id, dir);
    attractors.set_owner(i, hit->id);
    ++rep.owned_attractors;
  }

  rep.influenced_nodes = acc.influenced_indices().size();
  return rep;
}

GrowthReport growth_phase(Tree& tree, const InfluenceBuffer& acc, const Config& cfg) {
  GrowthReport rep;
  std::vector<GrowthCandidate> to_add;

  const std::size_t limit = std::min(acc.size(), tree.size());
  for (NodeId id = 0; id < limit; ++id) {
    if (!acc.is_influenced(id)) continue;

    const Vec2 dir = (acc.avg_dir(id) + cfg.tropism).normalized();
    if (dir.length_squared() == 0.0f) {
      ++rep.skipped_degenerate;
      continue;
    }

    const Node& parent = tree.nodes()[id];
    const Vec2 pos = parent.pos + dir * cfg.step_len;

    if (cfg.min_child_spacing > 0.0f && tree.has_child_near(id, pos, cfg.min_child_spacing)) {
      ++rep.skipped_crowded;
      continue;
    }

    to_add.push_back(GrowthCandidate{id, pos, parent.radius});
  }

  // Commit order defines the new ids; keep it tied to parent ids, not to how
  // candidates happened to be gathered.
  std::stable_sort(to_add.begin(), to_add.end(),
                   [](const GrowthCandidate& a, const GrowthCandidate& b) { return a.parent < b.parent; });

  rep.new_nodes.reserve(to_add.size());
  for (const auto& c : to_add) {
    rep.new_nodes.push_back(tree.add_child(c.parent, c.pos, c.radius));
  }
  return rep;
}

KillReport kill_phase(const Tree& tree, AttractorSet& attractors, const Config& cfg) {
  KillReport rep;
  const float r2 = cfg.kill_radius * cfg.kill_radius;

  const auto& points = attractors.points();
  for (AttractorIndex i = 0; i < points.size(); ++i) {
    if (!points[i].alive) continue;
    const auto hit = find_kth_nearest(tree, points[i].pos, cfg.kill_from_kn);
    if (hit && hit->dist_sq <= r2) {
      attractors.kill(i);
      rep.killed.push_back(i);
    }
  }
  return rep;
}

} // namespace canopy
