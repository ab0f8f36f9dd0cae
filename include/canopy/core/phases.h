#pragma once

#include <cstddef>
#include <vector>

#include "canopy/core/attractor.h"
#include "canopy/core/config.h"
#include "canopy/core/ids.h"
#include "canopy/core/influence_buffer.h"
#include "canopy/core/tree.h"

namespace canopy {

// One phase-cycle is attraction_phase -> growth_phase -> kill_phase.
//
// Each phase runs to completion over its inputs. Kill must follow growth in
// the same cycle so freshly grown nodes can consume the attractors they reach.

struct AttractionReport {
  // Alive attractors that found an owner within the influence radius.
  std::size_t owned_attractors{0};
  // Nodes with at least one contribution.
  std::size_t influenced_nodes{0};
};

struct GrowthReport {
  // Ids of the nodes appended this phase, ascending (committed in parent-id order).
  std::vector<NodeId> new_nodes;
  // Influenced nodes whose direction cancelled out to zero.
  std::size_t skipped_degenerate{0};
  // Candidates dropped because a sibling already sits at that spot.
  std::size_t skipped_crowded{0};
};

struct KillReport {
  // Attractor indices killed this phase, ascending.
  std::vector<AttractorIndex> killed;
};

// Clears and resizes `acc` to the tree, then for every alive attractor finds
// its k-th nearest node (cfg.attract_from_kn, cfg.attract_mode). If that node is
// within cfg.influence_radius the unit direction node->attractor is accumulated
// and the node becomes the attractor's owner; otherwise the owner is cleared.
AttractionReport attraction_phase(const Tree& tree, AttractorSet& attractors, const Config& cfg,
                                  InfluenceBuffer& acc);

// For every influenced node: direction = normalize(avg + cfg.tropism). Zero
// directions are skipped. The candidate at pos + step_len * direction is dropped
// if an existing child of the node lies within cfg.min_child_spacing. Survivors
// are committed sorted by parent id; children inherit the parent radius.
GrowthReport growth_phase(Tree& tree, const InfluenceBuffer& acc, const Config& cfg);

// Kills every alive attractor whose k-th nearest node (cfg.kill_from_kn, global
// ranking) lies within cfg.kill_radius.
KillReport kill_phase(const Tree& tree, AttractorSet& attractors, const Config& cfg);

} // namespace canopy
