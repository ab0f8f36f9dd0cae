#pragma once

#include <vector>

#include "canopy/core/config.h"
#include "canopy/core/vec2.h"
#include "canopy/util/hash_rng.h"

namespace canopy {

enum class SpawnShape {
  Rect,
  Oval,
  Annulus,
};

// A request to scatter `count` attractors uniformly over an area.
//
// Only the extents matching `shape` are read:
// - Rect:    half_extents
// - Oval:    radii (a circle when x == y)
// - Annulus: inner_radius / outer_radius
struct SpawnRequest {
  SpawnShape shape{SpawnShape::Oval};
  Vec2 center{0.0f, 0.0f};
  int count{0};

  Vec2 half_extents{0.0f, 0.0f};
  Vec2 radii{0.0f, 0.0f};
  float inner_radius{0.0f};
  float outer_radius{0.0f};
};

// Build a request from the config's spawn parameters.
SpawnRequest spawn_request_from_config(const Config& cfg, SpawnShape shape, Vec2 center);

// Throws std::invalid_argument for negative counts, negative/non-finite extents
// or an inverted annulus.
void validate_spawn_request(const SpawnRequest& req);

// Sample positions for `req`. Validates first. Deterministic for a given rng state.
std::vector<Vec2> sample_spawn_positions(const SpawnRequest& req, util::HashRng& rng);

} // namespace canopy
