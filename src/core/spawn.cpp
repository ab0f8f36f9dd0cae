#include "canopy/core/spawn.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace canopy {

namespace {

constexpr float kTwoPi = 6.28318530717958647692f;

bool bad_extent(float v) { return !std::isfinite(v) || v < 0.0f; }

// Uniform direction on the unit circle.
Vec2 unit_dir(util::HashRng& rng) {
  const float t = rng.range(0.0f, kTwoPi);
  return {std::cos(t), std::sin(t)};
}

} // namespace

SpawnRequest spawn_request_from_config(const Config& cfg, SpawnShape shape, Vec2 center) {
  SpawnRequest req;
  req.shape = shape;
  req.center = center;
  req.count = cfg.spawn_count;
  req.half_extents = cfg.spawn_rect_half_extents;
  req.radii = cfg.spawn_oval_radii;
  req.inner_radius = cfg.spawn_annulus_radii.x;
  req.outer_radius = cfg.spawn_annulus_radii.y;
  return req;
}

void validate_spawn_request(const SpawnRequest& req) {
  if (req.count < 0) throw std::invalid_argument("spawn count must be >= 0, got " + std::to_string(req.count));
  if (!req.center.is_finite()) throw std::invalid_argument("spawn center must be finite");

  switch (req.shape) {
    case SpawnShape::Rect:
      if (bad_extent(req.half_extents.x) || bad_extent(req.half_extents.y)) {
        throw std::invalid_argument("rect half extents must be finite and >= 0");
      }
      break;
    case SpawnShape::Oval:
      if (bad_extent(req.radii.x) || bad_extent(req.radii.y)) {
        throw std::invalid_argument("oval radii must be finite and >= 0");
      }
      break;
    case SpawnShape::Annulus:
      if (bad_extent(req.inner_radius) || bad_extent(req.outer_radius)) {
        throw std::invalid_argument("annulus radii must be finite and >= 0");
      }
      if (req.inner_radius > req.outer_radius) {
        throw std::invalid_argument("annulus inner radius exceeds outer radius");
      }
      break;
  }
}

std::vector<Vec2> sample_spawn_positions(const SpawnRequest& req, util::HashRng& rng) {
  validate_spawn_request(req);

  std::vector<Vec2> out;
  out.reserve(static_cast<std::size_t>(req.count));

  for (int i = 0; i < req.count; ++i) {
    Vec2 local;
    switch (req.shape) {
      case SpawnShape::Rect: {
        local.x = rng.range(-req.half_extents.x, req.half_extents.x);
        local.y = rng.range(-req.half_extents.y, req.half_extents.y);
        break;
      }
      case SpawnShape::Oval: {
        // sqrt keeps the density uniform over the area instead of piling up at the center.
        const float r = std::sqrt(rng.range(0.0f, 1.0f));
        const Vec2 d = unit_dir(rng);
        local = {d.x * r * req.radii.x, d.y * r * req.radii.y};
        break;
      }
      case SpawnShape::Annulus: {
        const float ri2 = req.inner_radius * req.inner_radius;
        const float ro2 = req.outer_radius * req.outer_radius;
        const float r = std::sqrt(rng.range(ri2, ro2));
        local = unit_dir(rng) * r;
        break;
      }
    }
    out.push_back(req.center + local);
  }
  return out;
}

} // namespace canopy
