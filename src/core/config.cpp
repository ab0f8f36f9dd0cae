#include "canopy/core/config.h"

#include <cmath>
#include <sstream>
#include <utility>

namespace canopy {

namespace {

void push(std::vector<std::string>& out, std::string msg) { out.push_back(std::move(msg)); }

template <typename... Parts>
std::string join(Parts&&... parts) {
  std::ostringstream ss;
  (ss << ... << std::forward<Parts>(parts));
  return ss.str();
}

void require_positive_int(std::vector<std::string>& errors, const char* name, int v) {
  if (v < 1) push(errors, join(name, " must be >= 1 (got ", v, ")"));
}

void require_non_negative_int(std::vector<std::string>& errors, const char* name, int v) {
  if (v < 0) push(errors, join(name, " must be >= 0 (got ", v, ")"));
}

void require_positive(std::vector<std::string>& errors, const char* name, float v) {
  if (!std::isfinite(v) || v <= 0.0f) push(errors, join(name, " must be a finite value > 0 (got ", v, ")"));
}

void require_non_negative(std::vector<std::string>& errors, const char* name, float v) {
  if (!std::isfinite(v) || v < 0.0f) push(errors, join(name, " must be a finite value >= 0 (got ", v, ")"));
}

std::string join_errors(const std::vector<std::string>& errors) {
  std::string out = "invalid config";
  for (std::size_t i = 0; i < errors.size(); ++i) {
    out += (i == 0) ? ": " : "; ";
    out += errors[i];
  }
  return out;
}

} // namespace

std::vector<std::string> validate_config(const Config& cfg) {
  std::vector<std::string> errors;

  require_positive_int(errors, "attract_from_kn", cfg.attract_from_kn);
  require_positive_int(errors, "kill_from_kn", cfg.kill_from_kn);
  require_positive(errors, "influence_radius", cfg.influence_radius);
  require_positive(errors, "kill_radius", cfg.kill_radius);
  require_positive(errors, "step_len", cfg.step_len);
  if (!cfg.tropism.is_finite()) push(errors, "tropism must be finite");
  require_non_negative(errors, "min_child_spacing", cfg.min_child_spacing);
  require_positive(errors, "root_radius", cfg.root_radius);

  require_positive_int(errors, "cycles_per_tick", cfg.cycles_per_tick);
  require_non_negative_int(errors, "max_iterations", cfg.max_iterations);
  require_non_negative_int(errors, "stall_window", cfg.stall_window);

  require_non_negative_int(errors, "spawn_count", cfg.spawn_count);
  require_non_negative(errors, "spawn_rect_half_extents.x", cfg.spawn_rect_half_extents.x);
  require_non_negative(errors, "spawn_rect_half_extents.y", cfg.spawn_rect_half_extents.y);
  require_non_negative(errors, "spawn_oval_radii.x", cfg.spawn_oval_radii.x);
  require_non_negative(errors, "spawn_oval_radii.y", cfg.spawn_oval_radii.y);
  require_non_negative(errors, "spawn_annulus_radii.x", cfg.spawn_annulus_radii.x);
  require_non_negative(errors, "spawn_annulus_radii.y", cfg.spawn_annulus_radii.y);
  if (cfg.spawn_annulus_radii.x > cfg.spawn_annulus_radii.y) {
    push(errors, join("spawn_annulus_radii inner (", cfg.spawn_annulus_radii.x, ") exceeds outer (",
                      cfg.spawn_annulus_radii.y, ")"));
  }

  return errors;
}

InvalidConfig::InvalidConfig(std::vector<std::string> errors)
    : std::invalid_argument(join_errors(errors)), errors_(std::move(errors)) {}

} // namespace canopy
