#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "canopy/core/vec2.h"

namespace canopy {

// How the attraction phase picks the k-th nearest node for an attractor.
//
// Global ranks every node in the tree (reference behavior): a node outside the
// influence radius can still be chosen, and is then simply rejected by the
// radius test. Local ranks only the nodes already inside the influence radius
// and falls back to the farthest of those when k exceeds their count.
enum class NeighborMode {
  Global,
  Local,
};

// Simulation parameters. Replaced as a whole via Simulation::configure(), so
// every phase of a tick sees one consistent set.
struct Config {
  // k used for the k-th nearest lookups (1 = nearest). Larger values let an
  // attractor feed a node further back in the structure, which spreads growth.
  int attract_from_kn{1};
  int kill_from_kn{1};

  // Radii are compared as squared distances (inclusive).
  float influence_radius{60.0f};
  float kill_radius{10.0f};

  // Distance between a parent and a newly grown child.
  float step_len{5.0f};

  // Added to every averaged growth direction before normalizing.
  Vec2 tropism{0.0f, 0.0f};

  // A candidate child closer than this to an existing child of the same parent
  // is dropped. 0 disables the check.
  float min_child_spacing{0.1f};

  // Radius given to roots; children inherit their parent's radius.
  float root_radius{1.0f};

  NeighborMode attract_mode{NeighborMode::Global};

  // --- Tick driver ---

  // Attraction -> growth -> kill cycles executed per run_tick().
  int cycles_per_tick{1};

  // Stop after this many phase-cycles in total. 0 means unlimited.
  int max_iterations{0};

  // Report a stall after this many consecutive phase-cycles without a kill.
  // 0 disables stall detection.
  int stall_window{0};

  // --- Spawn parameters ---
  //
  // Not read by any phase. The viewer/CLI turn these into SpawnRequests via
  // spawn_request_from_config().
  int spawn_count{1000};
  Vec2 spawn_rect_half_extents{100.0f, 100.0f};
  Vec2 spawn_oval_radii{100.0f, 100.0f};
  Vec2 spawn_annulus_radii{60.0f, 100.0f}; // x = inner, y = outer
};

// Validate a configuration.
//
// Returns human-readable error strings in field order.
// Empty => config is valid.
std::vector<std::string> validate_config(const Config& cfg);

// Thrown by Simulation::configure() when validate_config() reports errors.
class InvalidConfig : public std::invalid_argument {
 public:
  explicit InvalidConfig(std::vector<std::string> errors);

  const std::vector<std::string>& errors() const { return errors_; }

 private:
  std::vector<std::string> errors_;
};

} // namespace canopy
