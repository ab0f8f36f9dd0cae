#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "canopy/core/attractor.h"
#include "canopy/core/config.h"
#include "canopy/core/ids.h"
#include "canopy/core/influence_buffer.h"
#include "canopy/core/spawn.h"
#include "canopy/core/tree.h"
#include "canopy/util/hash_rng.h"

namespace canopy {

// Why the driver stopped advancing. Evaluated after every tick in this order.
enum class TerminalCondition {
  AllAttractorsDead,
  MaxIterations,
  StopRequested,
  Stalled,
};

struct TickSummary {
  // New node ids in assignment order across every cycle of the tick.
  std::vector<NodeId> nodes_added;
  int attractors_killed{0};
  // Kills per executed phase-cycle (size == cycles_run).
  std::vector<int> kills_per_cycle;
  int cycles_run{0};
  std::optional<TerminalCondition> terminal;
};

struct SimCounters {
  std::uint64_t ticks{0};
  std::uint64_t phase_cycles{0};
  std::uint64_t total_killed{0};
  // Phase-cycles since the last kill (drives stall detection).
  std::uint64_t consecutive_idle_cycles{0};
};

// Read-only copy of the renderable state.
struct NodeView {
  NodeId id{0};
  Vec2 pos;
  float radius{1.0f};
  std::optional<NodeId> parent;
};

struct AttractorView {
  Vec2 pos;
  bool alive{true};
};

struct Snapshot {
  std::vector<NodeView> nodes;
  std::vector<AttractorView> attractors;
};

// Owns one Tree + AttractorSet and advances them tick by tick.
//
// Nothing here is global: any number of simulations can coexist. Everything
// runs synchronously on the caller's thread; stop requests are only observed
// between ticks.
class Simulation {
 public:
  // Throws InvalidConfig if `cfg` does not validate. Starts empty.
  explicit Simulation(Config cfg = Config{}, std::uint64_t seed = 1);

  const Config& cfg() const { return cfg_; }

  // Validate and replace the active parameters. On failure throws InvalidConfig
  // and keeps the previous configuration.
  void configure(const Config& cfg);

  // Discard everything, then add one root per seed and scatter `spawn`.
  // Clears any latched terminal condition and all counters.
  void reset(const std::vector<Vec2>& seed_positions, const SpawnRequest& spawn);

  // Drop all nodes and attractors.
  void clear();

  // Append-only edits between ticks.
  NodeId spawn_root(Vec2 pos);
  std::size_t spawn_attractors(const SpawnRequest& req);
  void spawn_attractors_at(const std::vector<Vec2>& positions);
  void move_attractor(AttractorIndex i, Vec2 pos);

  // Run cfg().cycles_per_tick phase-cycles (fewer if max_iterations would be
  // exceeded), then evaluate the terminal conditions. Once a condition has
  // fired the driver does no further work until resume()/reset()/clear().
  TickSummary run_tick();

  // Cooperative stop; observed by the next run_tick().
  void request_stop() { stop_requested_ = true; }
  bool stop_requested() const { return stop_requested_; }

  // Clear a latched terminal condition and the stall counter so the caller can
  // continue regardless.
  void resume();

  std::optional<TerminalCondition> terminal() const { return terminal_; }

  Snapshot snapshot() const;

  const Tree& tree() const { return tree_; }
  const AttractorSet& attractors() const { return attractors_; }
  const SimCounters& counters() const { return counters_; }
  const std::vector<NodeId>& last_new_nodes() const { return last_new_nodes_; }

 private:
  void run_cycle(TickSummary& out);
  std::optional<TerminalCondition> evaluate_terminal() const;

  Config cfg_;
  Tree tree_;
  AttractorSet attractors_;
  InfluenceBuffer acc_;
  util::HashRng rng_;

  SimCounters counters_{};
  std::vector<NodeId> last_new_nodes_;
  std::optional<TerminalCondition> terminal_;
  bool stop_requested_{false};
};

} // namespace canopy
