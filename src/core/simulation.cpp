#include "canopy/core/simulation.h"

#include <algorithm>
#include <string>
#include <utility>

#include "canopy/core/enum_strings.h"
#include "canopy/core/phases.h"
#include "canopy/util/log.h"

namespace canopy {

Simulation::Simulation(Config cfg, std::uint64_t seed) : rng_(seed) {
  auto errors = validate_config(cfg);
  if (!errors.empty()) throw InvalidConfig(std::move(errors));
  cfg_ = cfg;
}

void Simulation::configure(const Config& cfg) {
  auto errors = validate_config(cfg);
  if (!errors.empty()) {
    InvalidConfig err(std::move(errors));
    log::warn(std::string("Rejected config, keeping previous: ") + err.what());
    throw err;
  }
  cfg_ = cfg;
  log::info("Config updated (influence_radius=" + std::to_string(cfg_.influence_radius) +
            ", kill_radius=" + std::to_string(cfg_.kill_radius) + ", step_len=" + std::to_string(cfg_.step_len) +
            ", mode=" + neighbor_mode_to_string(cfg_.attract_mode) + ")");
}

void Simulation::reset(const std::vector<Vec2>& seed_positions, const SpawnRequest& spawn) {
  // Sample before touching state so a bad request leaves the simulation intact.
  const std::vector<Vec2> cloud = sample_spawn_positions(spawn, rng_);

  tree_.clear();
  attractors_.clear();
  for (const Vec2& p : seed_positions) tree_.add_root(p, cfg_.root_radius);
  attractors_.extend(cloud);

  acc_.ensure_len(tree_.size());
  counters_ = SimCounters{};
  last_new_nodes_.clear();
  terminal_.reset();
  stop_requested_ = false;

  log::info("Reset: " + std::to_string(tree_.size()) + " root(s), " + std::to_string(attractors_.size()) +
            " attractor(s) (" + spawn_shape_to_string(spawn.shape) + ")");
}

void Simulation::clear() {
  tree_.clear();
  attractors_.clear();
  acc_.ensure_len(0);
  counters_ = SimCounters{};
  last_new_nodes_.clear();
  terminal_.reset();
  stop_requested_ = false;
  log::info("Cleared simulation");
}

NodeId Simulation::spawn_root(Vec2 pos) {
  const NodeId id = tree_.add_root(pos, cfg_.root_radius);
  last_new_nodes_.assign(1, id);
  return id;
}

std::size_t Simulation::spawn_attractors(const SpawnRequest& req) {
  const std::vector<Vec2> cloud = sample_spawn_positions(req, rng_);
  attractors_.extend(cloud);
  log::debug("Spawned " + std::to_string(cloud.size()) + " attractor(s) (" + spawn_shape_to_string(req.shape) + ")");
  return cloud.size();
}

void Simulation::spawn_attractors_at(const std::vector<Vec2>& positions) { attractors_.extend(positions); }

void Simulation::move_attractor(AttractorIndex i, Vec2 pos) { attractors_.set_position(i, pos); }

void Simulation::resume() {
  terminal_.reset();
  stop_requested_ = false;
  counters_.consecutive_idle_cycles = 0;
}

void Simulation::run_cycle(TickSummary& out) {
  attraction_phase(tree_, attractors_, cfg_, acc_);
  const GrowthReport grown = growth_phase(tree_, acc_, cfg_);
  const KillReport killed = kill_phase(tree_, attractors_, cfg_);

  const int kills = static_cast<int>(killed.killed.size());
  out.nodes_added.insert(out.nodes_added.end(), grown.new_nodes.begin(), grown.new_nodes.end());
  out.kills_per_cycle.push_back(kills);
  out.attractors_killed += kills;
  ++out.cycles_run;

  ++counters_.phase_cycles;
  counters_.total_killed += static_cast<std::uint64_t>(kills);
  counters_.consecutive_idle_cycles = (kills == 0) ? counters_.consecutive_idle_cycles + 1 : 0;
}

std::optional<TerminalCondition> Simulation::evaluate_terminal() const {
  if (!attractors_.any_alive()) return TerminalCondition::AllAttractorsDead;
  if (cfg_.max_iterations > 0 && counters_.phase_cycles >= static_cast<std::uint64_t>(cfg_.max_iterations)) {
    return TerminalCondition::MaxIterations;
  }
  if (stop_requested_) return TerminalCondition::StopRequested;
  if (cfg_.stall_window > 0 &&
      counters_.consecutive_idle_cycles >= static_cast<std::uint64_t>(cfg_.stall_window)) {
    return TerminalCondition::Stalled;
  }
  return std::nullopt;
}

TickSummary Simulation::run_tick() {
  TickSummary out;
  if (terminal_) {
    out.terminal = terminal_;
    return out;
  }
  if (stop_requested_) {
    terminal_ = TerminalCondition::StopRequested;
    stop_requested_ = false;
    out.terminal = terminal_;
    log::info("Simulation stopped: " + terminal_condition_to_string(*terminal_));
    return out;
  }

  int cycles = cfg_.cycles_per_tick;
  if (cfg_.max_iterations > 0) {
    const std::uint64_t cap = static_cast<std::uint64_t>(cfg_.max_iterations);
    const std::uint64_t remaining = (counters_.phase_cycles < cap) ? cap - counters_.phase_cycles : 0;
    cycles = static_cast<int>(std::min<std::uint64_t>(static_cast<std::uint64_t>(cycles), remaining));
  }

  for (int i = 0; i < cycles; ++i) run_cycle(out);
  ++counters_.ticks;
  last_new_nodes_ = out.nodes_added;

  terminal_ = evaluate_terminal();
  if (terminal_) {
    stop_requested_ = false;
    out.terminal = terminal_;
    log::info("Simulation stopped after " + std::to_string(counters_.phase_cycles) +
              " cycle(s): " + terminal_condition_to_string(*terminal_));
  }

  log::debug("Tick " + std::to_string(counters_.ticks) + ": +" + std::to_string(out.nodes_added.size()) +
             " node(s), " + std::to_string(out.attractors_killed) + " kill(s), " +
             std::to_string(attractors_.alive_count()) + " alive");
  return out;
}

Snapshot Simulation::snapshot() const {
  Snapshot s;
  s.nodes.reserve(tree_.size());
  for (NodeId id = 0; id < tree_.size(); ++id) {
    const Node& n = tree_.nodes()[id];
    s.nodes.push_back(NodeView{id, n.pos, n.radius, n.parent});
  }
  s.attractors.reserve(attractors_.size());
  for (const Attractor& a : attractors_.points()) s.attractors.push_back(AttractorView{a.pos, a.alive});
  return s;
}

} // namespace canopy
