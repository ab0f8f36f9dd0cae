#include <cstdint>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

#include "canopy/core/config.h"
#include "canopy/core/enum_strings.h"
#include "canopy/core/simulation.h"
#include "canopy/core/spawn.h"
#include "canopy/util/cli_args.h"
#include "canopy/util/log.h"

namespace {

#ifndef CANOPY_VERSION
#define CANOPY_VERSION "unknown"
#endif

using canopy::util::get_float_arg;
using canopy::util::get_int_arg;
using canopy::util::get_str_arg;
using canopy::util::has_flag;

void print_usage(const char* exe) {
  std::cout << "canopy CLI v" << CANOPY_VERSION << "\n\n";
  std::cout << "Usage: " << (exe ? exe : "canopy_cli") << " [options]\n\n";
  std::cout << "Runs the space-colonization growth headless until it converges, stalls or\n";
  std::cout << "runs out of ticks, then prints a summary.\n\n";
  std::cout << "Run control:\n";
  std::cout << "  --ticks N            Maximum ticks to run (default: 200)\n";
  std::cout << "  --cycles-per-tick N  Phase-cycles per tick (default: 1)\n";
  std::cout << "  --max-iterations N   Stop after N phase-cycles in total (0 = unlimited)\n";
  std::cout << "  --stall-window N     Stop after N consecutive cycles without a kill (0 = off)\n";
  std::cout << "  --seed N             Attractor cloud seed (default: 1)\n";
  std::cout << "\nSetup:\n";
  std::cout << "  --root-x X --root-y Y        Seed root position (default: 0 0)\n";
  std::cout << "  --shape NAME                 rect|oval|circle|annulus (default: oval)\n";
  std::cout << "  --center-x X --center-y Y    Cloud center (default: 0 120)\n";
  std::cout << "  --count N                    Attractor count (default: 1000)\n";
  std::cout << "  --rect-hx X --rect-hy Y      Rect half extents (default: 100 100)\n";
  std::cout << "  --oval-rx X --oval-ry Y      Oval radii (default: 100 100)\n";
  std::cout << "  --annulus-inner R --annulus-outer R  Annulus radii (default: 60 100)\n";
  std::cout << "\nGrowth parameters:\n";
  std::cout << "  --attract-kn K       k for the attraction lookup (default: 1)\n";
  std::cout << "  --kill-kn K          k for the kill lookup (default: 1)\n";
  std::cout << "  --influence-radius R (default: 60)\n";
  std::cout << "  --kill-radius R      (default: 10)\n";
  std::cout << "  --step-len L         (default: 5)\n";
  std::cout << "  --tropism-x X --tropism-y Y  Directional bias (default: 0 0)\n";
  std::cout << "  --min-spacing D      Minimum distance between siblings (default: 0.1)\n";
  std::cout << "  --root-radius R      (default: 1)\n";
  std::cout << "  --neighbors MODE     global|local attraction lookup (default: global)\n";
  std::cout << "\nOutput:\n";
  std::cout << "  --list-nodes         Print every node (id, parent, position) after the run\n";
  std::cout << "  --list-attractors    Print every attractor (index, alive, position) after the run\n";
  std::cout << "  --log-level LEVEL    debug|info|warn|error|off (default: info)\n";
  std::cout << "  --quiet              Only print errors and the final summary line\n";
  std::cout << "  -h, --help           Show this help\n";
  std::cout << "  --version            Print version and exit\n";
}

canopy::Config config_from_args(int argc, char** argv) {
  canopy::Config cfg;
  cfg.attract_from_kn = get_int_arg(argc, argv, "--attract-kn", cfg.attract_from_kn);
  cfg.kill_from_kn = get_int_arg(argc, argv, "--kill-kn", cfg.kill_from_kn);
  cfg.influence_radius = get_float_arg(argc, argv, "--influence-radius", cfg.influence_radius);
  cfg.kill_radius = get_float_arg(argc, argv, "--kill-radius", cfg.kill_radius);
  cfg.step_len = get_float_arg(argc, argv, "--step-len", cfg.step_len);
  cfg.tropism.x = get_float_arg(argc, argv, "--tropism-x", cfg.tropism.x);
  cfg.tropism.y = get_float_arg(argc, argv, "--tropism-y", cfg.tropism.y);
  cfg.min_child_spacing = get_float_arg(argc, argv, "--min-spacing", cfg.min_child_spacing);
  cfg.root_radius = get_float_arg(argc, argv, "--root-radius", cfg.root_radius);
  cfg.cycles_per_tick = get_int_arg(argc, argv, "--cycles-per-tick", cfg.cycles_per_tick);
  cfg.max_iterations = get_int_arg(argc, argv, "--max-iterations", cfg.max_iterations);
  cfg.stall_window = get_int_arg(argc, argv, "--stall-window", cfg.stall_window);
  cfg.spawn_count = get_int_arg(argc, argv, "--count", cfg.spawn_count);
  cfg.spawn_rect_half_extents.x = get_float_arg(argc, argv, "--rect-hx", cfg.spawn_rect_half_extents.x);
  cfg.spawn_rect_half_extents.y = get_float_arg(argc, argv, "--rect-hy", cfg.spawn_rect_half_extents.y);
  cfg.spawn_oval_radii.x = get_float_arg(argc, argv, "--oval-rx", cfg.spawn_oval_radii.x);
  cfg.spawn_oval_radii.y = get_float_arg(argc, argv, "--oval-ry", cfg.spawn_oval_radii.y);
  cfg.spawn_annulus_radii.x = get_float_arg(argc, argv, "--annulus-inner", cfg.spawn_annulus_radii.x);
  cfg.spawn_annulus_radii.y = get_float_arg(argc, argv, "--annulus-outer", cfg.spawn_annulus_radii.y);
  return cfg;
}

} // namespace

int main(int argc, char** argv) {
  try {
    if (has_flag(argc, argv, "--version")) {
      std::cout << CANOPY_VERSION << "\n";
      return 0;
    }
    if (has_flag(argc, argv, "--help") || has_flag(argc, argv, "-h")) {
      print_usage(argv[0]);
      return 0;
    }

    const bool quiet = has_flag(argc, argv, "--quiet");
    canopy::log::set_level(quiet ? canopy::log::Level::Warn : canopy::log::Level::Info);

    const std::string log_level = get_str_arg(argc, argv, "--log-level", "");
    if (!log_level.empty()) {
      canopy::log::Level lvl = canopy::log::Level::Info;
      if (!canopy::log::parse_level(log_level, lvl)) {
        std::cerr << "Unknown --log-level: '" << log_level << "'\n\n";
        print_usage(argv[0]);
        return 2;
      }
      canopy::log::set_level(lvl);
    }

    const int ticks = get_int_arg(argc, argv, "--ticks", 200);
    if (ticks < 0) {
      std::cerr << "--ticks must be >= 0\n\n";
      print_usage(argv[0]);
      return 2;
    }
    const int seed = get_int_arg(argc, argv, "--seed", 1);

    canopy::Config cfg = config_from_args(argc, argv);
    const std::string neighbors = get_str_arg(argc, argv, "--neighbors", "global");
    if (!canopy::neighbor_mode_from_string(neighbors, cfg.attract_mode)) {
      std::cerr << "Unknown --neighbors: '" << neighbors << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    canopy::SpawnShape shape = canopy::SpawnShape::Oval;
    const std::string shape_name = get_str_arg(argc, argv, "--shape", "oval");
    if (!canopy::spawn_shape_from_string(shape_name, shape)) {
      std::cerr << "Unknown --shape: '" << shape_name << "'\n\n";
      print_usage(argv[0]);
      return 2;
    }

    const auto errors = canopy::validate_config(cfg);
    if (!errors.empty()) {
      std::cerr << "Invalid configuration:\n";
      for (const auto& e : errors) std::cerr << "  - " << e << "\n";
      return 1;
    }

    canopy::Simulation sim(cfg, static_cast<std::uint64_t>(seed));

    const canopy::Vec2 root{get_float_arg(argc, argv, "--root-x", 0.0f), get_float_arg(argc, argv, "--root-y", 0.0f)};
    const canopy::Vec2 center{get_float_arg(argc, argv, "--center-x", 0.0f),
                              get_float_arg(argc, argv, "--center-y", 120.0f)};
    sim.reset({root}, canopy::spawn_request_from_config(cfg, shape, center));

    int ran = 0;
    for (; ran < ticks; ++ran) {
      const auto summary = sim.run_tick();
      if (summary.terminal) {
        ++ran;
        break;
      }
    }

    if (has_flag(argc, argv, "--list-nodes")) {
      const auto snap = sim.snapshot();
      std::cout << "Nodes: " << snap.nodes.size() << "\n";
      for (const auto& n : snap.nodes) {
        std::cout << "  " << n.id << "\t";
        if (n.parent) {
          std::cout << *n.parent;
        } else {
          std::cout << "-";
        }
        std::cout << "\t" << n.pos.x << "\t" << n.pos.y << "\n";
      }
    }
    if (has_flag(argc, argv, "--list-attractors")) {
      const auto snap = sim.snapshot();
      std::cout << "Attractors: " << snap.attractors.size() << "\n";
      for (std::size_t i = 0; i < snap.attractors.size(); ++i) {
        const auto& a = snap.attractors[i];
        std::cout << "  " << i << "\t" << (a.alive ? "alive" : "dead") << "\t" << a.pos.x << "\t" << a.pos.y << "\n";
      }
    }

    const auto& c = sim.counters();
    const std::string why = sim.terminal() ? canopy::terminal_condition_to_string(*sim.terminal()) : "tick_budget";
    if (!quiet) {
      std::cout << "Ticks run:         " << ran << "\n";
      std::cout << "Phase-cycles:      " << c.phase_cycles << "\n";
      std::cout << "Nodes:             " << sim.tree().size() << "\n";
      std::cout << "Attractors alive:  " << sim.attractors().alive_count() << " / " << sim.attractors().size()
                << "\n";
      std::cout << "Attractors killed: " << c.total_killed << "\n";
      std::cout << "Stopped because:   " << why << "\n";
    } else {
      std::cout << "nodes=" << sim.tree().size() << " alive=" << sim.attractors().alive_count()
                << " cycles=" << c.phase_cycles << " stop=" << why << "\n";
    }
    return 0;
  } catch (const canopy::util::UsageError& e) {
    std::cerr << e.what() << "\n\n";
    print_usage(argc > 0 ? argv[0] : nullptr);
    return 2;
  } catch (const canopy::InvalidConfig& e) {
    canopy::log::error(e.what());
    return 1;
  } catch (const std::exception& e) {
    canopy::log::error(std::string("Fatal: ") + e.what());
    return 1;
  }
}
