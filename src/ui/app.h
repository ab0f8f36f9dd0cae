#pragma once

#include <string>

#include <SDL.h>

#include "canopy/core/simulation.h"
#include "canopy/core/spawn.h"

namespace canopy::ui {

// What a left click on the canvas places.
enum class SpawnTool {
  Root,
  Rect,
  Oval,
  Annulus,
};

// Interactive front-end over a Simulation.
//
// Reads the core only through its public interface (snapshot-style accessors,
// run_tick, spawn/reset/clear, configure). Owns the camera and the tick cadence.
class App {
 public:
  explicit App(Simulation sim);

  // Called once per frame.
  void frame();

  // SDL events not consumed by ImGui.
  void on_event(const SDL_Event& e);

  // World <-> screen mapping for a canvas whose center is at (cx, cy) pixels.
  // +y points up in world space.
  static Vec2 to_world(float sx, float sy, float cx, float cy, float zoom, Vec2 pan_px);
  static void to_screen(const Vec2& w, float cx, float cy, float zoom, Vec2 pan_px, float& sx, float& sy);

 private:
  void draw_top_bar();
  void draw_config_panel();
  void draw_canvas();
  void draw_status_bar();

  void step_once();
  void reset_scene();
  void apply_config();

  Simulation sim_;

  // Edited in the config panel; only pushed into the simulation by apply_config().
  Config pending_cfg_;
  std::string config_error_;

  SpawnTool tool_{SpawnTool::Oval};

  // Auto-run cadence.
  bool running_{false};
  float step_interval_s_{0.1f};
  double last_step_time_s_{0.0};
  double last_step_dt_s_{0.0};

  // Camera.
  float zoom_{3.0f};
  Vec2 pan_px_{0.0f, 0.0f};

  // Attractor being dragged with the right mouse button (-1 = none).
  long dragged_attractor_{-1};
};

} // namespace canopy::ui
