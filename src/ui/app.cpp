#include "ui/app.h"

#include <imgui.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>

#include "canopy/core/enum_strings.h"
#include "canopy/util/log.h"

namespace canopy::ui {
namespace {

constexpr float kTwoPi = 6.28318530717958647692f;

// Scene used by the Reset button: one root under an oval cloud.
const Vec2 kDefaultRoot{0.0f, 0.0f};
const Vec2 kDefaultCloudCenter{0.0f, 120.0f};

ImU32 color_edge() { return IM_COL32(144, 238, 144, 255); }
ImU32 color_node() { return IM_COL32(173, 216, 230, 255); }
ImU32 color_new_node() { return IM_COL32(255, 60, 60, 255); }
ImU32 color_attractor() { return IM_COL32(255, 160, 160, 255); }
ImU32 color_hint() { return IM_COL32(255, 255, 0, 255); }

SpawnShape shape_for_tool(SpawnTool t) {
  switch (t) {
    case SpawnTool::Rect: return SpawnShape::Rect;
    case SpawnTool::Annulus: return SpawnShape::Annulus;
    case SpawnTool::Oval:
    case SpawnTool::Root: break;
  }
  return SpawnShape::Oval;
}

bool drag_int(const char* label, int* v, int lo, int hi) {
  return ImGui::DragInt(label, v, 1.0f, lo, hi);
}

bool drag_float(const char* label, float* v, float speed, float lo, float hi) {
  return ImGui::DragFloat(label, v, speed, lo, hi, "%.2f");
}

} // namespace

Vec2 App::to_world(float sx, float sy, float cx, float cy, float zoom, Vec2 pan_px) {
  return Vec2{(sx - cx - pan_px.x) / zoom, (cy - sy + pan_px.y) / zoom};
}

void App::to_screen(const Vec2& w, float cx, float cy, float zoom, Vec2 pan_px, float& sx, float& sy) {
  sx = cx + w.x * zoom + pan_px.x;
  sy = cy - w.y * zoom + pan_px.y;
}

App::App(Simulation sim) : sim_(std::move(sim)), pending_cfg_(sim_.cfg()) {
  if (sim_.tree().empty() && sim_.attractors().empty()) reset_scene();
}

void App::on_event(const SDL_Event& e) {
  if (e.type == SDL_KEYDOWN && !ImGui::GetIO().WantTextInput) {
    if (e.key.keysym.sym == SDLK_SPACE) running_ = !running_;
    if (e.key.keysym.sym == SDLK_s) step_once();
    if (e.key.keysym.sym == SDLK_r) reset_scene();
  }
}

void App::step_once() {
  const double now = ImGui::GetTime();
  if (last_step_time_s_ > 0.0) last_step_dt_s_ = now - last_step_time_s_;
  last_step_time_s_ = now;

  const TickSummary summary = sim_.run_tick();
  if (summary.terminal) running_ = false;
}

void App::reset_scene() {
  try {
    sim_.reset({kDefaultRoot}, spawn_request_from_config(sim_.cfg(), SpawnShape::Oval, kDefaultCloudCenter));
  } catch (const std::exception& e) {
    log::error(std::string("Reset failed: ") + e.what());
  }
  running_ = false;
}

void App::apply_config() {
  try {
    sim_.configure(pending_cfg_);
    config_error_.clear();
  } catch (const InvalidConfig& e) {
    config_error_ = e.what();
  }
}

void App::frame() {
  const ImGuiViewport* vp = ImGui::GetMainViewport();
  const float top_h = 40.0f;
  const float status_h = 28.0f;
  const float panel_w = 280.0f;

  const ImGuiWindowFlags fixed = ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize | ImGuiWindowFlags_NoCollapse |
                                 ImGuiWindowFlags_NoTitleBar | ImGuiWindowFlags_NoSavedSettings;

  ImGui::SetNextWindowPos(vp->WorkPos);
  ImGui::SetNextWindowSize(ImVec2(vp->WorkSize.x, top_h));
  if (ImGui::Begin("##top_bar", nullptr, fixed)) draw_top_bar();
  ImGui::End();

  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x - panel_w, vp->WorkPos.y + top_h));
  ImGui::SetNextWindowSize(ImVec2(panel_w, vp->WorkSize.y - top_h - status_h));
  if (ImGui::Begin("Config", nullptr, ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoResize |
                                          ImGuiWindowFlags_NoCollapse | ImGuiWindowFlags_NoSavedSettings)) {
    draw_config_panel();
  }
  ImGui::End();

  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x, vp->WorkPos.y + top_h));
  ImGui::SetNextWindowSize(ImVec2(vp->WorkSize.x - panel_w, vp->WorkSize.y - top_h - status_h));
  if (ImGui::Begin("##canvas", nullptr, fixed | ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse)) {
    draw_canvas();
  }
  ImGui::End();

  ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x, vp->WorkPos.y + vp->WorkSize.y - status_h));
  ImGui::SetNextWindowSize(ImVec2(vp->WorkSize.x, status_h));
  if (ImGui::Begin("##status_bar", nullptr, fixed)) draw_status_bar();
  ImGui::End();

  if (running_) {
    const double now = ImGui::GetTime();
    if (now - last_step_time_s_ >= static_cast<double>(step_interval_s_)) step_once();
  }
}

void App::draw_top_bar() {
  if (ImGui::Button(running_ ? "Pause" : "Run")) {
    running_ = !running_;
    // A latched terminal condition would make every tick a no-op.
    if (running_ && sim_.terminal()) sim_.resume();
  }
  ImGui::SameLine();
  if (ImGui::Button("Step")) step_once();
  ImGui::SameLine();
  if (ImGui::Button("Reset")) reset_scene();
  ImGui::SameLine();
  if (ImGui::Button("Clear")) {
    sim_.clear();
    running_ = false;
  }
  ImGui::SameLine();
  ImGui::SetNextItemWidth(120.0f);
  ImGui::DragFloat("dt target (s)", &step_interval_s_, 0.01f, 0.0f, 1.0f, "%.2f");
  ImGui::SameLine();
  ImGui::SetNextItemWidth(160.0f);
  ImGui::SliderFloat("Zoom", &zoom_, 0.1f, 10.0f, "%.2f");

  ImGui::SameLine();
  ImGui::TextUnformatted("|");
  const auto tool_button = [&](const char* label, SpawnTool t) {
    ImGui::SameLine();
    if (ImGui::RadioButton(label, tool_ == t)) tool_ = t;
  };
  tool_button("Root", SpawnTool::Root);
  tool_button("Rect", SpawnTool::Rect);
  tool_button("Oval", SpawnTool::Oval);
  tool_button("Annulus", SpawnTool::Annulus);
}

void App::draw_config_panel() {
  ImGui::TextDisabled("K-nearest");
  drag_int("attract_from_kn", &pending_cfg_.attract_from_kn, 1, 10);
  drag_int("kill_from_kn", &pending_cfg_.kill_from_kn, 1, 10);
  bool local = pending_cfg_.attract_mode == NeighborMode::Local;
  if (ImGui::Checkbox("local neighbor ranking", &local)) {
    pending_cfg_.attract_mode = local ? NeighborMode::Local : NeighborMode::Global;
  }

  ImGui::Separator();
  ImGui::TextDisabled("Radii");
  drag_float("influence_radius", &pending_cfg_.influence_radius, 0.5f, 0.0f, 200.0f);
  drag_float("kill_radius", &pending_cfg_.kill_radius, 0.5f, 0.0f, 200.0f);

  ImGui::Separator();
  ImGui::TextDisabled("Growth");
  drag_float("step_len", &pending_cfg_.step_len, 0.2f, 0.0f, 20.0f);
  drag_float("tropism.x", &pending_cfg_.tropism.x, 0.05f, -2.0f, 2.0f);
  drag_float("tropism.y", &pending_cfg_.tropism.y, 0.05f, -2.0f, 2.0f);
  drag_float("min spacing", &pending_cfg_.min_child_spacing, 0.01f, 0.0f, 10.0f);

  ImGui::Separator();
  ImGui::TextDisabled("Driver");
  drag_int("cycles / tick", &pending_cfg_.cycles_per_tick, 1, 100);
  drag_int("max iterations", &pending_cfg_.max_iterations, 0, 1000000);
  drag_int("stall window", &pending_cfg_.stall_window, 0, 10000);

  ImGui::Separator();
  ImGui::TextDisabled("Spawning");
  drag_int("attractors", &pending_cfg_.spawn_count, 1, 5000);
  drag_float("rect hx", &pending_cfg_.spawn_rect_half_extents.x, 1.0f, 0.0f, 1000.0f);
  drag_float("rect hy", &pending_cfg_.spawn_rect_half_extents.y, 1.0f, 0.0f, 1000.0f);
  drag_float("oval rx", &pending_cfg_.spawn_oval_radii.x, 1.0f, 0.0f, 1000.0f);
  drag_float("oval ry", &pending_cfg_.spawn_oval_radii.y, 1.0f, 0.0f, 1000.0f);
  drag_float("annulus inner", &pending_cfg_.spawn_annulus_radii.x, 1.0f, 0.0f, 1000.0f);
  drag_float("annulus outer", &pending_cfg_.spawn_annulus_radii.y, 1.0f, 0.0f, 1000.0f);

  ImGui::Separator();
  if (ImGui::Button("Apply")) apply_config();
  ImGui::SameLine();
  if (ImGui::Button("Revert")) {
    pending_cfg_ = sim_.cfg();
    config_error_.clear();
  }
  ImGui::SameLine();
  if (ImGui::Button("Defaults")) pending_cfg_ = Config{};

  if (!config_error_.empty()) {
    ImGui::PushStyleColor(ImGuiCol_Text, IM_COL32(255, 120, 120, 255));
    ImGui::TextWrapped("%s", config_error_.c_str());
    ImGui::PopStyleColor();
  }
}

void App::draw_canvas() {
  const ImVec2 avail = ImGui::GetContentRegionAvail();
  const ImVec2 origin = ImGui::GetCursorScreenPos();
  const float cx = origin.x + avail.x * 0.5f;
  const float cy = origin.y + avail.y * 0.5f;

  ImGui::InvisibleButton("##canvas_area", ImVec2(std::max(avail.x, 1.0f), std::max(avail.y, 1.0f)),
                         ImGuiButtonFlags_MouseButtonLeft | ImGuiButtonFlags_MouseButtonRight |
                             ImGuiButtonFlags_MouseButtonMiddle);
  const bool hovered = ImGui::IsItemHovered();
  const ImGuiIO& io = ImGui::GetIO();
  const Vec2 mouse_world = to_world(io.MousePos.x, io.MousePos.y, cx, cy, zoom_, pan_px_);

  // Zoom around the cursor.
  if (hovered && io.MouseWheel != 0.0f) {
    const float factor = std::clamp(1.0f + io.MouseWheel * 0.1f, 0.5f, 2.0f);
    zoom_ = std::clamp(zoom_ * factor, 0.1f, 10.0f);
    float sx = 0.0f;
    float sy = 0.0f;
    to_screen(mouse_world, cx, cy, zoom_, pan_px_, sx, sy);
    pan_px_.x += io.MousePos.x - sx;
    pan_px_.y += io.MousePos.y - sy;
  }

  // Pan with middle drag.
  if (ImGui::IsItemActive() && ImGui::IsMouseDragging(ImGuiMouseButton_Middle)) {
    pan_px_.x += io.MouseDelta.x;
    pan_px_.y += io.MouseDelta.y;
  }

  // Spawn on left click.
  if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Left)) {
    try {
      if (tool_ == SpawnTool::Root) {
        sim_.spawn_root(mouse_world);
      } else {
        sim_.spawn_attractors(spawn_request_from_config(sim_.cfg(), shape_for_tool(tool_), mouse_world));
      }
      // New material to work with: let the driver continue after a latched stop.
      if (sim_.terminal()) sim_.resume();
    } catch (const std::exception& e) {
      log::warn(std::string("Spawn failed: ") + e.what());
    }
  }

  // Right-drag moves the nearest alive attractor under the cursor.
  const auto& points = sim_.attractors().points();
  if (hovered && ImGui::IsMouseClicked(ImGuiMouseButton_Right)) {
    const float pick_r = 6.0f / zoom_;
    float best = pick_r * pick_r;
    dragged_attractor_ = -1;
    for (std::size_t i = 0; i < points.size(); ++i) {
      if (!points[i].alive) continue;
      const float d2 = distance_squared(points[i].pos, mouse_world);
      if (d2 <= best) {
        best = d2;
        dragged_attractor_ = static_cast<long>(i);
      }
    }
  }
  if (dragged_attractor_ >= 0) {
    if (ImGui::IsMouseDown(ImGuiMouseButton_Right) &&
        static_cast<std::size_t>(dragged_attractor_) < points.size()) {
      sim_.move_attractor(static_cast<AttractorIndex>(dragged_attractor_), mouse_world);
    } else {
      dragged_attractor_ = -1;
    }
  }

  auto* draw = ImGui::GetWindowDrawList();
  draw->PushClipRect(origin, ImVec2(origin.x + avail.x, origin.y + avail.y), true);
  draw->AddRectFilled(origin, ImVec2(origin.x + avail.x, origin.y + avail.y), IM_COL32(12, 14, 18, 255));

  const auto& nodes = sim_.tree().nodes();
  const auto& fresh_ids = sim_.last_new_nodes();
  const std::unordered_set<NodeId> fresh(fresh_ids.begin(), fresh_ids.end());

  // Edges.
  for (const Node& n : nodes) {
    float ax = 0.0f;
    float ay = 0.0f;
    to_screen(n.pos, cx, cy, zoom_, pan_px_, ax, ay);
    for (NodeId cid : n.children) {
      float bx = 0.0f;
      float by = 0.0f;
      to_screen(nodes[cid].pos, cx, cy, zoom_, pan_px_, bx, by);
      draw->AddLine(ImVec2(ax, ay), ImVec2(bx, by), color_edge(), 1.0f);
    }
  }

  // Nodes (newest highlighted).
  for (NodeId id = 0; id < nodes.size(); ++id) {
    float sx = 0.0f;
    float sy = 0.0f;
    to_screen(nodes[id].pos, cx, cy, zoom_, pan_px_, sx, sy);
    const float r = std::max(nodes[id].radius * zoom_, 2.0f);
    draw->AddCircleFilled(ImVec2(sx, sy), r, fresh.count(id) ? color_new_node() : color_node());
  }

  // Alive attractors.
  for (const Attractor& a : points) {
    if (!a.alive) continue;
    float sx = 0.0f;
    float sy = 0.0f;
    to_screen(a.pos, cx, cy, zoom_, pan_px_, sx, sy);
    draw->AddCircleFilled(ImVec2(sx, sy), 2.0f, color_attractor());
  }

  // Tool hint at the cursor.
  if (hovered) {
    const Config& cfg = sim_.cfg();
    const auto outline = [&](Vec2 radii) {
      constexpr int kSegments = 64;
      ImVec2 pts[kSegments];
      for (int i = 0; i < kSegments; ++i) {
        const float t = kTwoPi * static_cast<float>(i) / static_cast<float>(kSegments);
        const Vec2 w = mouse_world + Vec2{std::cos(t) * radii.x, std::sin(t) * radii.y};
        to_screen(w, cx, cy, zoom_, pan_px_, pts[i].x, pts[i].y);
      }
      draw->AddPolyline(pts, kSegments, color_hint(), ImDrawFlags_Closed, 1.5f);
    };

    switch (tool_) {
      case SpawnTool::Root: {
        float sx = 0.0f;
        float sy = 0.0f;
        to_screen(mouse_world, cx, cy, zoom_, pan_px_, sx, sy);
        draw->AddCircleFilled(ImVec2(sx, sy), cfg.step_len * zoom_ * 0.5f, IM_COL32(0, 200, 0, 255));
        break;
      }
      case SpawnTool::Rect: {
        const Vec2 h = cfg.spawn_rect_half_extents;
        float x0 = 0.0f;
        float y0 = 0.0f;
        float x1 = 0.0f;
        float y1 = 0.0f;
        to_screen(mouse_world + Vec2{-h.x, h.y}, cx, cy, zoom_, pan_px_, x0, y0);
        to_screen(mouse_world + Vec2{h.x, -h.y}, cx, cy, zoom_, pan_px_, x1, y1);
        draw->AddRect(ImVec2(x0, y0), ImVec2(x1, y1), color_hint(), 0.0f, 0, 1.5f);
        break;
      }
      case SpawnTool::Oval: outline(cfg.spawn_oval_radii); break;
      case SpawnTool::Annulus:
        outline(Vec2{cfg.spawn_annulus_radii.x, cfg.spawn_annulus_radii.x});
        outline(Vec2{cfg.spawn_annulus_radii.y, cfg.spawn_annulus_radii.y});
        break;
    }
  }

  draw->PopClipRect();
}

void App::draw_status_bar() {
  const auto& c = sim_.counters();
  ImGui::Text("nodes = %zu   alive attractors = %zu / %zu   cycles = %llu   dt last = %.3f s", sim_.tree().size(),
              sim_.attractors().alive_count(), sim_.attractors().size(),
              static_cast<unsigned long long>(c.phase_cycles), last_step_dt_s_);
  if (const auto t = sim_.terminal()) {
    ImGui::SameLine();
    ImGui::TextColored(ImVec4(1.0f, 0.8f, 0.3f, 1.0f), "   stopped: %s", terminal_condition_to_string(*t).c_str());
  }
}

} // namespace canopy::ui
