#include "overlay_view.hpp"
#include "../renderer/track_renderer.hpp"
#include "imgui.h"

#include <cmath>
#include <cstdint>
#include <format>
#include <string>
#include <vector>

namespace track_overlay
{

static auto format_duration(int total_sec) -> std::string
{
  if (total_sec < 0)
    total_sec = 0;
  return std::format("{}:{:02}:{:02}", total_sec / 3600, (total_sec / 60) % 60, total_sec % 60);
}

// "2024-05-01T07:12:00Z" -> "2024-05-01 07:12"
static auto format_start_time(const std::string &iso) -> std::string
{
  if (iso.size() >= 16 && iso[10] == 'T')
    return iso.substr(0, 10) + " " + iso.substr(11, 5);
  return iso;
}

overlay_view_t::overlay_view_t()
{
  m_renderer = std::make_unique<track_renderer_t>();
}

overlay_view_t::~overlay_view_t() = default;

auto overlay_view_t::draw(overlay_engine_t &engine) -> void
{
  ImVec2 canvas_p0 = ImGui::GetCursorScreenPos();
  ImVec2 canvas_sz_raw = ImGui::GetContentRegionAvail();
  ImVec2 canvas_sz(canvas_sz_raw.x < 50.0f ? 50.0f : canvas_sz_raw.x, canvas_sz_raw.y < 50.0f ? 50.0f : canvas_sz_raw.y);
  ImVec2 canvas_p1(canvas_p0.x + canvas_sz.x, canvas_p0.y + canvas_sz.y);

  // First frame with a real canvas: center the origin
  bool first_layout = engine.get_view().get_state().canvas_w <= 0.0;
  engine.set_canvas_size(canvas_sz.x, canvas_sz.y);
  if (first_layout)
    engine.reset_view();

  ImGui::InvisibleButton("overlay_canvas", canvas_sz);
  const bool is_hovered = ImGui::IsItemHovered();
  const bool is_active = ImGui::IsItemActive();

  handle_input(engine, canvas_p0, is_hovered, is_active);

  ImDrawList *draw_list = ImGui::GetWindowDrawList();
  draw_list->PushClipRect(canvas_p0, canvas_p1, true);

  const auto &config = engine.get_config();
  unsigned int texture = m_renderer->render(engine.get_render_buffer(), engine.get_view(), config.background_color, config.style.base_thickness);
  if (texture)
  {
    // FBO origin is bottom-left
    draw_list->AddImage((ImTextureID)(intptr_t)texture, canvas_p0, canvas_p1, ImVec2(0.0f, 1.0f), ImVec2(1.0f, 0.0f));
  }
  else
  {
    draw_list->AddRectFilled(canvas_p0, canvas_p1, IM_COL32(40, 40, 40, 255));
  }

  draw_selection(engine, draw_list, canvas_p0);

  if (engine.get_tracks().empty())
  {
    const char *hint = "No activities loaded";
    ImVec2 text_sz = ImGui::CalcTextSize(hint);
    draw_list->AddText(ImVec2(canvas_p0.x + (canvas_sz.x - text_sz.x) * 0.5f, canvas_p0.y + (canvas_sz.y - text_sz.y) * 0.5f), IM_COL32(90, 90, 90, 255), hint);
  }

  // Status line
  std::string status = std::format("x {:.0f}  y {:.0f}  zoom {:.3f}", m_mouse_world.x, m_mouse_world.y, engine.get_view().get_scale());
  draw_list->AddText(ImVec2(canvas_p0.x + 8.0f, canvas_p1.y - ImGui::GetTextLineHeight() - 6.0f), IM_COL32(60, 60, 60, 255), status.c_str());

  draw_list->PopClipRect();
  draw_list->AddRect(canvas_p0, canvas_p1, IM_COL32(255, 255, 255, 100));

  draw_details_popup(engine);
}

auto overlay_view_t::handle_input(overlay_engine_t &engine, const ImVec2 &canvas_p0, bool is_hovered, bool is_active) -> void
{
  ImGuiIO &io = ImGui::GetIO();
  const double local_x = io.MousePos.x - canvas_p0.x;
  const double local_y = io.MousePos.y - canvas_p0.y;

  if (is_hovered)
    m_mouse_world = engine.get_view().screen_to_world(local_x, local_y);

  // Mouse wheel zoom, anchored at the cursor
  if (is_hovered && io.MouseWheel != 0.0f)
  {
    double factor = std::pow(engine.get_config().view.wheel_zoom_step, static_cast<double>(io.MouseWheel));
    engine.zoom_at(local_x, local_y, factor);
  }

  // Panning
  if (is_active && ImGui::IsMouseDragging(ImGuiMouseButton_Left))
  {
    engine.pan_by(io.MouseDelta.x, io.MouseDelta.y);
  }

  // A release without a drag is a click
  if (is_hovered && ImGui::IsMouseReleased(ImGuiMouseButton_Left))
  {
    ImVec2 drag = ImGui::GetMouseDragDelta(ImGuiMouseButton_Left, 0.0f);
    if (drag.x * drag.x + drag.y * drag.y < io.MouseDragThreshold * io.MouseDragThreshold)
    {
      if (engine.pick_at(local_x, local_y))
        m_popup_pos = ImVec2(io.MousePos.x + 12.0f, io.MousePos.y + 12.0f);
    }
  }
}

auto overlay_view_t::draw_selection(const overlay_engine_t &engine, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void
{
  const track_t *track = engine.get_selected_track();
  if (!track || track->points.size() < 2)
    return;

  const auto &view = engine.get_view();
  std::vector<ImVec2> screen_points;
  screen_points.reserve(track->points.size());
  for (const auto &p : track->points)
  {
    auto s = view.world_to_screen(p.x, p.y);
    screen_points.push_back(ImVec2(canvas_p0.x + static_cast<float>(s.x), canvas_p0.y + static_cast<float>(s.y)));
  }

  draw_list->AddPolyline(screen_points.data(), static_cast<int>(screen_points.size()), IM_COL32(30, 120, 255, 200), ImDrawFlags_None, 3.0f);
}

auto overlay_view_t::draw_details_popup(overlay_engine_t &engine) -> void
{
  const track_t *track = engine.get_selected_track();
  if (!track)
    return;

  const auto &a = track->activity;

  ImGui::SetNextWindowPos(m_popup_pos, ImGuiCond_Always);
  ImGui::SetNextWindowBgAlpha(0.92f);
  bool open = true;
  if (ImGui::Begin("Activity Details", &open, ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoMove))
  {
    ImGui::TextUnformatted(a.name.c_str());
    ImGui::Separator();
    ImGui::Text("Type: %s", a.type.c_str());
    ImGui::Text("Date: %s", format_start_time(a.start_time).c_str());
    ImGui::Text("Distance: %.2f km", a.distance_m / 1000.0);
    ImGui::Text("Moving Time: %s", format_duration(a.moving_time_sec).c_str());
    ImGui::Text("Elapsed Time: %s", format_duration(a.elapsed_time_sec).c_str());
    ImGui::Text("Elevation Gain: %.0f m", a.elevation_gain_m);
    ImGui::Text("Max Overlap: %d tracks", engine.get_track_max_overlap(a.id));
  }
  ImGui::End();

  if (!open)
    engine.clear_selection();
}

} // namespace track_overlay
