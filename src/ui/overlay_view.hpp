#pragma once

#include "core/overlay_engine.hpp"
#include "imgui.h"
#include <memory>

namespace track_overlay
{

class track_renderer_t;

// Map canvas: forwards wheel/drag/click to the engine, shows the rendered
// track texture and the details popup of the selected track.
class overlay_view_t
{
public:
  overlay_view_t();
  ~overlay_view_t();

  auto draw(overlay_engine_t &engine) -> void;

private:
  auto handle_input(overlay_engine_t &engine, const ImVec2 &canvas_p0, bool is_hovered, bool is_active) -> void;
  auto draw_selection(const overlay_engine_t &engine, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void;
  auto draw_details_popup(overlay_engine_t &engine) -> void;

  std::unique_ptr<track_renderer_t> m_renderer;

  world_point_t m_mouse_world;
  ImVec2 m_popup_pos = ImVec2(0.0f, 0.0f);
};

} // namespace track_overlay
