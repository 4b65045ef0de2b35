#pragma once

#include "core/config.hpp"
#include "core/track.hpp"
#include <array>

namespace track_overlay
{

struct view_state_t
{
  double scale = 1.0; // Screen pixels per world unit
  double pan_x = 0.0; // Screen position of the world origin
  double pan_y = 0.0;
  double canvas_w = 0.0;
  double canvas_h = 0.0;
};

// Pan/zoom state and world <-> screen mapping. Scale stays inside
// [min_zoom, max_zoom] after every operation.
class view_transform_t
{
public:
  explicit view_transform_t(const view_config_t &config = {});

  auto get_state() const -> const view_state_t &
  {
    return m_state;
  }
  auto get_scale() const -> double
  {
    return m_state.scale;
  }
  auto get_config() const -> const view_config_t &
  {
    return m_config;
  }

  auto set_config(const view_config_t &config) -> void;
  auto set_canvas_size(double width, double height) -> void;
  auto set_scale(double scale) -> void;
  auto set_pan(double pan_x, double pan_y) -> void;

  auto world_to_screen(double x, double y) const -> world_point_t;
  auto screen_to_world(double sx, double sy) const -> world_point_t;

  // Keeps the world point under (sx, sy) fixed on screen
  auto zoom_at(double sx, double sy, double factor) -> void;
  auto pan_by(double dx, double dy) -> void;

  // Default scale with the world origin at the canvas center
  auto reset_view() -> void;
  auto fit_to_bounds(const world_bounds_t &bounds) -> void;

  // Column-major 4x4 mapping world units to clip space (y down on screen)
  auto clip_matrix() const -> std::array<float, 16>;

private:
  auto clamp_scale(double scale) const -> double;

  view_config_t m_config;
  view_state_t m_state;
};

} // namespace track_overlay
