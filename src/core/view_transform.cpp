#include "core/view_transform.hpp"
#include <algorithm>
#include <limits>

namespace track_overlay
{

view_transform_t::view_transform_t(const view_config_t &config) : m_config(config)
{
  m_state.scale = clamp_scale(m_config.default_scale);
}

auto view_transform_t::clamp_scale(double scale) const -> double
{
  return std::clamp(scale, m_config.min_zoom, m_config.max_zoom);
}

auto view_transform_t::set_config(const view_config_t &config) -> void
{
  m_config = config;
  m_state.scale = clamp_scale(m_state.scale);
}

auto view_transform_t::set_canvas_size(double width, double height) -> void
{
  m_state.canvas_w = std::max(0.0, width);
  m_state.canvas_h = std::max(0.0, height);
}

auto view_transform_t::set_scale(double scale) -> void
{
  m_state.scale = clamp_scale(scale);
}

auto view_transform_t::set_pan(double pan_x, double pan_y) -> void
{
  m_state.pan_x = pan_x;
  m_state.pan_y = pan_y;
}

auto view_transform_t::world_to_screen(double x, double y) const -> world_point_t
{
  return {x * m_state.scale + m_state.pan_x, y * m_state.scale + m_state.pan_y};
}

auto view_transform_t::screen_to_world(double sx, double sy) const -> world_point_t
{
  return {(sx - m_state.pan_x) / m_state.scale, (sy - m_state.pan_y) / m_state.scale};
}

auto view_transform_t::zoom_at(double sx, double sy, double factor) -> void
{
  if (!(factor > 0.0))
    return;

  auto anchor = screen_to_world(sx, sy);

  m_state.scale = clamp_scale(m_state.scale * factor);

  m_state.pan_x = sx - anchor.x * m_state.scale;
  m_state.pan_y = sy - anchor.y * m_state.scale;
}

auto view_transform_t::pan_by(double dx, double dy) -> void
{
  m_state.pan_x += dx;
  m_state.pan_y += dy;
}

auto view_transform_t::reset_view() -> void
{
  m_state.scale = clamp_scale(m_config.default_scale);
  m_state.pan_x = m_state.canvas_w * 0.5;
  m_state.pan_y = m_state.canvas_h * 0.5;
}

auto view_transform_t::fit_to_bounds(const world_bounds_t &bounds) -> void
{
  if (!bounds.valid)
  {
    reset_view();
    return;
  }

  const double data_w = bounds.width();
  const double data_h = bounds.height();
  const double center_x = bounds.min_x + data_w * 0.5;
  const double center_y = bounds.min_y + data_h * 0.5;

  double scale = m_config.default_scale;
  if (data_w > 0.0 || data_h > 0.0)
  {
    // A flat axis does not constrain the scale
    const double inf = std::numeric_limits<double>::infinity();
    double scale_x = data_w > 0.0 ? m_state.canvas_w / data_w : inf;
    double scale_y = data_h > 0.0 ? m_state.canvas_h / data_h : inf;

    scale = std::min({scale_x, scale_y, m_config.fit_max_scale});
    scale = std::max(scale, m_config.fit_min_scale);
  }

  m_state.scale = clamp_scale(scale);
  m_state.pan_x = m_state.canvas_w * 0.5 - center_x * m_state.scale;
  m_state.pan_y = m_state.canvas_h * 0.5 - center_y * m_state.scale;
}

auto view_transform_t::clip_matrix() const -> std::array<float, 16>
{
  std::array<float, 16> m = {};
  m[10] = 1.0f;
  m[15] = 1.0f;

  if (m_state.canvas_w <= 0.0 || m_state.canvas_h <= 0.0)
  {
    m[0] = 1.0f;
    m[5] = 1.0f;
    return m;
  }

  const double sx = 2.0 / m_state.canvas_w;
  const double sy = 2.0 / m_state.canvas_h;

  m[0] = static_cast<float>(m_state.scale * sx);
  m[5] = static_cast<float>(-m_state.scale * sy);
  m[12] = static_cast<float>(m_state.pan_x * sx - 1.0);
  m[13] = static_cast<float>(1.0 - m_state.pan_y * sy);
  return m;
}

} // namespace track_overlay
