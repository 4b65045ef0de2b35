#pragma once

#include "core/track.hpp"
#include <algorithm>
#include <cmath>

namespace track_overlay
{
namespace geo
{

// Planar offset from an origin in degrees, scaled to world units.
// Longitude and latitude degrees are scaled identically (no cos(lat) term).
// Y is inverted so increasing latitude moves up on screen.
inline auto lat_lon_to_local(double origin_lat, double origin_lon, double lat, double lon, double scale) -> world_point_t
{
  return {(lon - origin_lon) * scale, -(lat - origin_lat) * scale};
}

inline auto midpoint(const world_point_t &a, const world_point_t &b) -> world_point_t
{
  return {(a.x + b.x) * 0.5, (a.y + b.y) * 0.5};
}

// Distance from p to the segment ab (projection clamped to the segment)
inline auto point_segment_distance(double px, double py, double ax, double ay, double bx, double by) -> double
{
  double dx = bx - ax;
  double dy = by - ay;
  double len_sq = dx * dx + dy * dy;

  double t = 0.0;
  if (len_sq > 0.0)
  {
    t = ((px - ax) * dx + (py - ay) * dy) / len_sq;
    t = std::clamp(t, 0.0, 1.0);
  }

  double cx = ax + t * dx;
  double cy = ay + t * dy;
  return std::hypot(px - cx, py - cy);
}

inline auto lerp(float a, float b, float t) -> float
{
  return a + (b - a) * t;
}

} // namespace geo
} // namespace track_overlay
