#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace track_overlay
{

// Raw GPS sample as delivered by the stream source
struct raw_point_t
{
  double lat = 0.0;
  double lon = 0.0;
  std::optional<double> time_sec;   // Seconds from activity start
  std::optional<double> distance_m; // Cumulative distance
  std::optional<double> altitude_m;
};

// Activity summary (display metadata only, never geometry)
struct activity_t
{
  std::string id; // Opaque upstream id
  std::string name;
  std::string type; // "Run", "Ride", ...
  std::string start_time;
  double distance_m = 0.0;
  int moving_time_sec = 0;
  int elapsed_time_sec = 0;
  double elevation_gain_m = 0.0;
};

// One activity with its fetched point stream
struct activity_stream_t
{
  activity_t activity;
  std::vector<raw_point_t> points;
};

// Normalized world-space point
struct world_point_t
{
  double x = 0.0;
  double y = 0.0;
};

struct track_t
{
  activity_t activity;
  std::vector<world_point_t> points; // points[0] is always (0,0)

  auto get_id() const -> const std::string &
  {
    return activity.id;
  }
  auto get_type() const -> const std::string &
  {
    return activity.type;
  }
};

struct segment_t
{
  world_point_t p1;
  world_point_t p2;
  int overlap_count = 1;
  std::uint32_t track_index = 0; // Index into the owning engine's track list
};

struct world_bounds_t
{
  double min_x = 0.0;
  double min_y = 0.0;
  double max_x = 0.0;
  double max_y = 0.0;
  bool valid = false;

  auto width() const -> double
  {
    return max_x - min_x;
  }
  auto height() const -> double
  {
    return max_y - min_y;
  }

  auto extend(const world_point_t &p) -> void
  {
    if (!valid)
    {
      min_x = max_x = p.x;
      min_y = max_y = p.y;
      valid = true;
      return;
    }
    if (p.x < min_x)
      min_x = p.x;
    if (p.x > max_x)
      max_x = p.x;
    if (p.y < min_y)
      min_y = p.y;
    if (p.y > max_y)
      max_y = p.y;
  }
};

} // namespace track_overlay
