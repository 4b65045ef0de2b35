#include "core/track_normalizer.hpp"
#include "core/geo_math.hpp"
#include <iostream>

namespace track_overlay
{
namespace normalizer
{

auto normalize_track(const activity_stream_t &stream, double scale) -> std::optional<track_t>
{
  if (stream.points.size() < 2)
    return std::nullopt;

  track_t track;
  track.activity = stream.activity;
  track.points.reserve(stream.points.size());

  const double lat0 = stream.points.front().lat;
  const double lon0 = stream.points.front().lon;

  for (const auto &p : stream.points)
  {
    track.points.push_back(geo::lat_lon_to_local(lat0, lon0, p.lat, p.lon, scale));
  }

  return track;
}

auto normalize_all(const std::vector<activity_stream_t> &streams, double scale) -> std::vector<track_t>
{
  std::vector<track_t> tracks;
  tracks.reserve(streams.size());

  for (const auto &stream : streams)
  {
    auto track = normalize_track(stream, scale);
    if (!track)
    {
      std::cout << "Normalizer: skipping activity " << stream.activity.id << " (" << stream.points.size() << " points)" << std::endl;
      continue;
    }
    tracks.push_back(std::move(*track));
  }

  return tracks;
}

auto compute_bounds(const std::vector<track_t> &tracks) -> world_bounds_t
{
  world_bounds_t bounds;
  for (const auto &track : tracks)
  {
    for (const auto &p : track.points)
      bounds.extend(p);
  }
  return bounds;
}

} // namespace normalizer
} // namespace track_overlay
