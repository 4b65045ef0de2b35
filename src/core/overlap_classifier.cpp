#include "core/overlap_classifier.hpp"
#include "core/geo_math.hpp"
#include <algorithm>

namespace track_overlay
{
namespace classifier
{

auto classify_track(std::uint32_t track_index, const track_t &track, const overlap_index_t &index, std::vector<segment_t> &out) -> void
{
  if (track.points.size() < 2)
    return;

  for (size_t i = 0; i + 1 < track.points.size(); ++i)
  {
    segment_t seg;
    seg.p1 = track.points[i];
    seg.p2 = track.points[i + 1];
    seg.track_index = track_index;

    auto mid = geo::midpoint(seg.p1, seg.p2);
    auto near = index.query(mid.x, mid.y);

    // A long segment can have its midpoint outside every cell its own points
    // touched; the owning track is still counted
    int count = static_cast<int>(near.size());
    if (!std::binary_search(near.begin(), near.end(), track_index))
      ++count;
    seg.overlap_count = count;
    out.push_back(seg);
  }
}

auto classify_tracks(const std::vector<track_t> &tracks, const overlap_index_t &index) -> std::vector<segment_t>
{
  size_t total = 0;
  for (const auto &track : tracks)
  {
    if (track.points.size() > 1)
      total += track.points.size() - 1;
  }

  std::vector<segment_t> segments;
  segments.reserve(total);

  for (size_t i = 0; i < tracks.size(); ++i)
  {
    classify_track(static_cast<std::uint32_t>(i), tracks[i], index, segments);
  }
  return segments;
}

} // namespace classifier
} // namespace track_overlay
