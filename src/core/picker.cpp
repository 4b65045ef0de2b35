#include "core/picker.hpp"
#include "core/geo_math.hpp"

namespace track_overlay
{
namespace picker
{

auto pick(const render_buffer_t &buffer, const view_transform_t &view, double sx, double sy, double tolerance_px) -> std::optional<pick_result_t>
{
  if (buffer.empty() || view.get_scale() <= 0.0)
    return std::nullopt;

  auto click = view.screen_to_world(sx, sy);
  const double tolerance = tolerance_px / view.get_scale();

  std::optional<pick_result_t> best;
  double best_dist = tolerance;

  for (size_t s = 0; s < buffer.segment_count(); ++s)
  {
    const std::uint32_t a = buffer.indices[s * 2];
    const std::uint32_t b = buffer.indices[s * 2 + 1];

    double d = geo::point_segment_distance(click.x, click.y, buffer.positions[a * 2], buffer.positions[a * 2 + 1], buffer.positions[b * 2], buffer.positions[b * 2 + 1]);

    if (d < best_dist)
    {
      best_dist = d;
      best = pick_result_t{buffer.track_ids[a], s, d};
    }
  }

  return best;
}

} // namespace picker
} // namespace track_overlay
