#include "core/style_mapper.hpp"
#include "core/geo_math.hpp"
#include <algorithm>

namespace track_overlay
{
namespace style
{

auto ramp(int count, int zero_count, int full_count) -> float
{
  if (full_count <= zero_count)
    return count >= full_count ? 1.0f : 0.0f;

  float t = static_cast<float>(count - zero_count) / static_cast<float>(full_count - zero_count);
  return std::clamp(t, 0.0f, 1.0f);
}

auto map_style(int overlap_count, const style_config_t &config) -> segment_style_t
{
  segment_style_t result;

  if (overlap_count <= 1)
  {
    result.thickness = config.base_thickness;
    result.color = config.no_overlap_color;
    return result;
  }

  float t_thick = ramp(overlap_count, config.thickness_start_count, config.full_effect_count);
  float lo = std::min(config.start_thickness, config.max_thickness);
  float hi = std::max(config.start_thickness, config.max_thickness);
  result.thickness = std::clamp(geo::lerp(config.start_thickness, config.max_thickness, t_thick), lo, hi);

  float t_color = ramp(overlap_count, 1, config.full_effect_count);
  for (size_t c = 0; c < 3; ++c)
  {
    result.color[c] = geo::lerp(config.no_overlap_color[c], config.max_overlap_color[c], t_color);
  }

  return result;
}

auto is_type_active(const filter_set_t &filters, const std::string &type) -> bool
{
  auto it = filters.find(type);
  return it == filters.end() || it->second;
}

auto register_types(filter_set_t &filters, const std::vector<track_t> &tracks) -> void
{
  for (const auto &track : tracks)
  {
    filters.try_emplace(track.get_type(), true);
  }
}

auto build_render_buffer(const std::vector<track_t> &tracks, const std::vector<segment_t> &segments, const filter_set_t &filters, const style_config_t &config, render_buffer_t &out) -> void
{
  out.clear();
  out.revision++;

  // Per-track visibility, resolved once instead of per segment
  std::vector<bool> visible(tracks.size(), false);
  for (size_t i = 0; i < tracks.size(); ++i)
    visible[i] = is_type_active(filters, tracks[i].get_type());

  std::uint32_t next_vertex = 0;
  for (const auto &seg : segments)
  {
    if (seg.track_index >= visible.size() || !visible[seg.track_index])
      continue;

    auto s = map_style(seg.overlap_count, config);

    for (const auto &p : {seg.p1, seg.p2})
    {
      out.positions.push_back(static_cast<float>(p.x));
      out.positions.push_back(static_cast<float>(p.y));
      out.colors.insert(out.colors.end(), s.color.begin(), s.color.end());
      out.thicknesses.push_back(s.thickness);
      out.track_ids.push_back(seg.track_index);
    }

    out.indices.push_back(next_vertex);
    out.indices.push_back(next_vertex + 1);
    next_vertex += 2;

    out.overlap_counts.push_back(seg.overlap_count);
  }
}

} // namespace style
} // namespace track_overlay
