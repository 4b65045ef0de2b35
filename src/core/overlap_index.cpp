#include "core/overlap_index.hpp"
#include <algorithm>
#include <cmath>

namespace track_overlay
{

overlap_index_t::overlap_index_t(double cell_size) : m_cell_size(cell_size > 0.0 ? cell_size : 1.0)
{
}

auto overlap_index_t::cell_key(double x, double y) const -> grid_key_t
{
  return {static_cast<int>(std::floor(x / m_cell_size)), static_cast<int>(std::floor(y / m_cell_size))};
}

auto overlap_index_t::insert(std::uint32_t track_index, double x, double y) -> void
{
  auto &cell = m_grid[cell_key(x, y)];

  auto it = std::lower_bound(cell.begin(), cell.end(), track_index);
  if (it != cell.end() && *it == track_index)
    return;

  cell.insert(it, track_index);
}

auto overlap_index_t::insert_track(std::uint32_t track_index, const track_t &track) -> void
{
  for (const auto &p : track.points)
    insert(track_index, p.x, p.y);
}

auto overlap_index_t::query(double x, double y) const -> std::vector<std::uint32_t>
{
  std::vector<std::uint32_t> result;
  auto center = cell_key(x, y);

  for (int dx = -1; dx <= 1; ++dx)
  {
    for (int dy = -1; dy <= 1; ++dy)
    {
      auto it = m_grid.find({center.first + dx, center.second + dy});
      if (it == m_grid.end())
        continue;

      result.insert(result.end(), it->second.begin(), it->second.end());
    }
  }

  // Remove duplicates from tracks present in several neighbouring cells
  std::sort(result.begin(), result.end());
  result.erase(std::unique(result.begin(), result.end()), result.end());

  return result;
}

auto overlap_index_t::tracks_in_cell(const grid_key_t &key) const -> const std::vector<std::uint32_t> *
{
  auto it = m_grid.find(key);
  if (it != m_grid.end())
  {
    return &it->second;
  }
  return nullptr;
}

auto overlap_index_t::clear() -> void
{
  m_grid.clear();
}

auto overlap_index_t::build(const std::vector<track_t> &tracks, double cell_size) -> overlap_index_t
{
  overlap_index_t index(cell_size);
  for (size_t i = 0; i < tracks.size(); ++i)
  {
    index.insert_track(static_cast<std::uint32_t>(i), tracks[i]);
  }
  return index;
}

} // namespace track_overlay
