#pragma once

#include "core/track.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <utility>
#include <vector>

namespace track_overlay
{

// Uniform grid answering "which tracks have a point near (x, y)".
// Tracks are identified by their index in the current dataset. A cell holds
// each track at most once, no matter how many of its points fall inside.
class overlap_index_t
{
public:
  using grid_key_t = std::pair<int, int>;

  explicit overlap_index_t(double cell_size);

  auto get_cell_size() const -> double
  {
    return m_cell_size;
  }

  auto cell_key(double x, double y) const -> grid_key_t;

  // Idempotent per (cell, track)
  auto insert(std::uint32_t track_index, double x, double y) -> void;
  auto insert_track(std::uint32_t track_index, const track_t &track) -> void;

  // Union of the 3x3 block of cells around (x, y), sorted and unique
  auto query(double x, double y) const -> std::vector<std::uint32_t>;

  // Tracks registered in exactly this cell, nullptr if the cell is empty
  auto tracks_in_cell(const grid_key_t &key) const -> const std::vector<std::uint32_t> *;

  auto cell_count() const -> size_t
  {
    return m_grid.size();
  }

  auto clear() -> void;

  // One pass over every point of every track, track i registered as index i
  static auto build(const std::vector<track_t> &tracks, double cell_size) -> overlap_index_t;

private:
  double m_cell_size;
  std::map<grid_key_t, std::vector<std::uint32_t>> m_grid; // Each vector kept sorted
};

} // namespace track_overlay
