#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace track_overlay
{

// GL_LINES layout: two vertices per visible segment, both carrying the same
// color and thickness. indices holds one increasing pair per segment.
struct render_buffer_t
{
  std::vector<float> positions;          // x, y per vertex (world units)
  std::vector<float> colors;             // r, g, b per vertex
  std::vector<float> thicknesses;        // one per vertex
  std::vector<std::uint32_t> track_ids;  // owning track index per vertex
  std::vector<std::uint32_t> indices;    // 2 per segment
  std::vector<int> overlap_counts;       // one per segment

  // Bumped on every rebuild so the renderer knows when to re-upload
  std::uint64_t revision = 0;

  auto empty() const -> bool
  {
    return indices.empty();
  }
  auto vertex_count() const -> size_t
  {
    return positions.size() / 2;
  }
  auto segment_count() const -> size_t
  {
    return indices.size() / 2;
  }

  auto clear() -> void
  {
    positions.clear();
    colors.clear();
    thicknesses.clear();
    track_ids.clear();
    indices.clear();
    overlap_counts.clear();
  }
};

} // namespace track_overlay
