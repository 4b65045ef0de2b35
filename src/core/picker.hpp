#pragma once

#include "core/render_buffer.hpp"
#include "core/view_transform.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace track_overlay
{

struct pick_result_t
{
  std::uint32_t track_index = 0;
  size_t segment = 0;    // Segment position in the render buffer
  double distance = 0.0; // World units
};

namespace picker
{

// Nearest visible segment to the click within tolerance_px screen pixels.
// Linear scan; the first segment wins on equal distance.
auto pick(const render_buffer_t &buffer, const view_transform_t &view, double sx, double sy, double tolerance_px) -> std::optional<pick_result_t>;

} // namespace picker
} // namespace track_overlay
