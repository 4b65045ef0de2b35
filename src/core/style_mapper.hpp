#pragma once

#include "core/config.hpp"
#include "core/render_buffer.hpp"
#include "core/track.hpp"
#include <array>
#include <map>
#include <string>
#include <vector>

namespace track_overlay
{

// Activity type -> enabled. Types missing from the map count as enabled.
using filter_set_t = std::map<std::string, bool>;

struct segment_style_t
{
  float thickness = 0.0f;
  std::array<float, 3> color = {0.0f, 0.0f, 0.0f};
};

namespace style
{

// Linear ramp clamped to [0,1]: 0 at zero_count, 1 at full_count. When both
// points coincide the ramp is a step that saturates at full_count.
auto ramp(int count, int zero_count, int full_count) -> float;

auto map_style(int overlap_count, const style_config_t &config) -> segment_style_t;

auto is_type_active(const filter_set_t &filters, const std::string &type) -> bool;

// Registers every type in the track set, new types enabled. Existing
// entries keep their state.
auto register_types(filter_set_t &filters, const std::vector<track_t> &tracks) -> void;

// Flattens the segments whose track type is active. The revision of the
// previous buffer is carried over and incremented.
auto build_render_buffer(const std::vector<track_t> &tracks, const std::vector<segment_t> &segments, const filter_set_t &filters, const style_config_t &config, render_buffer_t &out) -> void;

} // namespace style
} // namespace track_overlay
