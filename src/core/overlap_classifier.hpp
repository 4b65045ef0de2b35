#pragma once

#include "core/overlap_index.hpp"
#include "core/track.hpp"
#include <vector>

namespace track_overlay
{
namespace classifier
{

// Appends one segment per consecutive point pair of the track. The overlap
// count is the number of distinct tracks the index reports around the segment
// midpoint, the track itself included, so it is never below 1.
auto classify_track(std::uint32_t track_index, const track_t &track, const overlap_index_t &index, std::vector<segment_t> &out) -> void;

// Segments of all tracks, in track order then point order
auto classify_tracks(const std::vector<track_t> &tracks, const overlap_index_t &index) -> std::vector<segment_t>;

} // namespace classifier
} // namespace track_overlay
