#pragma once

#include "core/track.hpp"
#include <optional>
#include <vector>

namespace track_overlay
{
namespace normalizer
{

// Anchors the track at its first point. Returns nullopt for streams with
// fewer than two points.
auto normalize_track(const activity_stream_t &stream, double scale) -> std::optional<track_t>;

// Normalizes every stream, dropping the ones that produce no track
auto normalize_all(const std::vector<activity_stream_t> &streams, double scale) -> std::vector<track_t>;

auto compute_bounds(const std::vector<track_t> &tracks) -> world_bounds_t;

} // namespace normalizer
} // namespace track_overlay
