#pragma once

#include "core/config.hpp"
#include "core/overlap_index.hpp"
#include "core/render_buffer.hpp"
#include "core/style_mapper.hpp"
#include "core/track.hpp"
#include "core/view_transform.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace track_overlay
{

enum class dataset_status_e
{
  LOADED,
  EMPTY
};

struct dataset_stats_t
{
  size_t track_count = 0;
  size_t segment_count = 0;
  size_t dropped_count = 0; // Streams too short to form a track
  int max_overlap = 0;
  double build_ms = 0.0;
};

// Owns every piece of dataset and view state. All calls come from the UI
// thread; render code only reads the render buffer and view.
class overlay_engine_t
{
public:
  explicit overlay_engine_t(const overlay_config_t &config = {});

  // Replaces the whole dataset: normalize, index, classify, style.
  // An empty result leaves an empty buffer and the default view.
  auto load_dataset(const std::vector<activity_stream_t> &streams) -> dataset_status_e;

  // Rebuilds the render buffer only; overlap counts are not recomputed
  auto set_filter(const std::string &type, bool enabled) -> void;
  auto get_filters() const -> const filter_set_t &
  {
    return m_filters;
  }

  auto set_style(const style_config_t &style) -> void;
  auto set_view_config(const view_config_t &view) -> void;
  auto get_config() const -> const overlay_config_t &
  {
    return m_config;
  }

  // Updates the selection; nullopt when nothing is within tolerance
  auto pick_at(double sx, double sy) -> std::optional<std::string>;
  auto clear_selection() -> void
  {
    m_selected.reset();
  }
  auto get_selected_track() const -> const track_t *;

  auto set_canvas_size(double width, double height) -> void;
  auto zoom_at(double sx, double sy, double factor) -> void;
  auto pan_by(double dx, double dy) -> void;
  auto reset_view() -> void;
  auto fit_to_data() -> void;

  auto get_view() const -> const view_transform_t &
  {
    return m_view;
  }
  auto get_tracks() const -> const std::vector<track_t> &
  {
    return m_tracks;
  }
  auto get_segments() const -> const std::vector<segment_t> &
  {
    return m_segments;
  }
  auto get_index() const -> const overlap_index_t &
  {
    return m_index;
  }
  auto get_render_buffer() const -> const render_buffer_t &
  {
    return m_render_buffer;
  }
  auto get_stats() const -> const dataset_stats_t &
  {
    return m_stats;
  }

  auto find_track(const std::string &id) const -> const track_t *;

  // Highest overlap count over the track's segments, 0 for unknown ids
  auto get_track_max_overlap(const std::string &id) const -> int;

  // Number of loaded tracks per activity type
  auto get_type_counts() const -> std::map<std::string, int>;

private:
  auto rebuild_render_buffer() -> void;

  overlay_config_t m_config;

  std::vector<track_t> m_tracks;
  overlap_index_t m_index;
  std::vector<segment_t> m_segments;

  filter_set_t m_filters;
  render_buffer_t m_render_buffer;
  view_transform_t m_view;

  std::optional<std::uint32_t> m_selected;
  dataset_stats_t m_stats;
};

} // namespace track_overlay
