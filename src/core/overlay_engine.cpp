#include "core/overlay_engine.hpp"
#include "core/overlap_classifier.hpp"
#include "core/picker.hpp"
#include "core/track_normalizer.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace track_overlay
{

overlay_engine_t::overlay_engine_t(const overlay_config_t &config) : m_config(config), m_index(config.proximity), m_view(config.view)
{
}

auto overlay_engine_t::load_dataset(const std::vector<activity_stream_t> &streams) -> dataset_status_e
{
  auto start = std::chrono::steady_clock::now();

  m_selected.reset();
  m_stats = {};

  m_tracks = normalizer::normalize_all(streams, m_config.normalizer_scale);
  m_index = overlap_index_t::build(m_tracks, m_config.proximity);
  m_segments = classifier::classify_tracks(m_tracks, m_index);

  style::register_types(m_filters, m_tracks);
  rebuild_render_buffer();

  m_stats.track_count = m_tracks.size();
  m_stats.segment_count = m_segments.size();
  m_stats.dropped_count = streams.size() - m_tracks.size();
  for (const auto &seg : m_segments)
    m_stats.max_overlap = std::max(m_stats.max_overlap, seg.overlap_count);

  auto end = std::chrono::steady_clock::now();
  m_stats.build_ms = std::chrono::duration<double, std::milli>(end - start).count();

  if (m_tracks.empty())
  {
    std::cout << "Overlay Engine: dataset is empty (" << streams.size() << " streams)" << std::endl;
    m_view.reset_view();
    return dataset_status_e::EMPTY;
  }

  std::cout << "Overlay Engine: built " << m_stats.track_count << " tracks, " << m_stats.segment_count << " segments, " << m_index.cell_count() << " cells in " << m_stats.build_ms << " ms" << std::endl;

  fit_to_data();
  return dataset_status_e::LOADED;
}

auto overlay_engine_t::rebuild_render_buffer() -> void
{
  style::build_render_buffer(m_tracks, m_segments, m_filters, m_config.style, m_render_buffer);
}

auto overlay_engine_t::set_filter(const std::string &type, bool enabled) -> void
{
  m_filters[type] = enabled;

  if (m_selected && *m_selected < m_tracks.size() && !style::is_type_active(m_filters, m_tracks[*m_selected].get_type()))
  {
    m_selected.reset();
  }

  rebuild_render_buffer();
}

auto overlay_engine_t::set_style(const style_config_t &style) -> void
{
  m_config.style = style;
  rebuild_render_buffer();
}

auto overlay_engine_t::set_view_config(const view_config_t &view) -> void
{
  m_config.view = view;
  m_view.set_config(view);
}

auto overlay_engine_t::pick_at(double sx, double sy) -> std::optional<std::string>
{
  auto hit = picker::pick(m_render_buffer, m_view, sx, sy, m_config.view.pick_tolerance_px);
  if (!hit || hit->track_index >= m_tracks.size())
  {
    m_selected.reset();
    return std::nullopt;
  }

  m_selected = hit->track_index;
  return m_tracks[hit->track_index].get_id();
}

auto overlay_engine_t::get_selected_track() const -> const track_t *
{
  if (!m_selected || *m_selected >= m_tracks.size())
    return nullptr;
  return &m_tracks[*m_selected];
}

auto overlay_engine_t::set_canvas_size(double width, double height) -> void
{
  m_view.set_canvas_size(width, height);
}

auto overlay_engine_t::zoom_at(double sx, double sy, double factor) -> void
{
  m_view.zoom_at(sx, sy, factor);
}

auto overlay_engine_t::pan_by(double dx, double dy) -> void
{
  m_view.pan_by(dx, dy);
}

auto overlay_engine_t::reset_view() -> void
{
  m_view.reset_view();
}

auto overlay_engine_t::fit_to_data() -> void
{
  m_view.fit_to_bounds(normalizer::compute_bounds(m_tracks));
}

auto overlay_engine_t::find_track(const std::string &id) const -> const track_t *
{
  for (const auto &track : m_tracks)
  {
    if (track.get_id() == id)
      return &track;
  }
  return nullptr;
}

auto overlay_engine_t::get_track_max_overlap(const std::string &id) const -> int
{
  auto *track = find_track(id);
  if (!track)
    return 0;

  auto track_index = static_cast<std::uint32_t>(track - m_tracks.data());

  int result = 0;
  for (const auto &seg : m_segments)
  {
    if (seg.track_index == track_index)
      result = std::max(result, seg.overlap_count);
  }
  return result;
}

auto overlay_engine_t::get_type_counts() const -> std::map<std::string, int>
{
  std::map<std::string, int> counts;
  for (const auto &track : m_tracks)
    counts[track.get_type()]++;
  return counts;
}

} // namespace track_overlay
