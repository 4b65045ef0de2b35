#include "../core/overlay_engine.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace track_overlay;

static auto make_stream(const std::string &id, const std::string &type, std::vector<std::pair<double, double>> lat_lon) -> activity_stream_t
{
  activity_stream_t stream;
  stream.activity.id = id;
  stream.activity.name = "Activity " + id;
  stream.activity.type = type;
  for (const auto &[lat, lon] : lat_lon)
  {
    raw_point_t p;
    p.lat = lat;
    p.lon = lon;
    stream.points.push_back(p);
  }
  return stream;
}

// Two identical 10-unit tracks at grid size 10, in different cities
static auto make_pair_dataset() -> std::vector<activity_stream_t>
{
  return {make_stream("A", "Run", {{0.0, 0.0}, {0.0, 0.0001}}), make_stream("B", "Ride", {{48.0, 11.0}, {48.0, 11.0001}})};
}

static auto make_config() -> overlay_config_t
{
  overlay_config_t cfg;
  cfg.normalizer_scale = 100000.0;
  cfg.proximity = 10.0;
  return cfg;
}

void test_load_and_classify()
{
  std::cout << "Testing dataset load..." << std::endl;
  overlay_engine_t engine(make_config());
  engine.set_canvas_size(800, 600);

  auto status = engine.load_dataset(make_pair_dataset());
  assert(status == dataset_status_e::LOADED);
  assert(engine.get_tracks().size() == 2);
  assert(engine.get_segments().size() == 2);
  for (const auto &seg : engine.get_segments())
    assert(seg.overlap_count == 2);

  const auto &stats = engine.get_stats();
  assert(stats.track_count == 2);
  assert(stats.segment_count == 2);
  assert(stats.max_overlap == 2);
  assert(stats.dropped_count == 0);

  assert(engine.get_render_buffer().segment_count() == 2);
  assert(engine.get_track_max_overlap("A") == 2);
  assert(engine.get_track_max_overlap("nope") == 0);

  auto counts = engine.get_type_counts();
  assert(counts.size() == 2);
  assert(counts["Run"] == 1 && counts["Ride"] == 1);
}

void test_filter_keeps_counts()
{
  std::cout << "Testing filter keeps overlap counts..." << std::endl;
  overlay_engine_t engine(make_config());
  engine.set_canvas_size(800, 600);
  engine.load_dataset(make_pair_dataset());

  engine.set_filter("Ride", false);
  const auto &buffer = engine.get_render_buffer();
  assert(buffer.segment_count() == 1);
  assert(buffer.track_ids[0] == 0);
  assert(buffer.overlap_counts[0] == 2);
  assert(engine.get_segments()[0].overlap_count == 2);
  assert(engine.get_segments()[1].overlap_count == 2);

  engine.set_filter("Ride", true);
  assert(engine.get_render_buffer().segment_count() == 2);
}

void test_pick_through_view()
{
  std::cout << "Testing pick through the view..." << std::endl;
  overlay_engine_t engine(make_config());
  engine.set_canvas_size(800, 600);
  engine.load_dataset(make_pair_dataset());

  // Fit centers the data: segment midpoint (5, 0) lands on the canvas center
  auto mid = engine.get_view().world_to_screen(5.0, 0.0);
  assert(std::abs(mid.x - 400.0) < 1e-6 && std::abs(mid.y - 300.0) < 1e-6);

  auto picked = engine.pick_at(mid.x, mid.y);
  assert(picked.has_value());
  assert(*picked == "A");
  assert(engine.get_selected_track() != nullptr);
  assert(engine.get_selected_track()->activity.name == "Activity A");

  // Hiding the selected track clears the selection
  engine.set_filter("Run", false);
  assert(engine.get_selected_track() == nullptr);

  picked = engine.pick_at(mid.x, mid.y);
  assert(picked.has_value() && *picked == "B");

  // A miss clears the selection
  assert(!engine.pick_at(5.0, 5.0).has_value());
  assert(engine.get_selected_track() == nullptr);
}

void test_empty_and_short_datasets()
{
  std::cout << "Testing empty datasets..." << std::endl;
  overlay_engine_t engine(make_config());
  engine.set_canvas_size(800, 600);

  assert(engine.load_dataset({}) == dataset_status_e::EMPTY);
  assert(engine.get_render_buffer().empty());
  assert(!engine.pick_at(400, 300).has_value());
  auto origin = engine.get_view().world_to_screen(0.0, 0.0);
  assert(std::abs(origin.x - 400.0) < 1e-9 && std::abs(origin.y - 300.0) < 1e-9);

  std::vector<activity_stream_t> short_streams = {make_stream("dot", "Run", {{1.0, 1.0}}), make_stream("none", "Run", {})};
  assert(engine.load_dataset(short_streams) == dataset_status_e::EMPTY);
  assert(engine.get_stats().dropped_count == 2);

  // A reload replaces everything from the previous dataset
  engine.load_dataset(make_pair_dataset());
  assert(engine.get_tracks().size() == 2);
  engine.load_dataset({make_stream("C", "Hike", {{1.0, 1.0}, {1.0, 1.0001}, {1.0001, 1.0001}})});
  assert(engine.get_tracks().size() == 1);
  assert(engine.get_segments().size() == 2);
  assert(engine.find_track("A") == nullptr);
  assert(engine.find_track("C") != nullptr);
}

void test_style_change_rebuilds()
{
  std::cout << "Testing style change..." << std::endl;
  overlay_engine_t engine(make_config());
  engine.set_canvas_size(800, 600);
  engine.load_dataset(make_pair_dataset());

  auto revision = engine.get_render_buffer().revision;
  style_config_t style = engine.get_config().style;
  style.max_overlap_color = {0.0f, 0.0f, 1.0f};
  engine.set_style(style);
  assert(engine.get_render_buffer().revision == revision + 1);
  assert(engine.get_config().style.max_overlap_color[2] == 1.0f);
}

void test_view_operations()
{
  std::cout << "Testing view operations..." << std::endl;
  overlay_engine_t engine(make_config());
  engine.set_canvas_size(800, 600);
  engine.load_dataset(make_pair_dataset());

  engine.zoom_at(400, 300, 1000.0);
  assert(engine.get_view().get_scale() <= engine.get_config().view.max_zoom);
  engine.pan_by(10, 10);
  engine.reset_view();
  assert(std::abs(engine.get_view().get_scale() - engine.get_config().view.default_scale) < 1e-12);
  engine.fit_to_data();
  assert(std::abs(engine.get_view().get_scale() - engine.get_config().view.fit_max_scale) < 1e-12);
}

int main()
{
  test_load_and_classify();
  test_filter_keeps_counts();
  test_pick_through_view();
  test_empty_and_short_datasets();
  test_style_change_rebuilds();
  test_view_operations();
  std::cout << "Overlay Engine Verification Passed" << std::endl;
  return 0;
}
