#include "../core/render_buffer.hpp"
#include "../core/style_mapper.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace track_overlay;

static auto near(float a, float b) -> bool
{
  return std::abs(a - b) < 1e-5f;
}

void test_no_overlap_is_base_style()
{
  std::cout << "Testing no-overlap style..." << std::endl;
  style_config_t cfg;
  auto s = style::map_style(1, cfg);
  assert(near(s.thickness, cfg.base_thickness));
  assert(s.color == cfg.no_overlap_color);
}

void test_ramp_and_saturation()
{
  std::cout << "Testing ramp..." << std::endl;
  style_config_t cfg; // start 3px at 2 tracks, 8px at 5 tracks

  auto two = style::map_style(2, cfg);
  assert(near(two.thickness, cfg.start_thickness));
  assert(near(two.color[0], 0.25f));

  auto five = style::map_style(5, cfg);
  assert(near(five.thickness, cfg.max_thickness));
  assert(five.color == cfg.max_overlap_color);

  auto fifty = style::map_style(50, cfg);
  assert(near(fifty.thickness, cfg.max_thickness));
  assert(fifty.color == cfg.max_overlap_color);

  float prev_thickness = 0.0f;
  float prev_red = -1.0f;
  for (int count = 1; count <= 12; ++count)
  {
    auto s = style::map_style(count, cfg);
    std::cout << "  count " << count << ": " << s.thickness << " px, red " << s.color[0] << std::endl;
    assert(s.thickness >= prev_thickness);
    assert(s.color[0] >= prev_red);
    prev_thickness = s.thickness;
    prev_red = s.color[0];
  }
}

void test_equal_thresholds()
{
  std::cout << "Testing equal thresholds..." << std::endl;
  assert(style::ramp(2, 3, 3) == 0.0f);
  assert(style::ramp(3, 3, 3) == 1.0f);
  assert(style::ramp(9, 3, 3) == 1.0f);

  style_config_t cfg;
  cfg.thickness_start_count = 4;
  cfg.full_effect_count = 4;
  assert(near(style::map_style(3, cfg).thickness, cfg.start_thickness));
  assert(near(style::map_style(4, cfg).thickness, cfg.max_thickness));
}

void test_filters()
{
  std::cout << "Testing type filters..." << std::endl;
  filter_set_t filters;
  assert(style::is_type_active(filters, "Swim"));

  track_t run;
  run.activity.type = "Run";
  track_t ride;
  ride.activity.type = "Ride";

  filters["Ride"] = false;
  style::register_types(filters, {run, ride});
  assert(filters.size() == 2);
  assert(style::is_type_active(filters, "Run"));
  assert(!style::is_type_active(filters, "Ride"));
}

void test_render_buffer()
{
  std::cout << "Testing render buffer..." << std::endl;
  track_t run;
  run.activity.type = "Run";
  run.points = {{0, 0}, {10, 0}, {20, 0}};
  track_t ride;
  ride.activity.type = "Ride";
  ride.points = {{0, 0}, {0, 10}};

  std::vector<track_t> tracks = {run, ride};
  std::vector<segment_t> segments = {
      {{0, 0}, {10, 0}, 2, 0},
      {{10, 0}, {20, 0}, 1, 0},
      {{0, 0}, {0, 10}, 2, 1},
  };

  filter_set_t filters;
  style_config_t cfg;
  render_buffer_t buffer;

  style::build_render_buffer(tracks, segments, filters, cfg, buffer);
  assert(buffer.revision == 1);
  assert(buffer.segment_count() == 3);
  assert(buffer.vertex_count() == 6);
  assert(buffer.colors.size() == 18);
  assert(buffer.thicknesses.size() == 6);
  assert(buffer.track_ids.size() == 6);
  assert(buffer.overlap_counts.size() == 3);
  assert(buffer.indices[4] == 4 && buffer.indices[5] == 5);
  assert(near(buffer.thicknesses[2], cfg.base_thickness));

  filters["Ride"] = false;
  style::build_render_buffer(tracks, segments, filters, cfg, buffer);
  assert(buffer.revision == 2);
  assert(buffer.segment_count() == 2);
  for (auto id : buffer.track_ids)
    assert(id == 0);
  // Stored counts are untouched by filtering
  assert(segments[2].overlap_count == 2);

  filters["Run"] = false;
  style::build_render_buffer(tracks, segments, filters, cfg, buffer);
  assert(buffer.empty());
}

int main()
{
  test_no_overlap_is_base_style();
  test_ramp_and_saturation();
  test_equal_thresholds();
  test_filters();
  test_render_buffer();
  std::cout << "Style Mapper Verification Passed" << std::endl;
  return 0;
}
