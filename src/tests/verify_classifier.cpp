#include "../core/overlap_classifier.hpp"
#include <cassert>
#include <iostream>

using namespace track_overlay;

static auto make_track(const std::string &id, std::vector<world_point_t> points) -> track_t
{
  track_t t;
  t.activity.id = id;
  t.activity.type = "Run";
  t.points = std::move(points);
  return t;
}

void test_identical_tracks()
{
  std::cout << "Testing identical tracks..." << std::endl;
  std::vector<track_t> tracks = {make_track("A", {{0, 0}, {10, 0}}), make_track("B", {{0, 0}, {10, 0}})};
  auto index = overlap_index_t::build(tracks, 10.0);
  auto segments = classifier::classify_tracks(tracks, index);

  assert(segments.size() == 2);
  for (const auto &seg : segments)
  {
    std::cout << "  track " << seg.track_index << " count " << seg.overlap_count << std::endl;
    assert(seg.overlap_count == 2);
  }
  assert(segments[0].track_index == 0);
  assert(segments[1].track_index == 1);
}

void test_lone_track_counts_itself()
{
  std::cout << "Testing lone track..." << std::endl;
  std::vector<track_t> tracks = {make_track("solo", {{0, 0}, {5, 5}, {10, 3}, {12, 8}})};
  auto index = overlap_index_t::build(tracks, 20.0);
  auto segments = classifier::classify_tracks(tracks, index);

  assert(segments.size() == 3);
  for (const auto &seg : segments)
    assert(seg.overlap_count == 1);
}

void test_distant_tracks()
{
  std::cout << "Testing distant tracks..." << std::endl;
  std::vector<track_t> tracks = {make_track("near", {{0, 0}, {5, 0}}), make_track("far", {{1000, 1000}, {1005, 1000}})};
  auto index = overlap_index_t::build(tracks, 10.0);
  auto segments = classifier::classify_tracks(tracks, index);
  for (const auto &seg : segments)
    assert(seg.overlap_count == 1);
}

void test_partial_overlap()
{
  std::cout << "Testing partial overlap..." << std::endl;
  // B shares only the first stretch of A
  std::vector<track_t> tracks = {make_track("A", {{0, 0}, {10, 0}, {100, 0}, {200, 0}}), make_track("B", {{0, 0}, {10, 0}})};
  auto index = overlap_index_t::build(tracks, 10.0);
  auto segments = classifier::classify_tracks(tracks, index);

  assert(segments.size() == 4);
  assert(segments[0].overlap_count == 2); // A: (0,0)-(10,0)
  assert(segments[2].overlap_count == 1); // A: (100,0)-(200,0)
  assert(segments[3].overlap_count == 2); // B
}

void test_long_segment_midpoint()
{
  std::cout << "Testing long segment..." << std::endl;
  // Midpoint lands in a cell none of the track's own points touched
  std::vector<track_t> tracks = {make_track("long", {{0, 0}, {1000, 0}})};
  auto index = overlap_index_t::build(tracks, 10.0);
  auto segments = classifier::classify_tracks(tracks, index);
  assert(segments.size() == 1);
  assert(segments[0].overlap_count == 1);
}

void test_short_track_has_no_segments()
{
  std::cout << "Testing single point track..." << std::endl;
  std::vector<segment_t> out;
  overlap_index_t index(10.0);
  classifier::classify_track(0, make_track("dot", {{0, 0}}), index, out);
  assert(out.empty());
}

int main()
{
  test_identical_tracks();
  test_lone_track_counts_itself();
  test_distant_tracks();
  test_partial_overlap();
  test_long_segment_midpoint();
  test_short_track_has_no_segments();
  std::cout << "Overlap Classifier Verification Passed" << std::endl;
  return 0;
}
