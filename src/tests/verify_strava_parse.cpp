#include "../core/strava_client.hpp"
#include <cassert>
#include <iostream>

using namespace track_overlay;

void test_activity_list()
{
  std::cout << "Testing activity list..." << std::endl;
  auto result = strava_client_t::parse_activities_json(R"([
    { "id": 1234567890123, "name": "Morning Run", "type": "Run", "start_date_local": "2024-05-01T07:12:00Z",
      "distance": 10234.5, "moving_time": 3120, "elapsed_time": 3300, "total_elevation_gain": 87.2 },
    { "id": "abc", "name": "Commute", "sport_type": "EBikeRide", "start_date": "2024-05-02T08:00:00Z" },
    { "name": "No id" },
    { "id": 7 }
  ])");

  assert(result.status == fetch_status_e::OK);
  assert(result.activities.size() == 3);

  const auto &run = result.activities[0];
  assert(run.id == "1234567890123");
  assert(run.name == "Morning Run");
  assert(run.type == "Run");
  assert(run.start_time == "2024-05-01T07:12:00Z");
  assert(run.distance_m == 10234.5);
  assert(run.moving_time_sec == 3120);
  assert(run.elapsed_time_sec == 3300);

  const auto &commute = result.activities[1];
  assert(commute.id == "abc");
  assert(commute.type == "EBikeRide");
  assert(commute.start_time == "2024-05-02T08:00:00Z");

  assert(result.activities[2].type == "Unknown");
}

void test_activity_list_errors()
{
  std::cout << "Testing bad activity lists..." << std::endl;
  assert(strava_client_t::parse_activities_json("[]").activities.empty());
  assert(strava_client_t::parse_activities_json("[]").status == fetch_status_e::OK);

  auto not_array = strava_client_t::parse_activities_json(R"({"message": "Rate Limit Exceeded"})");
  assert(not_array.status == fetch_status_e::UPSTREAM_ERROR);

  auto garbage = strava_client_t::parse_activities_json("<html>");
  assert(garbage.status == fetch_status_e::UPSTREAM_ERROR);
  assert(garbage.activities.empty());
}

void test_stream_by_type()
{
  std::cout << "Testing keyed stream..." << std::endl;
  auto result = strava_client_t::parse_stream_json(R"({
    "latlng": { "data": [[51.5, -0.12], [51.5001, -0.1201], [51.5002, -0.1203]] },
    "time": { "data": [0, 5, 11] },
    "altitude": { "data": [12.0, 12.5] }
  })");

  assert(result.status == fetch_status_e::OK);
  assert(result.points.size() == 3);
  assert(result.points[1].lat == 51.5001);
  assert(result.points[2].lon == -0.1203);
  assert(result.points[2].time_sec.has_value() && *result.points[2].time_sec == 11.0);
  // Length mismatch: series is ignored
  assert(!result.points[0].altitude_m.has_value());
  assert(!result.points[0].distance_m.has_value());
}

void test_stream_array_form()
{
  std::cout << "Testing stream array..." << std::endl;
  auto result = strava_client_t::parse_stream_json(R"([
    { "type": "distance", "data": [0.0, 14.2] },
    { "type": "latlng", "data": [[1.0, 2.0], [1.0001, 2.0001]] }
  ])");

  assert(result.status == fetch_status_e::OK);
  assert(result.points.size() == 2);
  assert(result.points[1].distance_m.has_value() && *result.points[1].distance_m == 14.2);
}

void test_malformed_streams()
{
  std::cout << "Testing malformed streams..." << std::endl;
  assert(strava_client_t::parse_stream_json(R"({"time": {"data": [0, 1]}})").status == fetch_status_e::MALFORMED_STREAM);
  assert(strava_client_t::parse_stream_json(R"({"latlng": {"data": [[1.0], [2.0, 3.0]]}})").status == fetch_status_e::MALFORMED_STREAM);
  assert(strava_client_t::parse_stream_json(R"({"latlng": {"data": [["a", "b"]]}})").status == fetch_status_e::MALFORMED_STREAM);
  assert(strava_client_t::parse_stream_json("not json").status == fetch_status_e::MALFORMED_STREAM);

  // An empty latlng series parses; the normalizer drops it later
  auto empty = strava_client_t::parse_stream_json(R"({"latlng": {"data": []}})");
  assert(empty.status == fetch_status_e::OK);
  assert(empty.points.empty());
}

void test_missing_token()
{
  std::cout << "Testing missing token..." << std::endl;
  strava_client_t client(std::make_shared<static_token_provider_t>(""), "http://127.0.0.1:9");
  // Rejected before any request is made
  assert(client.list_activities(1, 30).status == fetch_status_e::UNAUTHENTICATED);
  assert(client.get_stream("1").status == fetch_status_e::UNAUTHENTICATED);
}

int main()
{
  test_activity_list();
  test_activity_list_errors();
  test_stream_by_type();
  test_stream_array_form();
  test_malformed_streams();
  test_missing_token();
  std::cout << "Strava Parsing Verification Passed" << std::endl;
  return 0;
}
