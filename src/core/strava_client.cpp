#include "core/strava_client.hpp"
#include <cpr/cpr.h>
#include <format>
#include <iostream>
#include <nlohmann/json.hpp>

namespace track_overlay
{

using json = nlohmann::json;

constexpr const char *USER_AGENT = "TrackOverlay/0.1";
constexpr const char *STREAM_KEYS = "latlng,time,distance,altitude";

static auto classify_response(const cpr::Response &r, fetch_status_e &status, std::string &message) -> bool
{
  if (r.error.code != cpr::ErrorCode::OK)
  {
    status = fetch_status_e::UPSTREAM_ERROR;
    message = std::format("transport error: {}", r.error.message);
    return false;
  }
  if (r.status_code == 401)
  {
    status = fetch_status_e::UNAUTHENTICATED;
    message = "Strava rejected the access token";
    return false;
  }
  if (r.status_code != 200)
  {
    status = fetch_status_e::UPSTREAM_ERROR;
    message = std::format("HTTP {}", r.status_code);
    return false;
  }
  return true;
}

static auto number_or(const json &j, const char *key, double fallback) -> double
{
  if (j.contains(key) && j[key].is_number())
    return j[key].get<double>();
  return fallback;
}

static auto string_or(const json &j, const char *key, const std::string &fallback) -> std::string
{
  if (j.contains(key) && j[key].is_string())
    return j[key].get<std::string>();
  return fallback;
}

// Numeric series of a stream entry, empty if missing or not all numbers
static auto read_series(const json &entry) -> std::vector<double>
{
  std::vector<double> values;
  if (!entry.is_object() || !entry.contains("data") || !entry["data"].is_array())
    return values;

  for (const auto &v : entry["data"])
  {
    if (!v.is_number())
      return {};
    values.push_back(v.get<double>());
  }
  return values;
}

strava_client_t::strava_client_t(std::shared_ptr<const auth_provider_t> auth, std::string base_url) : m_auth(std::move(auth)), m_base_url(std::move(base_url))
{
}

auto strava_client_t::list_activities(int page, int per_page) -> activity_list_result_t
{
  activity_list_result_t result;

  auto token = m_auth ? m_auth->get_bearer_token() : std::nullopt;
  if (!token)
  {
    result.status = fetch_status_e::UNAUTHENTICATED;
    result.message = "Not authenticated with Strava";
    return result;
  }

  cpr::Response r = cpr::Get(cpr::Url{m_base_url + "/athlete/activities"},
                             cpr::Header{{"Authorization", "Bearer " + *token}, {"User-Agent", USER_AGENT}},
                             cpr::Parameters{{"page", std::to_string(page)}, {"per_page", std::to_string(per_page)}});

  if (!classify_response(r, result.status, result.message))
  {
    std::cerr << "Strava: activity list failed: " << result.message << std::endl;
    return result;
  }

  return parse_activities_json(r.text);
}

auto strava_client_t::get_stream(const std::string &activity_id) -> stream_result_t
{
  stream_result_t result;

  auto token = m_auth ? m_auth->get_bearer_token() : std::nullopt;
  if (!token)
  {
    result.status = fetch_status_e::UNAUTHENTICATED;
    result.message = "Not authenticated with Strava";
    return result;
  }

  cpr::Response r = cpr::Get(cpr::Url{std::format("{}/activities/{}/streams", m_base_url, activity_id)},
                             cpr::Header{{"Authorization", "Bearer " + *token}, {"User-Agent", USER_AGENT}},
                             cpr::Parameters{{"keys", STREAM_KEYS}, {"key_by_type", "true"}});

  if (!classify_response(r, result.status, result.message))
    return result;

  return parse_stream_json(r.text);
}

auto strava_client_t::parse_activities_json(const std::string &json_data) -> activity_list_result_t
{
  activity_list_result_t result;

  try
  {
    auto j = json::parse(json_data);
    if (!j.is_array())
    {
      result.status = fetch_status_e::UPSTREAM_ERROR;
      result.message = "activity list is not an array";
      return result;
    }

    for (const auto &el : j)
    {
      if (!el.is_object() || !el.contains("id"))
        continue;

      activity_t a;
      if (el["id"].is_number_integer())
        a.id = std::to_string(el["id"].get<int64_t>());
      else if (el["id"].is_string())
        a.id = el["id"].get<std::string>();
      else
        continue;

      a.name = string_or(el, "name", "Untitled");
      a.type = string_or(el, "type", string_or(el, "sport_type", "Unknown"));
      a.start_time = string_or(el, "start_date_local", string_or(el, "start_date", ""));
      a.distance_m = number_or(el, "distance", 0.0);
      a.moving_time_sec = static_cast<int>(number_or(el, "moving_time", 0.0));
      a.elapsed_time_sec = static_cast<int>(number_or(el, "elapsed_time", 0.0));
      a.elevation_gain_m = number_or(el, "total_elevation_gain", 0.0);

      result.activities.push_back(std::move(a));
    }
  }
  catch (const json::exception &e)
  {
    std::cerr << "Strava: JSON Parsing Error: " << e.what() << std::endl;
    result.status = fetch_status_e::UPSTREAM_ERROR;
    result.message = e.what();
    result.activities.clear();
  }

  return result;
}

auto strava_client_t::parse_stream_json(const std::string &json_data) -> stream_result_t
{
  stream_result_t result;

  try
  {
    auto j = json::parse(json_data);

    // key_by_type=true gives an object, older responses a list of {type, data}
    json by_type = json::object();
    if (j.is_object())
    {
      by_type = j;
    }
    else if (j.is_array())
    {
      for (const auto &entry : j)
      {
        if (entry.is_object() && entry.contains("type") && entry["type"].is_string())
          by_type[entry["type"].get<std::string>()] = entry;
      }
    }

    if (!by_type.contains("latlng") || !by_type["latlng"].is_object() || !by_type["latlng"].contains("data") || !by_type["latlng"]["data"].is_array())
    {
      result.status = fetch_status_e::MALFORMED_STREAM;
      result.message = "stream has no latlng data";
      return result;
    }

    for (const auto &pair : by_type["latlng"]["data"])
    {
      if (!pair.is_array() || pair.size() != 2 || !pair[0].is_number() || !pair[1].is_number())
      {
        result.status = fetch_status_e::MALFORMED_STREAM;
        result.message = "latlng entry is not a [lat, lon] pair";
        result.points.clear();
        return result;
      }

      raw_point_t p;
      p.lat = pair[0].get<double>();
      p.lon = pair[1].get<double>();
      result.points.push_back(p);
    }

    // Optional series are only attached when they line up with latlng
    const size_t n = result.points.size();
    if (by_type.contains("time"))
    {
      auto series = read_series(by_type["time"]);
      if (series.size() == n)
        for (size_t i = 0; i < n; ++i)
          result.points[i].time_sec = series[i];
    }
    if (by_type.contains("distance"))
    {
      auto series = read_series(by_type["distance"]);
      if (series.size() == n)
        for (size_t i = 0; i < n; ++i)
          result.points[i].distance_m = series[i];
    }
    if (by_type.contains("altitude"))
    {
      auto series = read_series(by_type["altitude"]);
      if (series.size() == n)
        for (size_t i = 0; i < n; ++i)
          result.points[i].altitude_m = series[i];
    }
  }
  catch (const json::exception &e)
  {
    result.status = fetch_status_e::MALFORMED_STREAM;
    result.message = e.what();
    result.points.clear();
  }

  return result;
}

} // namespace track_overlay
