#pragma once

#include "core/activity_source.hpp"
#include <memory>
#include <string>

namespace track_overlay
{

// Strava REST v3 client for activity summaries and latlng streams.
// Stateless between calls, safe to use from several fetch tasks at once.
class strava_client_t : public activity_source_t, public stream_source_t
{
public:
  strava_client_t(std::shared_ptr<const auth_provider_t> auth, std::string base_url);

  auto list_activities(int page, int per_page) -> activity_list_result_t override;
  auto get_stream(const std::string &activity_id) -> stream_result_t override;

  // Body of GET /athlete/activities
  static auto parse_activities_json(const std::string &json_data) -> activity_list_result_t;

  // Body of GET /activities/{id}/streams, keyed by type or as a plain array
  static auto parse_stream_json(const std::string &json_data) -> stream_result_t;

private:
  std::shared_ptr<const auth_provider_t> m_auth;
  std::string m_base_url;
};

} // namespace track_overlay
