#pragma once

#include "core/track.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace track_overlay
{

enum class fetch_status_e
{
  OK,
  UNAUTHENTICATED,  // Propagated to the UI, never retried
  UPSTREAM_ERROR,   // Transport failure or non-success HTTP status
  MALFORMED_STREAM  // Response without usable latlng data
};

inline auto to_string(fetch_status_e status) -> const char *
{
  switch (status)
  {
  case fetch_status_e::OK:
    return "OK";
  case fetch_status_e::UNAUTHENTICATED:
    return "Unauthenticated";
  case fetch_status_e::UPSTREAM_ERROR:
    return "Upstream error";
  case fetch_status_e::MALFORMED_STREAM:
    return "Malformed stream";
  }
  return "Unknown";
}

struct activity_list_result_t
{
  fetch_status_e status = fetch_status_e::OK;
  std::string message;
  std::vector<activity_t> activities;
};

struct stream_result_t
{
  fetch_status_e status = fetch_status_e::OK;
  std::string message;
  std::vector<raw_point_t> points;
};

// Implementations are called from background tasks and must not share
// mutable state between calls.
class activity_source_t
{
public:
  virtual ~activity_source_t() = default;

  // page is 1-based
  virtual auto list_activities(int page, int per_page) -> activity_list_result_t = 0;
};

class stream_source_t
{
public:
  virtual ~stream_source_t() = default;

  virtual auto get_stream(const std::string &activity_id) -> stream_result_t = 0;
};

class auth_provider_t
{
public:
  virtual ~auth_provider_t() = default;

  // nullopt means the user is not authenticated
  virtual auto get_bearer_token() const -> std::optional<std::string> = 0;
};

// Token supplied up front (config file or environment)
class static_token_provider_t : public auth_provider_t
{
public:
  explicit static_token_provider_t(std::string token) : m_token(std::move(token))
  {
  }

  auto get_bearer_token() const -> std::optional<std::string> override
  {
    if (m_token.empty())
      return std::nullopt;
    return m_token;
  }

private:
  std::string m_token;
};

} // namespace track_overlay
