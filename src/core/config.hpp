#pragma once

#include <array>
#include <string>

namespace track_overlay
{

struct style_config_t
{
  float base_thickness = 2.0f;
  float start_thickness = 3.0f;
  float max_thickness = 8.0f;
  int thickness_start_count = 2;
  int full_effect_count = 5;
  std::array<float, 3> no_overlap_color = {0.0f, 0.0f, 0.0f};
  std::array<float, 3> max_overlap_color = {1.0f, 0.0f, 0.0f};
};

struct view_config_t
{
  double min_zoom = 0.01;
  double max_zoom = 100.0;
  double default_scale = 1.0;
  double fit_max_scale = 5.0;
  double fit_min_scale = 0.01;
  double pick_tolerance_px = 10.0;
  double wheel_zoom_step = 1.1; // Multiplicative factor per wheel notch
};

struct strava_config_t
{
  std::string base_url = "https://www.strava.com/api/v3";
  std::string access_token;
  int per_page = 30;
  int max_concurrent_fetches = 4;
};

struct overlay_config_t
{
  // World units per degree of latitude/longitude
  double normalizer_scale = 100000.0;
  // Overlap grid cell size in world units
  double proximity = 20.0;

  style_config_t style;
  view_config_t view;
  std::array<float, 3> background_color = {0.96f, 0.96f, 0.94f};
  strava_config_t strava;
};

namespace config
{

constexpr const char *DEFAULT_CONFIG_FILE = "track_overlay.json";

// Missing keys keep their current values. Returns false if the file could not
// be opened or parsed; the config is left untouched on parse failure.
auto load_config(const std::string &filename, overlay_config_t &config) -> bool;
auto save_config(const std::string &filename, const overlay_config_t &config) -> bool;

// STRAVA_ACCESS_TOKEN overrides the configured token when set
auto apply_environment(overlay_config_t &config) -> void;

} // namespace config
} // namespace track_overlay
