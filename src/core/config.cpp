#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace track_overlay
{
namespace config
{

static auto color_to_json(const std::array<float, 3> &color) -> json
{
  return json::array({color[0], color[1], color[2]});
}

static auto read_color(const json &j, const char *key, std::array<float, 3> &color) -> void
{
  if (j.contains(key) && j[key].is_array() && j[key].size() == 3)
  {
    color[0] = j[key][0].get<float>();
    color[1] = j[key][1].get<float>();
    color[2] = j[key][2].get<float>();
  }
}

auto load_config(const std::string &filename, overlay_config_t &config) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "Config: JSON Parse Error in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  // Config is only replaced once every section parsed
  overlay_config_t parsed = config;
  try
  {
    if (j.contains("normalizer"))
    {
      parsed.normalizer_scale = j["normalizer"].value("scale", parsed.normalizer_scale);
    }

    if (j.contains("overlap"))
    {
      parsed.proximity = j["overlap"].value("proximity", parsed.proximity);
    }

    if (j.contains("style"))
    {
      const auto &s = j["style"];
      parsed.style.base_thickness = s.value("base_thickness", parsed.style.base_thickness);
      parsed.style.start_thickness = s.value("start_thickness", parsed.style.start_thickness);
      parsed.style.max_thickness = s.value("max_thickness", parsed.style.max_thickness);
      parsed.style.thickness_start_count = s.value("thickness_start_count", parsed.style.thickness_start_count);
      parsed.style.full_effect_count = s.value("full_effect_count", parsed.style.full_effect_count);
      read_color(s, "no_overlap_color", parsed.style.no_overlap_color);
      read_color(s, "max_overlap_color", parsed.style.max_overlap_color);
    }

    if (j.contains("view"))
    {
      const auto &v = j["view"];
      parsed.view.min_zoom = v.value("min_zoom", parsed.view.min_zoom);
      parsed.view.max_zoom = v.value("max_zoom", parsed.view.max_zoom);
      parsed.view.default_scale = v.value("default_scale", parsed.view.default_scale);
      parsed.view.fit_max_scale = v.value("fit_max_scale", parsed.view.fit_max_scale);
      parsed.view.fit_min_scale = v.value("fit_min_scale", parsed.view.fit_min_scale);
      parsed.view.pick_tolerance_px = v.value("pick_tolerance_px", parsed.view.pick_tolerance_px);
      parsed.view.wheel_zoom_step = v.value("wheel_zoom_step", parsed.view.wheel_zoom_step);
    }

    if (j.contains("render"))
    {
      read_color(j["render"], "background_color", parsed.background_color);
    }

    if (j.contains("strava"))
    {
      const auto &s = j["strava"];
      parsed.strava.base_url = s.value("base_url", parsed.strava.base_url);
      parsed.strava.access_token = s.value("access_token", parsed.strava.access_token);
      parsed.strava.per_page = s.value("per_page", parsed.strava.per_page);
      parsed.strava.max_concurrent_fetches = s.value("max_concurrent_fetches", parsed.strava.max_concurrent_fetches);
    }
  }
  catch (const json::exception &e)
  {
    std::cerr << "Config: Invalid value in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  if (parsed.normalizer_scale <= 0.0 || parsed.proximity <= 0.0)
  {
    std::cerr << "Config: scale and proximity must be positive, ignoring " << filename << std::endl;
    return false;
  }
  if (parsed.view.min_zoom <= 0.0 || parsed.view.max_zoom < parsed.view.min_zoom)
  {
    std::cerr << "Config: invalid zoom range, ignoring " << filename << std::endl;
    return false;
  }
  if (parsed.strava.max_concurrent_fetches < 1)
    parsed.strava.max_concurrent_fetches = 1;

  config = parsed;
  return true;
}

auto save_config(const std::string &filename, const overlay_config_t &config) -> bool
{
  json j;

  j["normalizer"] = {{"scale", config.normalizer_scale}};
  j["overlap"] = {{"proximity", config.proximity}};

  j["style"] = {{"base_thickness", config.style.base_thickness},
                {"start_thickness", config.style.start_thickness},
                {"max_thickness", config.style.max_thickness},
                {"thickness_start_count", config.style.thickness_start_count},
                {"full_effect_count", config.style.full_effect_count},
                {"no_overlap_color", color_to_json(config.style.no_overlap_color)},
                {"max_overlap_color", color_to_json(config.style.max_overlap_color)}};

  j["view"] = {{"min_zoom", config.view.min_zoom},
               {"max_zoom", config.view.max_zoom},
               {"default_scale", config.view.default_scale},
               {"fit_max_scale", config.view.fit_max_scale},
               {"fit_min_scale", config.view.fit_min_scale},
               {"pick_tolerance_px", config.view.pick_tolerance_px},
               {"wheel_zoom_step", config.view.wheel_zoom_step}};

  j["render"] = {{"background_color", color_to_json(config.background_color)}};

  // Access token is never written to disk
  j["strava"] = {{"base_url", config.strava.base_url}, {"per_page", config.strava.per_page}, {"max_concurrent_fetches", config.strava.max_concurrent_fetches}};

  std::ofstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  file << j.dump(4);
  return true;
}

auto apply_environment(overlay_config_t &config) -> void
{
  const char *token = std::getenv("STRAVA_ACCESS_TOKEN");
  if (token && *token)
  {
    config.strava.access_token = token;
  }
}

} // namespace config
} // namespace track_overlay
