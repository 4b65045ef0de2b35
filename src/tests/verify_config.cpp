#include "../core/config.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>

using namespace track_overlay;

static auto temp_file(const std::string &name) -> std::string
{
  return (std::filesystem::temp_directory_path() / name).string();
}

static auto write_file(const std::string &path, const std::string &content) -> void
{
  std::ofstream out(path);
  out << content;
}

void test_missing_file()
{
  std::cout << "Testing missing file..." << std::endl;
  overlay_config_t cfg;
  assert(!config::load_config(temp_file("track_overlay_does_not_exist.json"), cfg));
  assert(cfg.proximity == 20.0);
  assert(cfg.normalizer_scale == 100000.0);
}

void test_partial_file()
{
  std::cout << "Testing partial file..." << std::endl;
  auto path = temp_file("track_overlay_partial.json");
  write_file(path, R"({
    "overlap": { "proximity": 35.5 },
    "style": { "full_effect_count": 8, "max_overlap_color": [0.0, 0.5, 1.0] },
    "strava": { "per_page": 50 }
  })");

  overlay_config_t cfg;
  assert(config::load_config(path, cfg));
  assert(cfg.proximity == 35.5);
  assert(cfg.style.full_effect_count == 8);
  assert(cfg.style.max_overlap_color[1] == 0.5f);
  assert(cfg.strava.per_page == 50);
  // Untouched keys keep their defaults
  assert(cfg.normalizer_scale == 100000.0);
  assert(cfg.style.base_thickness == 2.0f);
  assert(cfg.view.max_zoom == 100.0);

  std::filesystem::remove(path);
}

void test_invalid_files()
{
  std::cout << "Testing invalid files..." << std::endl;
  auto path = temp_file("track_overlay_invalid.json");

  overlay_config_t cfg;
  cfg.proximity = 12.0;

  write_file(path, "{ not json");
  assert(!config::load_config(path, cfg));
  assert(cfg.proximity == 12.0);

  write_file(path, R"({ "overlap": { "proximity": "wide" } })");
  assert(!config::load_config(path, cfg));
  assert(cfg.proximity == 12.0);

  write_file(path, R"({ "overlap": { "proximity": -1 }, "style": { "base_thickness": 4 } })");
  assert(!config::load_config(path, cfg));
  assert(cfg.proximity == 12.0);
  assert(cfg.style.base_thickness == 2.0f);

  write_file(path, R"({ "view": { "min_zoom": 5, "max_zoom": 1 } })");
  assert(!config::load_config(path, cfg));

  std::filesystem::remove(path);
}

void test_save_and_reload()
{
  std::cout << "Testing save..." << std::endl;
  auto path = temp_file("track_overlay_saved.json");

  overlay_config_t cfg;
  cfg.proximity = 42.0;
  cfg.style.start_thickness = 4.5f;
  cfg.background_color = {0.1f, 0.2f, 0.3f};
  cfg.strava.access_token = "secret-token";
  assert(config::save_config(path, cfg));

  std::ifstream in(path);
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(content.find("secret-token") == std::string::npos);

  overlay_config_t loaded;
  assert(config::load_config(path, loaded));
  assert(loaded.proximity == 42.0);
  assert(loaded.style.start_thickness == 4.5f);
  assert(loaded.background_color[2] == 0.3f);
  assert(loaded.strava.access_token.empty());

  std::filesystem::remove(path);
}

void test_environment_token()
{
  std::cout << "Testing environment token..." << std::endl;
  overlay_config_t cfg;
  cfg.strava.access_token = "from-file";

  unsetenv("STRAVA_ACCESS_TOKEN");
  config::apply_environment(cfg);
  assert(cfg.strava.access_token == "from-file");

  setenv("STRAVA_ACCESS_TOKEN", "from-env", 1);
  config::apply_environment(cfg);
  assert(cfg.strava.access_token == "from-env");
  unsetenv("STRAVA_ACCESS_TOKEN");
}

int main()
{
  test_missing_file();
  test_partial_file();
  test_invalid_files();
  test_save_and_reload();
  test_environment_token();
  std::cout << "Config Verification Passed" << std::endl;
  return 0;
}
