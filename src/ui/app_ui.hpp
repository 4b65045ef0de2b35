#pragma once

#include "core/config.hpp"
#include "core/dataset_loader.hpp"
#include "core/overlay_engine.hpp"
#include "ui/overlay_view.hpp"
#include <functional>
#include <string>

namespace track_overlay
{

class AppUI
{
public:
  explicit AppUI(std::string config_path);
  ~AppUI() = default;

  // Apply custom style/theme
  void setup_style();

  // Main render function
  void render(overlay_engine_t &engine, dataset_loader_t &loader, overlay_view_t &view, std::function<void()> on_exit);

private:
  void render_main_menu(overlay_engine_t &engine, std::function<void()> on_exit);
  void render_activities_panel(overlay_engine_t &engine, dataset_loader_t &loader);
  void render_filters(overlay_engine_t &engine);
  void render_style_settings(overlay_engine_t &engine);
  void render_view_controls(overlay_engine_t &engine);

  std::string m_config_path;

  // UI State
  int m_page = 1;
  int m_per_page = 30;
  float m_pick_tolerance = 10.0f;
  float m_wheel_step = 1.1f;
  bool m_settings_initialized = false;
  bool m_show_style_settings = false;
};

} // namespace track_overlay
