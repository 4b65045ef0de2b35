#include "ui/app_ui.hpp"
#include "imgui.h"
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <utility>

namespace track_overlay
{

static auto loader_state_label(loader_state_e state) -> const char *
{
  switch (state)
  {
  case loader_state_e::IDLE:
    return "Idle";
  case loader_state_e::LISTING:
    return "Listing activities...";
  case loader_state_e::FETCHING_STREAMS:
    return "Fetching streams...";
  case loader_state_e::READY:
    return "Ready";
  case loader_state_e::FAILED:
    return "Failed";
  }
  return "Unknown";
}

AppUI::AppUI(std::string config_path) : m_config_path(std::move(config_path))
{
}

void AppUI::setup_style()
{
  ImGuiStyle &style = ImGui::GetStyle();
  ImVec4 *colors = style.Colors;

  // Deep Dark Theme
  colors[ImGuiCol_Text] = ImVec4(0.92f, 0.92f, 0.92f, 1.00f);
  colors[ImGuiCol_TextDisabled] = ImVec4(0.50f, 0.50f, 0.50f, 1.00f);
  colors[ImGuiCol_WindowBg] = ImVec4(0.11f, 0.11f, 0.13f, 1.00f);
  colors[ImGuiCol_PopupBg] = ImVec4(0.13f, 0.13f, 0.15f, 0.94f);
  colors[ImGuiCol_Border] = ImVec4(0.24f, 0.24f, 0.26f, 0.50f);
  colors[ImGuiCol_FrameBg] = ImVec4(0.18f, 0.18f, 0.20f, 1.00f);
  colors[ImGuiCol_FrameBgHovered] = ImVec4(0.24f, 0.24f, 0.26f, 1.00f);
  colors[ImGuiCol_FrameBgActive] = ImVec4(0.30f, 0.30f, 0.32f, 1.00f);
  colors[ImGuiCol_TitleBg] = ImVec4(0.08f, 0.08f, 0.09f, 1.00f);
  colors[ImGuiCol_TitleBgActive] = ImVec4(0.08f, 0.08f, 0.09f, 1.00f);
  colors[ImGuiCol_MenuBarBg] = ImVec4(0.11f, 0.11f, 0.13f, 1.00f);
  colors[ImGuiCol_CheckMark] = ImVec4(0.98f, 0.36f, 0.26f, 1.00f);
  colors[ImGuiCol_SliderGrab] = ImVec4(0.88f, 0.32f, 0.24f, 1.00f);
  colors[ImGuiCol_SliderGrabActive] = ImVec4(0.98f, 0.36f, 0.26f, 1.00f);
  colors[ImGuiCol_Button] = ImVec4(0.20f, 0.20f, 0.22f, 1.00f);
  colors[ImGuiCol_ButtonHovered] = ImVec4(0.28f, 0.28f, 0.30f, 1.00f);
  colors[ImGuiCol_ButtonActive] = ImVec4(0.98f, 0.36f, 0.26f, 1.00f);
  colors[ImGuiCol_Header] = ImVec4(0.20f, 0.20f, 0.22f, 1.00f);
  colors[ImGuiCol_HeaderHovered] = ImVec4(0.26f, 0.26f, 0.28f, 1.00f);
  colors[ImGuiCol_HeaderActive] = ImVec4(0.98f, 0.36f, 0.26f, 1.00f);
  colors[ImGuiCol_Separator] = ImVec4(0.24f, 0.24f, 0.26f, 1.00f);
  colors[ImGuiCol_PlotHistogram] = ImVec4(0.90f, 0.40f, 0.20f, 1.00f);

  // Rounding & Padding
  style.WindowRounding = 8.0f;
  style.FrameRounding = 6.0f;
  style.GrabRounding = 6.0f;
  style.PopupRounding = 6.0f;
  style.ScrollbarRounding = 6.0f;
  style.ChildRounding = 6.0f;

  style.WindowPadding = ImVec2(12.0f, 12.0f);
  style.FramePadding = ImVec2(6.0f, 4.0f);
  style.ItemSpacing = ImVec2(8.0f, 6.0f);
  style.IndentSpacing = 20.0f;
}

void AppUI::render(overlay_engine_t &engine, dataset_loader_t &loader, overlay_view_t &view, std::function<void()> on_exit)
{
  if (!m_settings_initialized)
  {
    m_per_page = engine.get_config().strava.per_page;
    m_pick_tolerance = static_cast<float>(engine.get_config().view.pick_tolerance_px);
    m_wheel_step = static_cast<float>(engine.get_config().view.wheel_zoom_step);
    m_settings_initialized = true;
  }

  render_main_menu(engine, on_exit);

  const ImGuiViewport *viewport = ImGui::GetMainViewport();
  const float menu_height = ImGui::GetFrameHeight();
  const float panel_width = 320.0f;

  // Side panel
  ImGui::SetNextWindowPos(ImVec2(viewport->WorkPos.x, viewport->Pos.y + menu_height), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(panel_width, viewport->Size.y - menu_height), ImGuiCond_FirstUseEver);
  if (ImGui::Begin("Activities"))
  {
    render_activities_panel(engine, loader);
    ImGui::Separator();
    render_filters(engine);
    ImGui::Separator();
    render_view_controls(engine);
  }
  ImGui::End();

  ImGui::SetNextWindowPos(ImVec2(viewport->Pos.x + panel_width, viewport->Pos.y + menu_height), ImGuiCond_FirstUseEver);
  ImGui::SetNextWindowSize(ImVec2(viewport->Size.x - panel_width, viewport->Size.y - menu_height), ImGuiCond_FirstUseEver);
  // Remove padding for the map window to have edge-to-edge map
  ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0, 0));
  if (ImGui::Begin("Map View", nullptr, ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse))
  {
    view.draw(engine);
  }
  ImGui::End();
  ImGui::PopStyleVar();

  if (m_show_style_settings)
  {
    ImGui::SetNextWindowSize(ImVec2(340, 360), ImGuiCond_FirstUseEver);
    if (ImGui::Begin("Overlap Style", &m_show_style_settings))
    {
      render_style_settings(engine);
    }
    ImGui::End();
  }
}

void AppUI::render_main_menu(overlay_engine_t &engine, std::function<void()> on_exit)
{
  if (ImGui::BeginMainMenuBar())
  {
    if (ImGui::BeginMenu("File"))
    {
      if (ImGui::MenuItem("Save Settings"))
      {
        overlay_config_t cfg = engine.get_config();
        cfg.strava.per_page = m_per_page;
        if (!config::save_config(m_config_path, cfg))
          std::cerr << "Config: failed to save " << m_config_path << std::endl;
      }
      ImGui::Separator();
      if (ImGui::MenuItem("Exit"))
      {
        if (on_exit)
          on_exit();
      }
      ImGui::EndMenu();
    }
    if (ImGui::BeginMenu("View"))
    {
      if (ImGui::MenuItem("Reset View"))
        engine.reset_view();
      if (ImGui::MenuItem("Fit to Data", nullptr, false, !engine.get_tracks().empty()))
        engine.fit_to_data();
      ImGui::Separator();
      ImGui::MenuItem("Overlap Style", nullptr, &m_show_style_settings);
      ImGui::EndMenu();
    }
    ImGui::EndMainMenuBar();
  }
}

void AppUI::render_activities_panel(overlay_engine_t &engine, dataset_loader_t &loader)
{
  ImGui::TextDisabled("STRAVA");

  ImGui::SetNextItemWidth(120.0f);
  if (ImGui::InputInt("Page", &m_page))
    m_page = std::max(1, m_page);
  ImGui::SetNextItemWidth(120.0f);
  if (ImGui::InputInt("Per Page", &m_per_page, 10, 50))
    m_per_page = std::clamp(m_per_page, 1, 200);

  const bool busy = loader.is_busy();
  if (ImGui::Button(busy ? "Reload" : "Load Activities", ImVec2(-1, 0)))
  {
    loader.start(m_page, m_per_page);
  }

  if (ImGui::Button("< Prev", ImVec2(ImGui::GetContentRegionAvail().x * 0.5f - 4.0f, 0)) && m_page > 1)
  {
    --m_page;
    loader.start(m_page, m_per_page);
  }
  ImGui::SameLine();
  if (ImGui::Button("Next >", ImVec2(-1, 0)))
  {
    ++m_page;
    loader.start(m_page, m_per_page);
  }

  const auto &report = loader.get_report();
  ImGui::Text("Status: %s", loader_state_label(loader.get_state()));
  if (busy)
  {
    auto [active, queued] = loader.get_loading_status();
    ImGui::Text("Streams: %zu loaded, %d active, %d queued", report.streams_loaded, active, queued);
  }
  else if (loader.get_state() == loader_state_e::FAILED)
  {
    ImGui::TextColored(ImVec4(1.0f, 0.4f, 0.4f, 1.0f), "%s: %s", to_string(report.status), report.message.c_str());
    if (report.status == fetch_status_e::UNAUTHENTICATED)
      ImGui::TextWrapped("Set STRAVA_ACCESS_TOKEN or strava.access_token in the config file.");
  }
  else if (report.generation > 0)
  {
    ImGui::Text("Last load: %zu listed, %zu failed", report.activities_listed, report.streams_failed);
    if (report.status == fetch_status_e::UNAUTHENTICATED)
      ImGui::TextWrapped("Some streams were rejected. Check STRAVA_ACCESS_TOKEN.");
  }

  const auto &stats = engine.get_stats();
  ImGui::Spacing();
  ImGui::TextDisabled("DATASET");
  ImGui::Text("Tracks: %zu", stats.track_count);
  ImGui::Text("Segments: %zu", stats.segment_count);
  ImGui::Text("Grid cells: %zu", engine.get_index().cell_count());
  if (stats.dropped_count > 0)
    ImGui::Text("Skipped (too short): %zu", stats.dropped_count);
  ImGui::Text("Max overlap: %d", stats.max_overlap);
  ImGui::Text("Build: %.1f ms", stats.build_ms);
}

void AppUI::render_filters(overlay_engine_t &engine)
{
  ImGui::TextDisabled("ACTIVITY TYPES");

  const auto counts = engine.get_type_counts();
  if (counts.empty())
  {
    ImGui::TextDisabled("No activities");
    return;
  }

  // Copy: set_filter mutates the filter map
  const filter_set_t filters = engine.get_filters();
  for (const auto &[type, count] : counts)
  {
    bool enabled = style::is_type_active(filters, type);
    char label[128];
    std::snprintf(label, sizeof(label), "%s (%d)", type.c_str(), count);
    if (ImGui::Checkbox(label, &enabled))
    {
      engine.set_filter(type, enabled);
    }
  }
}

void AppUI::render_style_settings(overlay_engine_t &engine)
{
  style_config_t style = engine.get_config().style;
  bool changed = false;

  ImGui::TextDisabled("THICKNESS");
  changed |= ImGui::SliderFloat("Base", &style.base_thickness, 0.5f, 10.0f, "%.1f px");
  changed |= ImGui::SliderFloat("Start", &style.start_thickness, 0.5f, 15.0f, "%.1f px");
  changed |= ImGui::SliderFloat("Max", &style.max_thickness, 0.5f, 20.0f, "%.1f px");

  ImGui::TextDisabled("OVERLAP COUNTS");
  changed |= ImGui::SliderInt("Start Count", &style.thickness_start_count, 1, 20);
  changed |= ImGui::SliderInt("Full Effect Count", &style.full_effect_count, 1, 50);

  ImGui::TextDisabled("COLORS");
  changed |= ImGui::ColorEdit3("No Overlap", style.no_overlap_color.data());
  changed |= ImGui::ColorEdit3("Max Overlap", style.max_overlap_color.data());

  if (changed)
  {
    engine.set_style(style);
  }

  view_config_t view = engine.get_config().view;
  bool view_changed = false;

  ImGui::TextDisabled("INTERACTION");
  view_changed |= ImGui::SliderFloat("Pick Tolerance", &m_pick_tolerance, 1.0f, 40.0f, "%.0f px");
  view_changed |= ImGui::SliderFloat("Wheel Step", &m_wheel_step, 1.01f, 2.0f, "%.2fx");

  if (view_changed)
  {
    view.pick_tolerance_px = m_pick_tolerance;
    view.wheel_zoom_step = m_wheel_step;
    engine.set_view_config(view);
  }

  ImGui::Spacing();
  if (ImGui::Button("Restore Defaults", ImVec2(-1, 0)))
  {
    engine.set_style(style_config_t{});
  }
}

void AppUI::render_view_controls(overlay_engine_t &engine)
{
  ImGui::TextDisabled("VIEW");
  float w = ImGui::GetContentRegionAvail().x * 0.5f - 4.0f;
  if (ImGui::Button("Reset View", ImVec2(w, 0)))
    engine.reset_view();
  ImGui::SameLine();
  ImGui::BeginDisabled(engine.get_tracks().empty());
  if (ImGui::Button("Fit to Data", ImVec2(-1, 0)))
    engine.fit_to_data();
  ImGui::EndDisabled();

  ImGui::Text("Zoom: %.3f", engine.get_view().get_scale());
  if (const track_t *selected = engine.get_selected_track())
  {
    ImGui::Text("Selected: %s", selected->activity.name.c_str());
    if (ImGui::SmallButton("Clear Selection"))
      engine.clear_selection();
  }

  if (ImGui::Button("Overlap Style...", ImVec2(-1, 0)))
    m_show_style_settings = true;
}

} // namespace track_overlay
