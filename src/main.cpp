#include <glad/glad.h>
#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <stdio.h>
#include <iostream>
#include <memory>
#include <string>

#include "core/config.hpp"
#include "core/dataset_loader.hpp"
#include "core/overlay_engine.hpp"
#include "core/strava_client.hpp"
#include "ui/app_ui.hpp"
#include "ui/overlay_view.hpp"

// Main code
int main(int argc, char **argv) {
  std::string config_path =
      argc > 1 ? argv[1] : track_overlay::config::DEFAULT_CONFIG_FILE;

  track_overlay::overlay_config_t config;
  if (!track_overlay::config::load_config(config_path, config))
    std::cout << "Config: using defaults" << std::endl;
  track_overlay::config::apply_environment(config);

  // Setup window
  glfwSetErrorCallback([](int error, const char *description) {
    fprintf(stderr, "Glfw Error %d: %s\n", error, description);
  });

  if (!glfwInit())
    return 1;

  // GL 3.3 + GLSL 330. Compatibility profile so glLineWidth > 1 is honoured.
  const char *glsl_version = "#version 330";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);

  // Create window with graphics context
  GLFWwindow *window =
      glfwCreateWindow(1280, 800, "Track Overlay", NULL, NULL);
  if (window == NULL) {
    glfwTerminate();
    return 1;
  }
  glfwMakeContextCurrent(window);
  glfwSwapInterval(1); // Enable vsync

  if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
    fprintf(stderr, "Failed to load OpenGL functions\n");
    glfwDestroyWindow(window);
    glfwTerminate();
    return 1;
  }

  // Setup Dear ImGui context
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |=
      ImGuiConfigFlags_NavEnableKeyboard; // Enable Keyboard Controls

  // Setup Dear ImGui style
  ImGui::StyleColorsDark();

  // Setup Platform/Renderer backends
  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init(glsl_version);

  {
    // Application State
    auto auth = std::make_shared<track_overlay::static_token_provider_t>(
        config.strava.access_token);
    auto client = std::make_shared<track_overlay::strava_client_t>(
        auth, config.strava.base_url);
    track_overlay::dataset_loader_t loader(
        client, client, config.strava.max_concurrent_fetches);
    track_overlay::overlay_engine_t engine(config);
    track_overlay::overlay_view_t overlay_view;

    track_overlay::AppUI app_ui(config_path);
    app_ui.setup_style();

    if (!auth->get_bearer_token())
      std::cout << "Strava: no access token configured, set "
                   "STRAVA_ACCESS_TOKEN to load activities"
                << std::endl;

    // Main loop
    while (!glfwWindowShouldClose(window)) {
      // Poll and handle events
      glfwPollEvents();

      // Collect finished fetches
      if (loader.update())
        engine.load_dataset(loader.take_dataset());

      // Start the Dear ImGui frame
      ImGui_ImplOpenGL3_NewFrame();
      ImGui_ImplGlfw_NewFrame();
      ImGui::NewFrame();

      app_ui.render(engine, loader, overlay_view,
                    [&]() { glfwSetWindowShouldClose(window, true); });

      // Rendering
      ImGui::Render();
      int display_w, display_h;
      glfwGetFramebufferSize(window, &display_w, &display_h);
      glViewport(0, 0, display_w, display_h);
      glClearColor(0.11f, 0.11f, 0.13f, 1.00f);
      glClear(GL_COLOR_BUFFER_BIT);
      ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

      glfwSwapBuffers(window);
    }
  }

  // Cleanup
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  glfwDestroyWindow(window);
  glfwTerminate();

  return 0;
}
