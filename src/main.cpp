#include "imgui.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include <GLFW/glfw3.h>
#include <iostream>
#include <stdio.h>

#include "map/map_canvas.hpp"
#include "ui/app_ui.hpp"
#include "ui/map_view.hpp"

// Main code
int main(int argc, char **argv)
{
  // Setup window
  glfwSetErrorCallback([](int error, const char *description) { fprintf(stderr, "Glfw Error %d: %s\n", error, description); });

  if (!glfwInit())
    return 1;

  // GL 3.0 + GLSL 130
  const char *glsl_version = "#version 130";
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

  // Create window with graphics context
  GLFWwindow *window = glfwCreateWindow(1440, 900, "Site Mapper", NULL, NULL);
  if (window == NULL)
  {
    glfwTerminate();
    return 1;
  }
  glfwMakeContextCurrent(window);
  glfwSwapInterval(1); // Enable vsync

  // Setup Dear ImGui context
  IMGUI_CHECKVERSION();
  ImGui::CreateContext();
  ImGuiIO &io = ImGui::GetIO();
  io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard; // Enable Keyboard Controls
  io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;     // Enable Docking

  ImGui::StyleColorsDark();

  // Setup Platform/Renderer backends
  ImGui_ImplGlfw_InitForOpenGL(window, true);
  ImGui_ImplOpenGL3_Init(glsl_version);

  // Application State
  site_mapper::app_state_t state;
  if (argc > 1)
    state.workspace_file = argv[1];

  site_mapper::AppUI app;
  app.setup_style();

  // Callbacks hold a reference to state, which outlives the canvas
  state.props.callbacks = site_mapper::AppUI::make_callbacks(state);
  if (!site_mapper::AppUI::load_workspace(state))
    std::cout << "Workspace: " << state.workspace_file << " not loaded, starting with defaults" << std::endl;

  site_mapper::map_view_t map_view;
  site_mapper::map_canvas_t canvas;
  if (!canvas.mount(site_mapper::map_view_t::make_surface, state.props))
    std::cerr << "Map: mount failed" << std::endl;
  state.dirty = false;

  // Main loop
  while (!glfwWindowShouldClose(window))
  {
    glfwPollEvents();

    // Start the Dear ImGui frame
    ImGui_ImplOpenGL3_NewFrame();
    ImGui_ImplGlfw_NewFrame();
    ImGui::NewFrame();

    app.render(canvas, map_view, state, [window]() { glfwSetWindowShouldClose(window, GLFW_TRUE); });

    // Props edited this frame reach the map before the next one
    if (state.dirty)
    {
      canvas.render(state.props);
      state.dirty = false;
    }

    // Rendering
    ImGui::Render();
    int display_w, display_h;
    glfwGetFramebufferSize(window, &display_w, &display_h);
    glViewport(0, 0, display_w, display_h);
    glClearColor(0.10f, 0.11f, 0.12f, 1.00f);
    glClear(GL_COLOR_BUFFER_BIT);
    ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

    glfwSwapBuffers(window);
  }

  // Map overlays and textures go while the GL context is still current
  canvas.unmount();
  map_view.get_tile_service().clear();

  // Cleanup
  ImGui_ImplOpenGL3_Shutdown();
  ImGui_ImplGlfw_Shutdown();
  ImGui::DestroyContext();

  glfwDestroyWindow(window);
  glfwTerminate();

  return 0;
}
