#pragma once

#include "core/persistence.hpp"
#include "map/map_canvas.hpp"
#include "ui/map_view.hpp"
#include <functional>
#include <optional>
#include <string>

namespace site_mapper
{

// Host application state. The panels and map callbacks edit it; the main
// loop hands props to the canvas whenever dirty is set.
struct app_state_t
{
  std::string workspace_file = "workspace.json";
  persistence::workspace_t workspace;
  map_canvas_props_t props;

  std::optional<view_state_t> view;
  // Completed drawing waiting for a label before it becomes an annotation
  std::optional<drawn_feature_t> pending_drawn;
  std::string status;

  size_t next_annotation = 1;
  bool dirty = true;
};

class AppUI
{
public:
  AppUI() = default;
  ~AppUI() = default;

  // Apply custom style/theme
  void setup_style();

  // Map callbacks writing into state. State must outlive the canvas.
  static map_callbacks_t make_callbacks(app_state_t &state);

  // Read the workspace file and every data file it names into state.props
  static bool load_workspace(app_state_t &state);
  static bool save_workspace(app_state_t &state);

  // Main render function
  void render(map_canvas_t &canvas, map_view_t &view, app_state_t &state, std::function<void()> on_exit);

private:
  void render_main_menu(map_view_t &view, app_state_t &state, std::function<void()> on_exit);
  void render_layers(map_canvas_t &canvas, app_state_t &state);
  void render_tools(map_canvas_t &canvas, app_state_t &state);
  void render_inspector(map_canvas_t &canvas, app_state_t &state);
  void render_save_annotation(app_state_t &state);
  void handle_shortcuts(map_canvas_t &canvas, app_state_t &state);

  // UI State
  bool m_show_layers = true;
  bool m_show_tools = true;
  bool m_show_inspector = true;
  bool m_show_map_view = true;

  char m_label_buffer[128] = {};
  char m_category_buffer[64] = "annotation";
};

} // namespace site_mapper
