#pragma once

#include "map/map_canvas.hpp"
#include "renderer/retained_surface.hpp"
#include "ui/tile_service.hpp"
#include "imgui.h"
#include <memory>
#include <optional>
#include <vector>

namespace site_mapper
{

// ImGui host of the map canvas. Draws basemap tiles and the retained surface
// (layers in paint order, markers, popups) and turns mouse input into surface
// pointer events.
class map_view_t
{
public:
  map_view_t() = default;
  ~map_view_t() = default;

  // Surface factory handed to map_canvas_t::mount
  static auto make_surface(const viewport_t &viewport) -> std::unique_ptr<map_surface_t>;

  // Draws into the current window, filling the remaining content region
  auto draw(map_canvas_t &canvas) -> void;

  auto get_mouse_position() const -> std::optional<geo_position_t>
  {
    return m_mouse_geo;
  }
  auto get_tile_service() -> tile_service_t &
  {
    return m_tiles;
  }

  auto get_show_tile_grid() const -> bool
  {
    return m_show_tile_grid;
  }
  auto set_show_tile_grid(bool show) -> void
  {
    m_show_tile_grid = show;
  }

private:
  auto handle_input(map_canvas_t &canvas, retained_surface_t &surface, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void;
  auto apply_cursor(const retained_surface_t &surface) -> void;

  auto render_tiles(const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void;
  auto render_layers(const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void;
  auto render_markers(retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void;
  auto render_popups(retained_surface_t &surface, const ImVec2 &canvas_p0) -> void;
  auto render_scale_bar(const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0, const ImVec2 &canvas_sz) -> void;
  auto render_status(const map_canvas_t &canvas, const retained_surface_t &surface, ImDrawList *draw_list, const ImVec2 &canvas_p0) -> void;

  auto to_screen(const retained_surface_t &surface, geo_position_t position, const ImVec2 &canvas_p0) const -> ImVec2;
  auto project_ring(const retained_surface_t &surface, const ring_t &ring, const ImVec2 &canvas_p0) const -> std::vector<ImVec2>;

  tile_service_t m_tiles;

  std::optional<geo_position_t> m_mouse_geo;
  ImVec2 m_last_mouse = ImVec2(-1.0f, -1.0f);
  bool m_hovering = false;
  bool m_dragging = false;
  bool m_suppress_release = false;

  // Wheel zoom is settled once the wheel has been idle for a moment
  bool m_zoom_pending = false;
  double m_last_zoom_time = 0.0;

  bool m_show_tile_grid = false;
};

} // namespace site_mapper
