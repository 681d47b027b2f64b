#pragma once

#include "core/geojson.hpp"
#include "core/map_types.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace site_mapper
{

// Click-to-draw state for the point, line and polygon tools. Vertices come in
// from map clicks; a point completes on its first vertex, lines and polygons
// on finish().
class draw_session_t
{
public:
  static constexpr size_t MIN_LINE_VERTICES = 2;
  static constexpr size_t MIN_POLYGON_VERTICES = 3;

  draw_session_t();

  // Start drawing with a tool. A non-drawing tool cancels the session.
  auto begin(active_tool_e tool) -> void;
  auto cancel() -> void;

  auto add_vertex(geo_position_t position) -> std::optional<drawn_feature_t>;
  auto undo_vertex() -> bool;
  auto finish() -> std::optional<drawn_feature_t>;

  auto is_active() const -> bool
  {
    return is_draw_tool(m_tool);
  }
  auto can_finish() const -> bool;
  auto get_tool() const -> active_tool_e
  {
    return m_tool;
  }
  auto get_vertices() const -> const ring_t &
  {
    return m_vertices;
  }

  // In-progress geometry for the draw-feedback layers. The pointer changes
  // whenever the vertices do.
  auto get_feedback() const -> const feature_collection_ptr &
  {
    return m_feedback;
  }

  // Measurement of the current vertices, for the live readout
  auto live_measurement() const -> std::optional<drawn_feature_t>;

  auto set_on_complete(std::function<void(const drawn_feature_t &)> callback) -> void
  {
    m_on_complete = std::move(callback);
  }

  // Length (lines) or area and perimeter (polygons) of a geometry
  static auto measure(const geometry_t &geometry) -> drawn_feature_t;

  // "1,234 ft (0.23 mi)" or "0.28 acres (12,345 sq ft)"; empty for points
  static auto describe(const drawn_feature_t &drawn) -> std::string;

private:
  auto current_geometry() const -> std::optional<geometry_t>;
  auto complete(geometry_t geometry) -> drawn_feature_t;
  auto rebuild_feedback() -> void;

  active_tool_e m_tool = active_tool_e::None;
  ring_t m_vertices;
  feature_collection_ptr m_feedback;
  uint64_t m_next_id = 1;

  std::function<void(const drawn_feature_t &)> m_on_complete;
};

} // namespace site_mapper
