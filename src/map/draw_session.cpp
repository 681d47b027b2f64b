#include "map/draw_session.hpp"
#include "core/geo_math.hpp"
#include "core/geometry_ops.hpp"
#include <cmath>
#include <format>
#include <iostream>

namespace site_mapper
{

namespace
{
constexpr double FEET_PER_MILE = 5280.0;
constexpr double SQ_FEET_PER_SQ_METER = 10.7639;

// Whole number with thousands separators
auto grouped(double value) -> std::string
{
  auto digits = std::format("{:.0f}", std::abs(std::round(value)));
  std::string out;
  for (size_t i = 0; i < digits.size(); ++i)
  {
    if (i > 0 && (digits.size() - i) % 3 == 0)
      out += ',';
    out += digits[i];
  }
  return value < 0.0 && digits != "0" ? "-" + out : out;
}
} // namespace

draw_session_t::draw_session_t()
{
  rebuild_feedback();
}

auto draw_session_t::begin(active_tool_e tool) -> void
{
  if (!is_draw_tool(tool))
  {
    cancel();
    return;
  }

  if (tool == m_tool)
    return;

  m_tool = tool;
  m_vertices.clear();
  rebuild_feedback();
}

auto draw_session_t::cancel() -> void
{
  m_tool = active_tool_e::None;
  if (!m_vertices.empty())
  {
    m_vertices.clear();
    rebuild_feedback();
  }
}

auto draw_session_t::add_vertex(geo_position_t position) -> std::optional<drawn_feature_t>
{
  if (!is_active() || !std::isfinite(position.lon) || !std::isfinite(position.lat))
    return std::nullopt;

  if (m_tool == active_tool_e::Point)
    return complete(geometry_t::point(position));

  // Repeated clicks on the same spot add nothing
  if (!m_vertices.empty() && m_vertices.back() == position)
    return std::nullopt;

  m_vertices.push_back(position);
  rebuild_feedback();
  return std::nullopt;
}

auto draw_session_t::undo_vertex() -> bool
{
  if (m_vertices.empty())
    return false;
  m_vertices.pop_back();
  rebuild_feedback();
  return true;
}

auto draw_session_t::can_finish() const -> bool
{
  if (m_tool == active_tool_e::Line)
    return m_vertices.size() >= MIN_LINE_VERTICES;
  if (m_tool == active_tool_e::Polygon)
    return m_vertices.size() >= MIN_POLYGON_VERTICES;
  return false;
}

auto draw_session_t::finish() -> std::optional<drawn_feature_t>
{
  if (!can_finish())
    return std::nullopt;

  auto geometry = current_geometry();
  if (!geometry)
    return std::nullopt;
  return complete(std::move(*geometry));
}

auto draw_session_t::live_measurement() const -> std::optional<drawn_feature_t>
{
  if (!can_finish())
    return std::nullopt;
  auto geometry = current_geometry();
  if (!geometry)
    return std::nullopt;
  return measure(*geometry);
}

auto draw_session_t::measure(const geometry_t &geometry) -> drawn_feature_t
{
  drawn_feature_t result;
  result.geometry = geometry;

  if (geometry.type == geometry_type_e::LineString && !geometry.parts.empty() && !geometry.parts.front().empty())
  {
    const auto &line = geometry.parts.front().front();
    if (line.size() >= 2)
    {
      double feet = geometry_ops::line_length_m(line) * geo::FEET_PER_METER;
      result.length_ft = std::round(feet);
      result.length_miles = feet / FEET_PER_MILE;
    }
  }
  else if (geometry.type == geometry_type_e::Polygon && !geometry.parts.empty() && !geometry.parts.front().empty())
  {
    const auto &outer = geometry.parts.front().front();
    if (outer.size() >= 4)
    {
      double area_sqft = std::round(geometry_ops::ring_area_m2(outer) * SQ_FEET_PER_SQ_METER);
      result.area_sqft = area_sqft;
      result.area_acres = area_sqft / geo::SQ_FEET_PER_ACRE;
      result.perimeter_ft = std::round(geometry_ops::line_length_m(outer) * geo::FEET_PER_METER);
    }
  }
  return result;
}

auto draw_session_t::describe(const drawn_feature_t &drawn) -> std::string
{
  if (drawn.length_ft && drawn.length_miles)
    return std::format("{} ft ({:.2f} mi)", grouped(*drawn.length_ft), *drawn.length_miles);
  if (drawn.area_sqft && drawn.area_acres)
    return std::format("{:.2f} acres ({} sq ft)", *drawn.area_acres, grouped(*drawn.area_sqft));
  return {};
}

auto draw_session_t::current_geometry() const -> std::optional<geometry_t>
{
  if (m_tool == active_tool_e::Line && m_vertices.size() >= MIN_LINE_VERTICES)
    return geometry_t::line_string(m_vertices);

  if (m_tool == active_tool_e::Polygon && m_vertices.size() >= MIN_POLYGON_VERTICES)
  {
    ring_t ring = m_vertices;
    ring.push_back(ring.front());
    return geometry_t::polygon({std::move(ring)});
  }
  return std::nullopt;
}

auto draw_session_t::complete(geometry_t geometry) -> drawn_feature_t
{
  auto drawn = measure(geometry);
  drawn.id = std::format("draw-{}", m_next_id++);

  std::cout << "Draw: completed " << geojson::geometry_type_name(drawn.geometry.type) << " " << drawn.id << std::endl;

  // The tool stays armed for the next shape
  m_vertices.clear();
  rebuild_feedback();

  if (m_on_complete)
    m_on_complete(drawn);
  return drawn;
}

auto draw_session_t::rebuild_feedback() -> void
{
  std::vector<feature_t> features;

  if (auto geometry = current_geometry())
  {
    feature_t shape;
    shape.id = "draw-shape";
    shape.geometry = std::move(*geometry);
    features.push_back(std::move(shape));
  }

  for (size_t i = 0; i < m_vertices.size(); ++i)
  {
    feature_t vertex;
    vertex.id = std::format("draw-vertex-{}", i);
    vertex.geometry = geometry_t::point(m_vertices[i]);
    vertex.properties = {{"meta", "vertex"}};
    features.push_back(std::move(vertex));
  }

  m_feedback = make_collection(std::move(features));
}

} // namespace site_mapper
