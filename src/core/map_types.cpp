#include "core/map_types.hpp"
#include <cmath>

namespace site_mapper
{

auto tool_name(active_tool_e tool) -> const char *
{
  switch (tool)
  {
  case active_tool_e::Point:
    return "point";
  case active_tool_e::Line:
    return "line";
  case active_tool_e::Polygon:
    return "polygon";
  case active_tool_e::Edit:
    return "edit";
  case active_tool_e::Delete:
    return "delete";
  default:
    return "none";
  }
}

auto parse_tool(const std::string &name) -> active_tool_e
{
  if (name == "point")
    return active_tool_e::Point;
  if (name == "line")
    return active_tool_e::Line;
  if (name == "polygon")
    return active_tool_e::Polygon;
  if (name == "edit")
    return active_tool_e::Edit;
  if (name == "delete")
    return active_tool_e::Delete;
  return active_tool_e::None;
}

auto resolve_project_center(std::optional<double> lat, std::optional<double> lon) -> geo_position_t
{
  if (!lat || !lon || !std::isfinite(*lat) || !std::isfinite(*lon))
    return DEFAULT_CENTER;
  if (*lat < -90.0 || *lat > 90.0 || *lon < -180.0 || *lon > 180.0)
    return DEFAULT_CENTER;
  return {*lon, *lat};
}

} // namespace site_mapper
