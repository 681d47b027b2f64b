#pragma once

#include "core/geojson.hpp"
#include <optional>
#include <string>

namespace site_mapper
{

// Used when the project has no usable location
constexpr geo_position_t DEFAULT_CENTER = {-111.612, 33.279};
constexpr double DEFAULT_ZOOM = 14.0;
constexpr double DEFAULT_PARCEL_MIN_ZOOM = 15.0;

inline const std::string DEFAULT_BASEMAP = "satellite";

struct viewport_t
{
  geo_position_t center = DEFAULT_CENTER;
  double zoom = DEFAULT_ZOOM;
  std::string basemap = DEFAULT_BASEMAP;
};

struct view_bounds_t
{
  geo_position_t south_west;
  geo_position_t north_east;

  auto contains(const geo_position_t &p) const -> bool
  {
    return p.lon >= south_west.lon && p.lon <= north_east.lon && p.lat >= south_west.lat && p.lat <= north_east.lat;
  }
};

// Reported to the host after the camera settles
struct view_state_t
{
  geo_position_t center;
  double zoom = 0.0;
  view_bounds_t bounds;
};

enum class active_tool_e
{
  None,
  Point,
  Line,
  Polygon,
  Edit,
  Delete
};

inline auto is_draw_tool(active_tool_e tool) -> bool
{
  return tool == active_tool_e::Point || tool == active_tool_e::Line || tool == active_tool_e::Polygon;
}

auto tool_name(active_tool_e tool) -> const char *;
auto parse_tool(const std::string &name) -> active_tool_e;

// User drawn annotation owned by the host
struct map_feature_t
{
  std::string id;
  geometry_t geometry;
  std::string label;
  std::string category;

  auto operator==(const map_feature_t &) const -> bool = default;
};

// Result of a completed draw session. Measurements are raw numbers; only the
// ones meaningful for the geometry are set.
struct drawn_feature_t
{
  std::string id;
  geometry_t geometry;
  std::optional<double> length_ft;
  std::optional<double> length_miles;
  std::optional<double> area_sqft;
  std::optional<double> area_acres;
  std::optional<double> perimeter_ft;
};

// Parse "lat"/"lon" style values coming from loosely typed project records.
// Returns DEFAULT_CENTER when either value is missing or not finite.
auto resolve_project_center(std::optional<double> lat, std::optional<double> lon) -> geo_position_t;

} // namespace site_mapper
