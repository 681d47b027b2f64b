#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace site_mapper
{

// Geographic position in GeoJSON axis order
struct geo_position_t
{
  double lon = 0.0;
  double lat = 0.0;

  auto operator==(const geo_position_t &) const -> bool = default;
};

enum class geometry_type_e
{
  None,
  Point,
  MultiPoint,
  LineString,
  MultiLineString,
  Polygon,
  MultiPolygon
};

using ring_t = std::vector<geo_position_t>;
using polygon_t = std::vector<ring_t>;

// Coordinates are stored as a list of parts, each part a list of rings:
//   Point, MultiPoint, LineString : one part holding one ring
//   MultiLineString               : one part, one ring per line
//   Polygon                       : one part, outer ring then holes
//   MultiPolygon                  : one part per polygon
struct geometry_t
{
  geometry_type_e type = geometry_type_e::None;
  std::vector<polygon_t> parts;

  static auto point(geo_position_t position) -> geometry_t;
  static auto line_string(ring_t vertices) -> geometry_t;
  static auto polygon(polygon_t rings) -> geometry_t;

  auto operator==(const geometry_t &) const -> bool = default;

  auto is_point_like() const -> bool
  {
    return type == geometry_type_e::Point || type == geometry_type_e::MultiPoint;
  }
  auto is_linear() const -> bool
  {
    return type == geometry_type_e::LineString || type == geometry_type_e::MultiLineString;
  }
  auto is_polygonal() const -> bool
  {
    return type == geometry_type_e::Polygon || type == geometry_type_e::MultiPolygon;
  }
};

struct feature_t
{
  std::string id; // Empty when the source feature has no id
  geometry_t geometry;
  nlohmann::json properties = nlohmann::json::object();
};

struct feature_collection_t
{
  std::vector<feature_t> features;

  auto empty() const -> bool
  {
    return features.empty();
  }
  auto size() const -> size_t
  {
    return features.size();
  }
};

// Snapshots handed to the map core are immutable and compared by pointer
using feature_collection_ptr = std::shared_ptr<const feature_collection_t>;

auto make_collection(std::vector<feature_t> features) -> feature_collection_ptr;

// True for a null pointer or a collection without features
auto is_empty(const feature_collection_ptr &collection) -> bool;

namespace geojson
{

auto geometry_type_name(geometry_type_e type) -> const char *;

auto parse_geometry(const nlohmann::json &j, geometry_t &out) -> bool;
auto parse_feature(const nlohmann::json &j, feature_t &out) -> bool;

// Accepts a FeatureCollection, a single Feature or a bare geometry.
// Features that fail to parse are skipped.
auto parse_collection(const nlohmann::json &j) -> feature_collection_t;

auto load_collection(const std::string &filename, feature_collection_t &out) -> bool;

auto to_json(const geometry_t &geometry) -> nlohmann::json;
auto to_json(const feature_t &feature) -> nlohmann::json;
auto to_json(const feature_collection_t &collection) -> nlohmann::json;

// Property access tolerant of the loose typing of upstream datasets.
// Strings are returned trimmed, numbers are printed, anything else is empty.
auto property_string(const nlohmann::json &properties, const std::string &key) -> std::string;

// Numbers, or strings holding a number. Non-finite values are rejected.
auto property_number(const nlohmann::json &properties, const std::string &key) -> std::optional<double>;

// First non-empty value among the given keys
auto first_property_string(const nlohmann::json &properties, std::initializer_list<const char *> keys) -> std::string;

} // namespace geojson
} // namespace site_mapper
