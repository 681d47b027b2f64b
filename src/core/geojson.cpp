#include "core/geojson.hpp"
#include <cmath>
#include <format>
#include <fstream>
#include <iostream>

using json = nlohmann::json;

namespace site_mapper
{

auto geometry_t::point(geo_position_t position) -> geometry_t
{
  geometry_t g;
  g.type = geometry_type_e::Point;
  g.parts = {{{position}}};
  return g;
}

auto geometry_t::line_string(ring_t vertices) -> geometry_t
{
  geometry_t g;
  g.type = geometry_type_e::LineString;
  g.parts = {{std::move(vertices)}};
  return g;
}

auto geometry_t::polygon(polygon_t rings) -> geometry_t
{
  geometry_t g;
  g.type = geometry_type_e::Polygon;
  g.parts = {std::move(rings)};
  return g;
}

auto make_collection(std::vector<feature_t> features) -> feature_collection_ptr
{
  auto collection = std::make_shared<feature_collection_t>();
  collection->features = std::move(features);
  return collection;
}

auto is_empty(const feature_collection_ptr &collection) -> bool
{
  return !collection || collection->empty();
}

namespace geojson
{

namespace
{

auto parse_position(const json &j, geo_position_t &out) -> bool
{
  if (!j.is_array() || j.size() < 2 || !j[0].is_number() || !j[1].is_number())
    return false;

  out.lon = j[0].get<double>();
  out.lat = j[1].get<double>();
  return true;
}

auto parse_ring(const json &j, ring_t &out) -> bool
{
  if (!j.is_array())
    return false;

  out.clear();
  out.reserve(j.size());
  for (const auto &item : j)
  {
    geo_position_t p;
    if (!parse_position(item, p))
      return false;
    out.push_back(p);
  }
  return true;
}

auto parse_polygon(const json &j, polygon_t &out) -> bool
{
  if (!j.is_array())
    return false;

  out.clear();
  for (const auto &item : j)
  {
    ring_t ring;
    if (!parse_ring(item, ring))
      return false;
    out.push_back(std::move(ring));
  }
  return true;
}

auto position_to_json(const geo_position_t &p) -> json
{
  return json::array({p.lon, p.lat});
}

auto ring_to_json(const ring_t &ring) -> json
{
  json out = json::array();
  for (const auto &p : ring)
    out.push_back(position_to_json(p));
  return out;
}

auto polygon_to_json(const polygon_t &polygon) -> json
{
  json out = json::array();
  for (const auto &ring : polygon)
    out.push_back(ring_to_json(ring));
  return out;
}

auto trim(const std::string &value) -> std::string
{
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos)
    return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

auto number_to_string(const json &value) -> std::string
{
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  if (value.is_number_unsigned())
    return std::to_string(value.get<uint64_t>());

  double d = value.get<double>();
  if (std::isfinite(d) && d == std::floor(d) && std::abs(d) < 1e15)
    return std::format("{}", static_cast<int64_t>(d));
  return std::format("{}", d);
}

} // namespace

auto geometry_type_name(geometry_type_e type) -> const char *
{
  switch (type)
  {
  case geometry_type_e::Point:
    return "Point";
  case geometry_type_e::MultiPoint:
    return "MultiPoint";
  case geometry_type_e::LineString:
    return "LineString";
  case geometry_type_e::MultiLineString:
    return "MultiLineString";
  case geometry_type_e::Polygon:
    return "Polygon";
  case geometry_type_e::MultiPolygon:
    return "MultiPolygon";
  case geometry_type_e::None:
    break;
  }
  return "None";
}

auto parse_geometry(const json &j, geometry_t &out) -> bool
{
  out = geometry_t{};
  if (!j.is_object() || !j.contains("type") || !j["type"].is_string() || !j.contains("coordinates"))
    return false;

  const auto type = j["type"].get<std::string>();
  const auto &coords = j["coordinates"];

  if (type == "Point")
  {
    geo_position_t p;
    if (!parse_position(coords, p))
      return false;
    out = geometry_t::point(p);
    return true;
  }

  if (type == "MultiPoint" || type == "LineString")
  {
    ring_t ring;
    if (!parse_ring(coords, ring))
      return false;
    out.type = type == "MultiPoint" ? geometry_type_e::MultiPoint : geometry_type_e::LineString;
    out.parts = {{std::move(ring)}};
    return true;
  }

  if (type == "MultiLineString" || type == "Polygon")
  {
    polygon_t rings;
    if (!parse_polygon(coords, rings))
      return false;
    out.type = type == "Polygon" ? geometry_type_e::Polygon : geometry_type_e::MultiLineString;
    out.parts = {std::move(rings)};
    return true;
  }

  if (type == "MultiPolygon")
  {
    if (!coords.is_array())
      return false;
    out.type = geometry_type_e::MultiPolygon;
    for (const auto &item : coords)
    {
      polygon_t polygon;
      if (!parse_polygon(item, polygon))
      {
        out = geometry_t{};
        return false;
      }
      out.parts.push_back(std::move(polygon));
    }
    return true;
  }

  return false;
}

auto parse_feature(const json &j, feature_t &out) -> bool
{
  out = feature_t{};
  if (!j.is_object() || j.value("type", "") != "Feature")
    return false;

  if (!j.contains("geometry") || !parse_geometry(j["geometry"], out.geometry))
    return false;

  if (j.contains("properties") && j["properties"].is_object())
    out.properties = j["properties"];

  if (j.contains("id"))
  {
    const auto &id = j["id"];
    if (id.is_string())
      out.id = id.get<std::string>();
    else if (id.is_number())
      out.id = number_to_string(id);
  }

  return true;
}

auto parse_collection(const json &j) -> feature_collection_t
{
  feature_collection_t result;
  if (!j.is_object())
    return result;

  const auto type = j.value("type", "");
  if (type == "FeatureCollection")
  {
    if (!j.contains("features") || !j["features"].is_array())
      return result;

    size_t skipped = 0;
    for (const auto &item : j["features"])
    {
      feature_t feature;
      if (parse_feature(item, feature))
        result.features.push_back(std::move(feature));
      else
        skipped++;
    }
    if (skipped > 0)
      std::cerr << "GeoJSON: skipped " << skipped << " malformed features" << std::endl;
    return result;
  }

  feature_t feature;
  if (type == "Feature")
  {
    if (parse_feature(j, feature))
      result.features.push_back(std::move(feature));
    return result;
  }

  if (parse_geometry(j, feature.geometry))
    result.features.push_back(std::move(feature));
  return result;
}

auto load_collection(const std::string &filename, feature_collection_t &out) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "GeoJSON: failed to open " << filename << std::endl;
    return false;
  }

  json j;
  try
  {
    file >> j;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "GeoJSON: parse error in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  out = parse_collection(j);
  std::cout << "Loaded " << out.size() << " features from " << filename << std::endl;
  return true;
}

auto to_json(const geometry_t &geometry) -> json
{
  json j;
  j["type"] = geometry_type_name(geometry.type);

  auto first_ring = [&]() -> ring_t
  {
    if (geometry.parts.empty() || geometry.parts.front().empty())
      return {};
    return geometry.parts.front().front();
  };

  switch (geometry.type)
  {
  case geometry_type_e::Point:
  {
    auto ring = first_ring();
    j["coordinates"] = ring.empty() ? json::array() : position_to_json(ring.front());
    break;
  }
  case geometry_type_e::MultiPoint:
  case geometry_type_e::LineString:
    j["coordinates"] = ring_to_json(first_ring());
    break;
  case geometry_type_e::MultiLineString:
  case geometry_type_e::Polygon:
    j["coordinates"] = geometry.parts.empty() ? json::array() : polygon_to_json(geometry.parts.front());
    break;
  case geometry_type_e::MultiPolygon:
  {
    json polygons = json::array();
    for (const auto &polygon : geometry.parts)
      polygons.push_back(polygon_to_json(polygon));
    j["coordinates"] = polygons;
    break;
  }
  case geometry_type_e::None:
    return nullptr;
  }
  return j;
}

auto to_json(const feature_t &feature) -> json
{
  json j = {{"type", "Feature"}, {"geometry", to_json(feature.geometry)}, {"properties", feature.properties}};
  if (!feature.id.empty())
    j["id"] = feature.id;
  return j;
}

auto to_json(const feature_collection_t &collection) -> json
{
  json features = json::array();
  for (const auto &feature : collection.features)
    features.push_back(to_json(feature));
  return {{"type", "FeatureCollection"}, {"features", features}};
}

auto property_string(const json &properties, const std::string &key) -> std::string
{
  if (!properties.is_object())
    return {};

  auto it = properties.find(key);
  if (it == properties.end())
    return {};

  if (it->is_string())
    return trim(it->get<std::string>());
  if (it->is_number())
    return number_to_string(*it);
  return {};
}

auto property_number(const json &properties, const std::string &key) -> std::optional<double>
{
  if (!properties.is_object())
    return std::nullopt;

  auto it = properties.find(key);
  if (it == properties.end())
    return std::nullopt;

  double value = 0.0;
  if (it->is_number())
  {
    value = it->get<double>();
  }
  else if (it->is_string())
  {
    try
    {
      size_t consumed = 0;
      auto text = trim(it->get<std::string>());
      value = std::stod(text, &consumed);
      if (consumed != text.size())
        return std::nullopt;
    }
    catch (const std::exception &)
    {
      return std::nullopt;
    }
  }
  else
  {
    return std::nullopt;
  }

  if (!std::isfinite(value))
    return std::nullopt;
  return value;
}

auto first_property_string(const json &properties, std::initializer_list<const char *> keys) -> std::string
{
  for (const auto *key : keys)
  {
    auto value = property_string(properties, key);
    if (!value.empty())
      return value;
  }
  return {};
}

} // namespace geojson
} // namespace site_mapper
