#include "../core/geojson.hpp"
#include "../core/geometry_ops.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace site_mapper;
using json = nlohmann::json;

namespace
{
auto square(double lon, double lat, double size) -> geometry_t
{
  return geometry_t::polygon({{{lon, lat}, {lon + size, lat}, {lon + size, lat + size}, {lon, lat + size}, {lon, lat}}});
}
} // namespace

void test_geojson_parsing()
{
  std::cout << "Testing GeoJSON parsing..." << std::endl;
  json j = json::parse(R"({
    "type": "FeatureCollection",
    "features": [
      {"type": "Feature", "id": 42, "properties": {"APN": "12-345-678"},
       "geometry": {"type": "Polygon", "coordinates": [[[0,0],[1,0],[1,1],[0,1],[0,0]]]}},
      {"type": "Feature", "id": "p-1", "properties": null,
       "geometry": {"type": "MultiPoint", "coordinates": [[5,6],[7,8]]}},
      {"type": "Feature", "properties": {}, "geometry": {"type": "Point", "coordinates": ["x", 1]}},
      {"type": "Feature", "geometry": {"type": "MultiPolygon",
       "coordinates": [[[[0,0],[1,0],[1,1],[0,0]]], [[[2,2],[3,2],[3,3],[2,2]]]]}}
    ]
  })");

  auto collection = geojson::parse_collection(j);
  // The malformed point is skipped
  assert(collection.size() == 3);
  assert(collection.features[0].id == "42");
  assert(collection.features[0].geometry.type == geometry_type_e::Polygon);
  assert(geojson::property_string(collection.features[0].properties, "APN") == "12-345-678");
  assert(collection.features[1].id == "p-1");
  assert(collection.features[1].properties.is_object() && collection.features[1].properties.empty());
  assert(collection.features[2].id.empty());
  assert(collection.features[2].geometry.parts.size() == 2);

  // A bare geometry is a one-feature collection
  auto bare = geojson::parse_collection(json::parse(R"({"type": "Point", "coordinates": [1.5, 2.5]})"));
  assert(bare.size() == 1 && bare.features[0].geometry.is_point_like());

  auto round = geojson::parse_collection(geojson::to_json(collection));
  assert(round.size() == collection.size());
  assert(round.features[0].geometry == collection.features[0].geometry);
}

void test_property_access()
{
  std::cout << "Testing loose property access..." << std::endl;
  json props = {{"name", "  Mesa Vista "}, {"units", 240}, {"price", "1250000"}, {"bad", "12abc"}, {"ratio", 0.5}, {"flag", true}};
  assert(geojson::property_string(props, "name") == "Mesa Vista");
  assert(geojson::property_string(props, "units") == "240");
  assert(geojson::property_string(props, "flag").empty());
  assert(geojson::property_string(props, "missing").empty());
  assert(geojson::property_number(props, "price") == 1250000.0);
  assert(!geojson::property_number(props, "bad"));
  assert(geojson::property_number(props, "ratio") == 0.5);
  assert(geojson::first_property_string(props, {"missing", "name"}) == "Mesa Vista");
  assert(geojson::property_string(json::array(), "name").empty());
}

void test_anchor_points()
{
  std::cout << "Testing marker anchors..." << std::endl;
  auto point = geometry_ops::anchor_point(geometry_t::point({-111.5, 33.2}));
  assert(point && point->lon == -111.5 && point->lat == 33.2);

  geometry_t multi;
  multi.type = geometry_type_e::MultiPoint;
  multi.parts = {{{{3.0, 4.0}, {5.0, 6.0}}}};
  auto first = geometry_ops::anchor_point(multi);
  assert(first && first->lon == 3.0 && first->lat == 4.0);

  auto centroid = geometry_ops::anchor_point(square(10.0, 20.0, 2.0));
  assert(centroid);
  std::cout << "  Square centroid: " << centroid->lon << ", " << centroid->lat << std::endl;
  assert(std::abs(centroid->lon - 11.0) < 1e-9 && std::abs(centroid->lat - 21.0) < 1e-9);

  // Lines have no anchor
  assert(!geometry_ops::anchor_point(geometry_t::line_string({{0.0, 0.0}, {1.0, 1.0}})));
}

void test_degenerate_polygons()
{
  std::cout << "Testing degenerate polygons..." << std::endl;
  // Collinear, zero area
  auto flat = geometry_t::polygon({{{0.0, 0.0}, {1.0, 0.0}, {2.0, 0.0}, {0.0, 0.0}}});
  assert(!geometry_ops::polygon_centroid(flat));

  // Too few vertices
  auto sliver = geometry_t::polygon({{{0.0, 0.0}, {1.0, 1.0}, {0.0, 0.0}}});
  assert(!geometry_ops::polygon_centroid(sliver));

  // Bow tie
  auto bow_tie = geometry_t::polygon({{{0.0, 0.0}, {1.0, 1.0}, {1.0, 0.0}, {0.0, 1.0}, {0.0, 0.0}}});
  assert(!geometry_ops::is_simple_ring(bow_tie.parts.front().front()));
  assert(!geometry_ops::polygon_centroid(bow_tie));

  auto broken = square(0.0, 0.0, 1.0);
  broken.parts.front().front()[1].lat = std::numeric_limits<double>::quiet_NaN();
  assert(!geometry_ops::is_finite(broken));
  assert(!geometry_ops::anchor_point(broken));
}

void test_hit_tests()
{
  std::cout << "Testing point in polygon with holes..." << std::endl;
  polygon_t donut = {{{0.0, 0.0}, {4.0, 0.0}, {4.0, 4.0}, {0.0, 4.0}, {0.0, 0.0}}, {{1.0, 1.0}, {3.0, 1.0}, {3.0, 3.0}, {1.0, 3.0}, {1.0, 1.0}}};
  assert(geometry_ops::point_in_polygon({0.5, 0.5}, donut));
  assert(!geometry_ops::point_in_polygon({2.0, 2.0}, donut));
  assert(!geometry_ops::point_in_polygon({5.0, 2.0}, donut));

  ring_t line = {{0.0, 0.0}, {10.0, 0.0}};
  assert(std::abs(geometry_ops::distance_to_polyline({5.0, 2.0}, line) - 2.0) < 1e-12);
  assert(std::abs(geometry_ops::distance_to_polyline({13.0, 4.0}, line) - 5.0) < 1e-12);
}

void test_measurements()
{
  std::cout << "Testing geodesic measurements..." << std::endl;
  // One degree of longitude on the equator
  double length = geometry_ops::line_length_m({{0.0, 0.0}, {1.0, 0.0}});
  std::cout << "  1 deg equator: " << length << " m" << std::endl;
  assert(std::abs(length - 111195.0) < 5.0);

  // About 0.001 deg square near the equator, roughly 111 m on a side
  double area = geometry_ops::ring_area_m2(square(0.0, 0.0, 0.001).parts.front().front());
  std::cout << "  Small square: " << area << " m2" << std::endl;
  assert(std::abs(area - 12364.0) < 50.0);

  assert(geometry_ops::ring_area_m2({{0.0, 0.0}, {1.0, 1.0}}) == 0.0);
}

int main()
{
  test_geojson_parsing();
  test_property_access();
  test_anchor_points();
  test_degenerate_polygons();
  test_hit_tests();
  test_measurements();
  std::cout << "Geometry Ops Verification Passed" << std::endl;
  return 0;
}
