#include "../map/marker_manager.hpp"
#include "../renderer/retained_surface.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace site_mapper;

namespace
{
auto comp(const std::string &name, geometry_t geometry, const std::string &color = "") -> feature_t
{
  feature_t feature;
  feature.id = name;
  feature.geometry = std::move(geometry);
  feature.properties = {{"name", name}};
  if (!color.empty())
    feature.properties["color"] = color;
  return feature;
}

auto square(double lon, double lat, double size) -> geometry_t
{
  return geometry_t::polygon({{{lon, lat}, {lon + size, lat}, {lon + size, lat + size}, {lon, lat + size}, {lon, lat}}});
}

auto sale_comps() -> feature_collection_ptr
{
  auto flat = geometry_t::polygon({{{0.0, 0.01}, {0.001, 0.01}, {0.002, 0.01}, {0.0, 0.01}}});
  return make_collection({comp("Point Comp", geometry_t::point({-0.004, 0.002})),
                          comp("Lot Comp", square(-0.002, 0.002, 0.001), "#00FF00"),
                          comp("Flat Comp", flat),
                          comp("Road", geometry_t::line_string({{0.0, 0.0}, {0.001, 0.001}}))});
}

auto count_style(const retained_surface_t &surface, marker_style_e style) -> size_t
{
  size_t n = 0;
  for (const auto &marker : surface.markers())
  {
    if (marker.spec.style == style)
      n++;
  }
  return n;
}
} // namespace

void test_sync_replaces()
{
  std::cout << "Testing marker sync..." << std::endl;
  retained_surface_t surface(viewport_t{{0.0, 0.0}, 16.0, "satellite"});
  surface.update();
  marker_manager_t markers;

  // Nothing to place on before attach
  assert(markers.sync_sale_comps(sale_comps(), true) == 0);

  markers.attach(&surface);
  auto placed = markers.sync_sale_comps(sale_comps(), true);
  std::cout << "  Placed " << placed << " sale comp markers" << std::endl;
  assert(placed == 2);
  assert(surface.markers().size() == 2);

  for (int i = 0; i < 3; ++i)
    assert(markers.sync_sale_comps(sale_comps(), true) == 2);
  assert(surface.markers().size() == 2);
  assert(markers.count(marker_domains::SALE_COMPS) == 2);

  // Colors come from the feature when it carries one
  const auto list = surface.markers();
  assert(list[0].spec.color == palette::SALE_COMPS);
  assert(list[0].spec.popup.title == "Sale Comp: Point Comp");
  assert(list[1].spec.color == (color_t{0.0f, 1.0f, 0.0f}));
  assert(std::abs(list[1].spec.position.lon + 0.0015) < 1e-9);
  assert(std::abs(list[1].spec.position.lat - 0.0025) < 1e-9);

  assert(markers.sync_sale_comps(sale_comps(), false) == 0);
  assert(surface.markers().empty());
  assert(markers.sync_sale_comps(nullptr, true) == 0);
}

void test_domains_are_independent()
{
  std::cout << "Testing marker domains..." << std::endl;
  retained_surface_t surface(viewport_t{{0.0, 0.0}, 16.0, "satellite"});
  surface.update();
  marker_manager_t markers;
  markers.attach(&surface);

  auto rent = make_collection({comp("The Vue", geometry_t::point({0.004, -0.002}))});
  markers.sync_sale_comps(sale_comps(), true);
  assert(markers.sync_rent_comps(rent, true) == 1);
  markers.sync_subject({0.0, 0.0});
  markers.sync_subject({0.001, 0.001});
  assert(surface.markers().size() == 4);
  assert(count_style(surface, marker_style_e::Subject) == 1);

  for (const auto &marker : surface.markers())
  {
    if (marker.spec.style != marker_style_e::Subject)
      continue;
    assert(marker.spec.position == (geo_position_t{0.001, 0.001}));
    assert(marker.spec.popup.title == "Subject Property");
  }

  markers.clear(marker_domains::SALE_COMPS);
  assert(surface.markers().size() == 2);
  assert(markers.count(marker_domains::RENT_COMPS) == 1);

  // Markers are not part of the style
  surface.set_style("streets");
  assert(surface.markers().size() == 2);
}

void test_marker_click()
{
  std::cout << "Testing marker popups..." << std::endl;
  retained_surface_t surface(viewport_t{{0.0, 0.0}, 16.0, "satellite"});
  surface.update();
  marker_manager_t markers;
  markers.attach(&surface);

  int map_clicks = 0;
  surface.on(map_event_e::Click, [&](const map_event_t &) { map_clicks++; });

  auto rent = make_collection({comp("The Vue", geometry_t::point({0.004, -0.002}))});
  markers.sync_rent_comps(rent, true);
  surface.click({0.004, -0.002});
  assert(surface.markers().front().popup_open);
  assert(map_clicks == 0);

  surface.click({0.004, -0.002});
  assert(!surface.markers().front().popup_open);
}

void test_clear_all()
{
  std::cout << "Testing teardown..." << std::endl;
  retained_surface_t surface(viewport_t{{0.0, 0.0}, 16.0, "satellite"});
  surface.update();
  {
    marker_manager_t markers;
    markers.attach(&surface);
    markers.sync_sale_comps(sale_comps(), true);
    markers.sync_subject({0.0, 0.0});
    markers.clear_all();
    markers.clear_all();
    assert(surface.markers().empty());

    markers.sync_subject({0.0, 0.0});
    assert(surface.markers().size() == 1);
  }
  // The destructor removes what is left
  assert(surface.markers().empty());
}

int main()
{
  test_sync_replaces();
  test_domains_are_independent();
  test_marker_click();
  test_clear_all();
  std::cout << "Marker Manager Verification Passed" << std::endl;
  return 0;
}
