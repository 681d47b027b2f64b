#include "../core/geometry_classifier.hpp"
#include "../map/draw_session.hpp"
#include "../map/interaction_router.hpp"
#include "../map/layer_reconciler.hpp"
#include "../map/map_domains.hpp"
#include "../renderer/retained_surface.hpp"
#include <cassert>
#include <iostream>

using namespace site_mapper;

namespace
{
auto square(const std::string &id, double lon, double lat, double size) -> feature_t
{
  feature_t feature;
  feature.id = id;
  feature.geometry = geometry_t::polygon({{{lon, lat}, {lon + size, lat}, {lon + size, lat + size}, {lon, lat + size}, {lon, lat}}});
  return feature;
}

auto tax_parcel(const std::string &id, const std::string &parcel_id, double lon) -> feature_t
{
  auto feature = square(id, lon, 0.0, 0.001);
  feature.properties = {{"parcel_id", parcel_id}};
  return feature;
}

struct fixture_t
{
  retained_surface_t surface;
  interaction_router_t router;
  layer_reconciler_t reconciler{router};

  explicit fixture_t(double zoom = 16.0) : surface(viewport_t{{0.0, 0.0}, zoom, "satellite"})
  {
    surface.update();
    router.attach(&surface);
  }

  auto render_tax_parcels() -> void
  {
    auto parcels = make_collection({tax_parcel("t1", "P1", 0.0), tax_parcel("t2", "P2", 0.001)});
    auto result = reconciler.reconcile(&surface, domains::tax_parcels(parcels, {}, DEFAULT_PARCEL_MIN_ZOOM), true);
    assert(result == reconcile_result_e::Rendered);
  }
};

const geo_position_t IN_T1 = {0.0005, 0.0005};
const geo_position_t IN_T2 = {0.0015, 0.0005};
const geo_position_t EMPTY = {0.05, 0.05};
} // namespace

void test_hover_slot()
{
  std::cout << "Testing hover feature-state..." << std::endl;
  fixture_t f;
  f.render_tax_parcels();
  assert(f.surface.cursor() == cursor_e::Default);

  f.surface.pointer_move(IN_T1);
  assert(f.surface.cursor() == cursor_e::Pointer);
  assert(f.router.hovered_feature("tax-parcels-fill") == "t1");
  assert(f.surface.feature_state("tax-parcels-src", "t1", "hover"));

  // Moving across the shared edge hands the slot over
  f.surface.pointer_move(IN_T2);
  assert(f.router.hovered_feature("tax-parcels-fill") == "t2");
  assert(!f.surface.feature_state("tax-parcels-src", "t1", "hover"));
  assert(f.surface.feature_state("tax-parcels-src", "t2", "hover"));
  assert(f.surface.cursor() == cursor_e::Pointer);

  f.surface.pointer_move(EMPTY);
  assert(!f.router.hovered_feature("tax-parcels-fill"));
  assert(!f.surface.feature_state("tax-parcels-src", "t2", "hover"));
  assert(f.surface.cursor() == cursor_e::Default);

  // Re-rendering under the pointer releases the slot with the binding
  f.surface.pointer_move(IN_T1);
  f.render_tax_parcels();
  assert(!f.router.hovered_feature("tax-parcels-fill"));
  assert(f.surface.cursor() == cursor_e::Default);
}

void test_parcel_click()
{
  std::cout << "Testing parcel click routing..." << std::endl;
  fixture_t f;
  f.render_tax_parcels();

  std::vector<std::string> toggled;
  int map_clicks = 0;
  map_callbacks_t callbacks;
  callbacks.on_parcel_toggle = [&](const feature_t &feature) { toggled.push_back(popups::tax_parcel_id(feature)); };
  callbacks.on_map_click = [&](geo_position_t) { map_clicks++; };
  f.router.set_callbacks(callbacks);

  f.surface.click(IN_T1);
  assert(toggled.size() == 1 && toggled[0] == "P1");
  assert(map_clicks == 0);
  auto popup = f.surface.popup();
  assert(popup && popup->content.title == "Parcel P1");

  f.surface.click(EMPTY);
  assert(map_clicks == 1);
  assert(!f.surface.popup());
  assert(toggled.size() == 1);
}

void test_callbacks_read_at_event_time()
{
  std::cout << "Testing callback replacement without rebinding..." << std::endl;
  fixture_t f;
  f.render_tax_parcels();
  auto listeners = f.surface.listener_count();

  int first = 0;
  int second = 0;
  map_callbacks_t callbacks;
  callbacks.on_parcel_toggle = [&](const feature_t &) { first++; };
  f.router.set_callbacks(callbacks);
  f.surface.click(IN_T2);

  callbacks.on_parcel_toggle = [&](const feature_t &) { second++; };
  f.router.set_callbacks(callbacks);
  f.surface.click(IN_T2);

  assert(first == 1 && second == 1);
  assert(f.surface.listener_count() == listeners);
}

void test_min_zoom()
{
  std::cout << "Testing parcels below their minimum zoom..." << std::endl;
  fixture_t f(13.0);
  f.render_tax_parcels();

  int toggles = 0;
  int map_clicks = 0;
  map_callbacks_t callbacks;
  callbacks.on_parcel_toggle = [&](const feature_t &) { toggles++; };
  callbacks.on_map_click = [&](geo_position_t) { map_clicks++; };
  f.router.set_callbacks(callbacks);

  f.surface.click(IN_T1);
  assert(toggles == 0 && map_clicks == 1);
}

void test_draw_tool_routing()
{
  std::cout << "Testing clicks under a draw tool..." << std::endl;
  fixture_t f;
  f.render_tax_parcels();

  draw_session_t draw;
  f.router.set_draw_session(&draw);

  int toggles = 0;
  int map_clicks = 0;
  map_callbacks_t callbacks;
  callbacks.on_parcel_toggle = [&](const feature_t &) { toggles++; };
  callbacks.on_map_click = [&](geo_position_t) { map_clicks++; };
  f.router.set_callbacks(callbacks);

  draw.begin(active_tool_e::Line);
  f.router.set_active_tool(active_tool_e::Line);
  assert(f.surface.cursor() == cursor_e::Crosshair);

  f.surface.click(IN_T1);
  f.surface.click(EMPTY);
  assert(draw.get_vertices().size() == 2);
  assert(toggles == 0 && map_clicks == 0);
  assert(!f.surface.popup());

  // Hovering keeps the tool cursor
  f.surface.pointer_move(IN_T2);
  assert(f.surface.cursor() == cursor_e::Crosshair);
  f.surface.pointer_leave();
  assert(f.surface.cursor() == cursor_e::Crosshair);

  f.router.set_active_tool(active_tool_e::None);
  assert(f.surface.cursor() == cursor_e::Default);
}

void test_ring_click()
{
  std::cout << "Testing ring clicks..." << std::endl;
  fixture_t f;
  f.reconciler.reconcile(&f.surface, domains::demographic_rings(generate_rings({0.0, 0.0}, {1.0}, 0.0)), true);

  std::vector<double> rings;
  int map_clicks = 0;
  map_callbacks_t callbacks;
  callbacks.on_ring_click = [&](double radius, geo_position_t) { rings.push_back(radius); };
  callbacks.on_map_click = [&](geo_position_t) { map_clicks++; };
  f.router.set_callbacks(callbacks);

  const geo_position_t inside = {0.005, 0.005};
  f.surface.click(inside);
  assert(rings.size() == 1 && rings[0] == 1.0);
  assert(map_clicks == 0);

  // Any active tool turns ring clicks into map clicks
  f.router.set_active_tool(active_tool_e::Edit);
  f.surface.click(inside);
  assert(rings.size() == 1);
  assert(map_clicks == 1);
}

void test_feature_click()
{
  std::cout << "Testing annotation clicks..." << std::endl;
  fixture_t f;

  std::vector<map_feature_t> annotations = {{"feature-1", square("", 0.003, 0.0, 0.001).geometry, "Pad", "site"}};
  f.router.set_annotations(annotations);
  f.reconciler.reconcile(&f.surface, domains::annotations(annotations, ""), true);

  std::vector<std::string> clicked;
  map_callbacks_t callbacks;
  callbacks.on_feature_click = [&](const map_feature_t &feature) { clicked.push_back(feature.id + ":" + feature.label); };
  f.router.set_callbacks(callbacks);

  const geo_position_t inside = {0.0035, 0.0005};
  f.surface.click(inside);
  assert(clicked.size() == 1 && clicked[0] == "feature-1:Pad");

  // The delete tool still reports clicks; the host removes the feature
  f.router.set_active_tool(active_tool_e::Delete);
  f.surface.click(inside);
  assert(clicked.size() == 2);

  f.router.set_active_tool(active_tool_e::Point);
  f.surface.click(inside);
  assert(clicked.size() == 2);

  // Unknown ids are ignored
  f.router.set_active_tool(active_tool_e::None);
  f.router.set_annotations({});
  f.surface.click(inside);
  assert(clicked.size() == 2);
}

void test_reference_parcel_click()
{
  std::cout << "Testing reference parcel clicks by dataset identifier..." << std::endl;
  fixture_t f;

  // No feature ids: the parcel number only lives in the dataset fields
  auto subject = square("", 0.0, 0.0, 0.001);
  subject.properties = {{"AIN", "5555-001-002"}, {"SitusFullAddress", "100 Main St, Los Angeles CA 90012"}};
  auto comp = square("", 0.001, 0.0, 0.001);
  comp.properties = {{"apn", "7777-002-003"}};
  auto unnumbered = square("", 0.002, 0.0, 0.001);
  unnumbered.properties = {{"UseDescription", "Vacant"}};

  auto buckets = classify_parcels(*make_collection({subject, comp, unnumbered}), "5555001002", {"7777 002 003"});
  assert(buckets.subject.size() == 1 && buckets.comp.size() == 1 && buckets.other.size() == 1);
  auto result = f.reconciler.reconcile(&f.surface, domains::reference_parcels(buckets, DEFAULT_PARCEL_MIN_ZOOM), true);
  assert(result == reconcile_result_e::Rendered);

  std::vector<std::string> toggled;
  int map_clicks = 0;
  map_callbacks_t callbacks;
  callbacks.on_parcel_toggle = [&](const feature_t &feature) { toggled.push_back(feature.id); };
  callbacks.on_map_click = [&](geo_position_t) { map_clicks++; };
  f.router.set_callbacks(callbacks);

  f.surface.click({0.0005, 0.0005});
  assert(toggled.size() == 1 && toggled[0] == "5555-001-002");
  auto popup = f.surface.popup();
  assert(popup && popup->content.title == "Parcel");
  assert(popup->content.rows.size() == 1 && popup->content.rows[0].label == "AIN");
  assert(popup->content.rows[0].value == "5555-001-002");

  // Lowercase field names resolve the same way
  f.surface.click({0.0015, 0.0005});
  assert(toggled.size() == 2 && toggled[1] == "7777-002-003");

  // Nothing to toggle, but the popup still opens and the click stays absorbed
  f.surface.close_popup();
  f.surface.click({0.0025, 0.0005});
  assert(toggled.size() == 2);
  popup = f.surface.popup();
  assert(popup && popup->content.rows.size() == 1 && popup->content.rows[0].value == "Vacant");
  assert(map_clicks == 0);

  // Configured fields replace the defaults
  result = f.reconciler.reconcile(&f.surface, domains::reference_parcels(buckets, DEFAULT_PARCEL_MIN_ZOOM, {"SitusFullAddress"}), true);
  assert(result == reconcile_result_e::Rendered);
  f.surface.click({0.0005, 0.0005});
  assert(toggled.size() == 3 && toggled[2] == "100 Main St, Los Angeles CA 90012");
}

void test_popups_under_draw_tool()
{
  std::cout << "Testing popup layers under a draw tool..." << std::endl;
  fixture_t f;

  auto comp = square("s1", 0.0, 0.0, 0.001);
  comp.properties = {{"name", "Mesa Lots"}};
  auto result = f.reconciler.reconcile(&f.surface, domains::sale_comps(make_collection({comp})), true);
  assert(result == reconcile_result_e::Rendered);

  draw_session_t draw;
  f.router.set_draw_session(&draw);
  draw.begin(active_tool_e::Polygon);
  f.router.set_active_tool(active_tool_e::Polygon);

  f.surface.click(IN_T1);
  assert(!f.surface.popup());
  assert(draw.get_vertices().size() == 1);

  f.router.set_active_tool(active_tool_e::None);
  f.surface.click(IN_T1);
  auto popup = f.surface.popup();
  assert(popup && popup->content.title == "Sale Comp: Mesa Lots");
}

void test_detach()
{
  std::cout << "Testing detach..." << std::endl;
  fixture_t f;
  auto base = f.surface.listener_count();
  f.render_tax_parcels();
  assert(f.surface.listener_count() > base);

  f.router.detach();
  assert(f.router.bound_layer_count() == 0);
  assert(f.surface.listener_count() == base - 1);
  f.router.detach();
}

int main()
{
  test_hover_slot();
  test_parcel_click();
  test_callbacks_read_at_event_time();
  test_min_zoom();
  test_draw_tool_routing();
  test_ring_click();
  test_feature_click();
  test_reference_parcel_click();
  test_popups_under_draw_tool();
  test_detach();
  std::cout << "Interaction Router Verification Passed" << std::endl;
  return 0;
}
