#include "../map/map_canvas.hpp"
#include "../map/map_domains.hpp"
#include "../renderer/retained_surface.hpp"
#include <algorithm>
#include <cassert>
#include <iostream>

using namespace site_mapper;

namespace
{
auto square(const std::string &id, double lon, double lat, const nlohmann::json &properties = nlohmann::json::object()) -> feature_t
{
  const double size = 0.001;
  feature_t feature;
  feature.id = id;
  feature.geometry = geometry_t::polygon({{{lon, lat}, {lon + size, lat}, {lon + size, lat + size}, {lon, lat + size}, {lon, lat}}});
  feature.properties = properties;
  return feature;
}

auto point(const std::string &id, double lon, double lat, const nlohmann::json &properties) -> feature_t
{
  feature_t feature;
  feature.id = id;
  feature.geometry = geometry_t::point({lon, lat});
  feature.properties = properties;
  return feature;
}

// A project at the origin with a bit of every dataset around it
auto make_props() -> map_canvas_props_t
{
  map_canvas_props_t props;
  props.viewport = {{0.0, 0.0}, 16.0, "satellite"};

  props.plan_parcels = make_collection({square("plan-1", 0.002, 0.002, {{"parcel_id", "A-1"}})});
  props.tax_parcels = make_collection({square("t1", 0.004, 0.0, {{"parcel_id", "P1"}}), square("t2", 0.005, 0.0, {{"parcel_id", "P2"}})});
  props.sale_comps =
      make_collection({square("s1", -0.004, 0.002, {{"name", "Lot"}, {"color", "#00ff00"}}), point("s2", -0.006, 0.002, {{"name", "Corner"}})});
  props.rent_comps = make_collection({point("r1", -0.006, -0.002, {{"name", "The Vue"}})});

  props.parcel_collection = make_collection({square("la-1", 0.002, -0.004, {{"APN", "100-200-300"}}),
                                             square("la-2", 0.003, -0.004, {{"AIN", "5551234"}}),
                                             square("la-3", 0.004, -0.004, {{"apn", "999-999-999"}})});
  props.parcel_subject_id = "100200300";
  props.parcel_comp_ids = {"555-1234"};

  props.features = {{"feature-1", square("", -0.002, -0.004).geometry, "Pad", "site"}};
  props.ring_radii = {1.0, 3.0, 5.0};
  props.selected_ring_radius = 3.0;
  return props;
}

struct fixture_t
{
  retained_surface_t *surface = nullptr;
  map_canvas_t canvas;

  auto factory() -> surface_factory_t
  {
    return [this](const viewport_t &viewport) -> std::unique_ptr<map_surface_t>
    {
      auto created = std::make_unique<retained_surface_t>(viewport);
      surface = created.get();
      return created;
    };
  }
};

const char *ALL_DOMAINS[] = {domain_ids::PLAN_PARCELS, domain_ids::PROJECT_BOUNDARY, domain_ids::TAX_PARCELS, domain_ids::REFERENCE_PARCELS,
                             domain_ids::SALE_COMPS,   domain_ids::RENT_COMPS,       domain_ids::ANNOTATIONS, domain_ids::RINGS};

const geo_position_t FAR_AWAY = {0.2, 0.2};

auto index_of(const std::vector<std::string> &ids, const std::string &id) -> size_t
{
  return static_cast<size_t>(std::find(ids.begin(), ids.end(), id) - ids.begin());
}
} // namespace

void test_mount_and_load()
{
  std::cout << "Testing mount and first load..." << std::endl;
  fixture_t f;
  auto props = make_props();

  int loads = 0;
  props.callbacks.on_viewport_change = [&](const view_state_t &) { loads++; };

  assert(f.canvas.mount(f.factory(), props));
  assert(!f.canvas.mount(f.factory(), props));
  assert(f.canvas.is_mounted());

  // Nothing can be drawn before the style has loaded
  for (const char *domain : ALL_DOMAINS)
    assert(f.canvas.last_result(domain) == reconcile_result_e::NotReady);
  assert(f.surface->layer_ids().empty());
  assert(f.surface->markers().empty());

  f.surface->update();
  assert(loads == 1);
  for (const char *domain : ALL_DOMAINS)
  {
    std::cout << "  " << domain << ": " << reconcile_result_name(*f.canvas.last_result(domain)) << std::endl;
    assert(f.canvas.last_result(domain) == reconcile_result_e::Rendered);
  }
  assert(f.canvas.last_result(domain_ids::DRAW_FEEDBACK) == reconcile_result_e::Cleared);

  assert(f.surface->has_layer("plan-parcels-fill"));
  assert(f.surface->has_layer("project-boundary-point"));
  assert(f.surface->has_layer("tax-parcels-fill") && !f.surface->has_layer("tax-parcels-selected-fill"));
  assert(f.surface->has_layer("la-parcels-subject-fill") && f.surface->has_layer("la-parcels-comps-fill") && f.surface->has_layer("la-parcels-all-fill"));
  assert(f.surface->has_source("rent-comps-src"));
  assert(f.surface->has_layer("ring-5-stroke"));

  const auto &buckets = f.canvas.get_parcel_buckets();
  assert(buckets.subject.size() == 1 && buckets.subject[0].id == "la-1");
  assert(buckets.comp.size() == 1 && buckets.comp[0].id == "la-2");
  assert(buckets.other.size() == 1 && buckets.other[0].id == "la-3");

  const auto &markers = f.canvas.get_markers();
  assert(markers.count(marker_domains::SALE_COMPS) == 2);
  assert(markers.count(marker_domains::RENT_COMPS) == 1);
  assert(markers.count(marker_domains::SUBJECT) == 1);
  assert(f.surface->markers().size() == 4);

  // The selected ring is emphasized
  auto *selected = f.surface->layer("ring-3-fill");
  auto *plain = f.surface->layer("ring-1-fill");
  assert(selected && plain);
  assert(selected->paint.opacity == RING_FILL_OPACITY_SELECTED);
  assert(plain->paint.opacity == RING_FILL_OPACITY);

  // Overlays stay above the rings
  auto order = f.surface->layer_ids();
  assert(index_of(order, "ring-5-stroke") < index_of(order, "user-features-fill"));
  assert(index_of(order, "ring-5-stroke") < index_of(order, "sale-comps-fill"));
}

void test_unchanged_props()
{
  std::cout << "Testing re-render with unchanged props..." << std::endl;
  fixture_t f;
  auto props = make_props();
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  auto added = f.surface->get_stats().layers_added;
  auto listeners = f.surface->listener_count();
  for (int i = 0; i < 3; ++i)
  {
    f.canvas.render(props);
    f.canvas.refresh();
  }
  assert(f.surface->get_stats().layers_added == added);
  assert(f.surface->listener_count() == listeners);
}

void test_basemap_swap()
{
  std::cout << "Testing domain recovery after a basemap swap..." << std::endl;
  fixture_t f;
  auto props = make_props();
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  auto layers = f.surface->layer_ids();
  auto sources = f.surface->source_ids();
  auto listeners = f.surface->listener_count();
  for (const auto &id : layers)
    assert(f.surface->get_stats().layer_adds.at(id) == 1);

  props.viewport.basemap = "streets";
  f.canvas.render(props);
  assert(f.surface->layer_ids().empty());
  assert(f.canvas.get_controller().get_revision() == 0);

  f.surface->update();
  assert(f.canvas.get_controller().get_revision() == 1);
  assert(f.surface->style_id() == "streets");

  // Every domain is back, each layer added exactly once more
  auto restored = f.surface->layer_ids();
  std::sort(layers.begin(), layers.end());
  std::sort(restored.begin(), restored.end());
  assert(restored == layers);
  assert(f.surface->source_ids() == sources);
  for (const auto &id : restored)
    assert(f.surface->get_stats().layer_adds.at(id) == 2);
  assert(f.surface->listener_count() == listeners);

  // Markers are not duplicated
  assert(f.surface->markers().size() == 4);
}

void test_change_during_swap()
{
  std::cout << "Testing changes made while a style loads..." << std::endl;
  fixture_t f;
  auto props = make_props();
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  props.viewport.basemap = "terrain";
  props.layers.set_item_visible(layer_ids::SALE_COMPS, false);
  props.selected_tax_parcel_ids = {"P1"};
  f.canvas.render(props);

  // Stale effects could not run yet and are retried
  assert(f.canvas.last_result(domain_ids::SALE_COMPS) == reconcile_result_e::NotReady);
  assert(f.canvas.last_result(domain_ids::TAX_PARCELS) == reconcile_result_e::NotReady);
  assert(f.canvas.get_markers().count(marker_domains::SALE_COMPS) == 2);

  f.surface->update();
  assert(f.canvas.last_result(domain_ids::SALE_COMPS) == reconcile_result_e::Cleared);
  assert(!f.surface->has_layer("sale-comps-fill"));
  assert(f.canvas.get_markers().count(marker_domains::SALE_COMPS) == 0);

  auto *highlight = f.surface->layer("tax-parcels-selected-fill");
  assert(highlight);
  assert(highlight->filter.property == "parcel_id");
  assert(highlight->filter.values == std::vector<std::string>({"P1"}));
}

void test_visibility_toggles()
{
  std::cout << "Testing layer visibility toggles..." << std::endl;
  fixture_t f;
  auto props = make_props();
  f.canvas.mount(f.factory(), props);
  f.surface->update();
  auto listeners = f.surface->listener_count();
  auto plan_adds = f.surface->get_stats().layer_adds.at("plan-parcels-fill");

  for (int i = 0; i < 4; ++i)
  {
    props.layers.set_item_visible(layer_ids::TAX_PARCELS, false);
    props.layers.set_group_visible("location-intel", false);
    f.canvas.render(props);
    assert(!f.surface->has_layer("tax-parcels-fill") && !f.surface->has_source("tax-parcels-src"));
    assert(!f.surface->has_layer("ring-1-fill"));
    assert(f.canvas.last_result(domain_ids::RINGS) == reconcile_result_e::Cleared);

    props.layers.set_item_visible(layer_ids::TAX_PARCELS, true);
    props.layers.set_group_visible("location-intel", true);
    f.canvas.render(props);
    assert(f.surface->has_layer("tax-parcels-fill"));
    assert(f.surface->has_layer("ring-1-fill"));
  }

  // No listener build-up and untouched domains were left alone
  assert(f.surface->listener_count() == listeners);
  assert(f.surface->get_stats().layer_adds.at("plan-parcels-fill") == plan_adds);
}

void test_callbacks()
{
  std::cout << "Testing host callbacks..." << std::endl;
  fixture_t f;
  auto props = make_props();

  int first_clicks = 0;
  props.callbacks.on_map_click = [&](geo_position_t) { first_clicks++; };
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  f.surface->click(FAR_AWAY);
  assert(first_clicks == 1);

  int second_clicks = 0;
  std::vector<std::string> toggled;
  std::vector<double> rings;
  props.callbacks.on_map_click = [&](geo_position_t) { second_clicks++; };
  props.callbacks.on_parcel_toggle = [&](const feature_t &feature) { toggled.push_back(popups::tax_parcel_id(feature)); };
  props.callbacks.on_ring_click = [&](double radius, geo_position_t) { rings.push_back(radius); };
  f.canvas.render(props);

  f.surface->click(FAR_AWAY);
  assert(first_clicks == 1 && second_clicks == 1);

  // A tax parcel inside every ring: the parcel and each ring report, the map does not
  f.surface->click({0.0045, 0.0005});
  assert(toggled.size() == 1 && toggled[0] == "P1");
  assert(rings.size() == 3);
  assert(second_clicks == 1);
}

void test_draw_flow()
{
  std::cout << "Testing drawing through the canvas..." << std::endl;
  fixture_t f;
  auto props = make_props();

  std::vector<drawn_feature_t> completed;
  props.callbacks.on_draw_complete = [&](const drawn_feature_t &drawn) { completed.push_back(drawn); };
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  props.active_tool = active_tool_e::Line;
  f.canvas.render(props);
  assert(f.surface->cursor() == cursor_e::Crosshair);
  assert(f.canvas.get_draw_session().is_active());

  f.surface->click({0.2, 0.2});
  f.surface->click({0.21, 0.2});
  assert(f.canvas.get_draw_session().get_vertices().size() == 2);

  f.canvas.refresh();
  assert(f.canvas.last_result(domain_ids::DRAW_FEEDBACK) == reconcile_result_e::Rendered);
  assert(f.surface->has_layer("draw-feedback-line") && f.surface->has_layer("draw-feedback-vertex"));

  auto drawn = f.canvas.get_draw_session().finish();
  assert(drawn);
  assert(completed.size() == 1 && completed[0].id == drawn->id);
  assert(completed[0].length_ft && *completed[0].length_ft > 3000.0);

  f.canvas.refresh();
  assert(f.canvas.last_result(domain_ids::DRAW_FEEDBACK) == reconcile_result_e::Cleared);

  props.active_tool = active_tool_e::None;
  f.canvas.render(props);
  assert(!f.canvas.get_draw_session().is_active());
  assert(f.surface->cursor() == cursor_e::Default);
}

void test_unmount()
{
  std::cout << "Testing unmount..." << std::endl;
  fixture_t f;
  auto props = make_props();
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  f.canvas.unmount();
  assert(!f.canvas.is_mounted());
  assert(!f.canvas.surface());
  assert(!f.canvas.last_result(domain_ids::PLAN_PARCELS));
  assert(f.canvas.get_parcel_buckets().total() == 0);
  f.canvas.unmount();

  // Rendering while unmounted only stores the props
  f.canvas.render(props);
  assert(!f.canvas.surface());

  // Remounting builds everything again on a fresh surface
  assert(f.canvas.mount(f.factory(), props));
  f.surface->update();
  assert(f.canvas.last_result(domain_ids::PLAN_PARCELS) == reconcile_result_e::Rendered);
  assert(f.surface->get_stats().layer_adds.at("plan-parcels-fill") == 1);
  assert(f.surface->markers().size() == 4);
}

void test_repeated_ring_radii()
{
  std::cout << "Testing repeated ring radii..." << std::endl;
  fixture_t f;
  auto props = make_props();
  props.ring_radii = {1.0, 3.0, 3.0};
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  assert(f.canvas.last_result(domain_ids::RINGS) == reconcile_result_e::Rendered);
  assert(f.surface->has_layer("ring-1-fill") && f.surface->has_layer("ring-3-fill"));
  assert(!f.surface->has_source("ring-5"));
  assert(f.canvas.last_result(domain_ids::ANNOTATIONS) == reconcile_result_e::Rendered);
}

void test_surface_error_recovery()
{
  std::cout << "Testing recovery from a rejected surface update..." << std::endl;
  fixture_t f;
  auto props = make_props();
  f.canvas.mount(f.factory(), props);
  f.surface->update();

  // A layer outside every domain pins a ring source, so removing it fails
  layer_spec_t foreign;
  foreign.id = "foreign-outline";
  foreign.kind = layer_kind_e::Line;
  foreign.source = "ring-1";
  f.surface->add_layer(foreign);

  props.ring_radii = {1.0, 3.0};
  props.features.push_back({"feature-2", square("", -0.003, -0.004).geometry, "Pad 2", "site"});
  f.canvas.render(props);
  assert(f.canvas.last_result(domain_ids::RINGS) == reconcile_result_e::NotReady);

  // Domains after the failing one still reconcile
  assert(f.canvas.last_result(domain_ids::ANNOTATIONS) == reconcile_result_e::Rendered);
  assert(f.surface->source("user-features")->size() == 2);

  f.surface->remove_layer("foreign-outline");
  f.canvas.refresh();
  assert(f.canvas.last_result(domain_ids::RINGS) == reconcile_result_e::Rendered);
  assert(f.surface->has_layer("ring-1-fill") && f.surface->has_layer("ring-3-fill"));
  assert(!f.surface->has_source("ring-5") && !f.surface->has_layer("ring-5-fill"));
}

int main()
{
  test_mount_and_load();
  test_unchanged_props();
  test_basemap_swap();
  test_change_during_swap();
  test_visibility_toggles();
  test_callbacks();
  test_draw_flow();
  test_unmount();
  test_repeated_ring_radii();
  test_surface_error_recovery();
  std::cout << "Map Canvas Verification Passed" << std::endl;
  return 0;
}
