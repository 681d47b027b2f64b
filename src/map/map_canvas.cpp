#include "map/map_canvas.hpp"
#include "map/map_domains.hpp"
#include <iostream>

namespace site_mapper
{

namespace
{
// Clears the re-entrancy flag however the effect pass ends
struct effects_guard_t
{
  bool &flag;
  ~effects_guard_t()
  {
    flag = false;
  }
};
} // namespace

map_canvas_t::map_canvas_t() : m_reconciler(m_router)
{
  m_draw.set_on_complete(
      [this](const drawn_feature_t &drawn)
      {
        const auto &callback = m_router.get_callbacks().on_draw_complete;
        if (callback)
          callback(drawn);
      });

  m_controller.set_on_view_state(
      [this](const view_state_t &state)
      {
        const auto &callback = m_router.get_callbacks().on_viewport_change;
        if (callback)
          callback(state);
      });

  m_controller.set_on_load([this]() { run_effects(); });
}

map_canvas_t::~map_canvas_t()
{
  unmount();
}

auto map_canvas_t::mount(const surface_factory_t &factory, const map_canvas_props_t &props) -> bool
{
  if (m_mounted)
    return false;

  m_props = props;
  m_router.set_callbacks(m_props.callbacks);

  if (!m_controller.initialize(factory, m_props.viewport))
    return false;

  m_mounted = true;
  m_router.attach(m_controller.surface());
  m_router.set_draw_session(&m_draw);
  m_markers.attach(m_controller.surface());
  m_revision_subscription = m_controller.get_tracker().subscribe([this](uint64_t) { run_effects(); });

  std::cout << "Map: mounted at " << m_props.viewport.center.lat << ", " << m_props.viewport.center.lon << " (" << m_props.viewport.basemap << ")"
            << std::endl;

  sync_props();
  run_effects();
  return true;
}

auto map_canvas_t::render(const map_canvas_props_t &props) -> void
{
  m_props = props;
  if (!m_mounted)
    return;

  sync_props();
  run_effects();
}

auto map_canvas_t::refresh() -> void
{
  if (m_mounted)
    run_effects();
}

auto map_canvas_t::unmount() -> void
{
  if (!m_mounted)
    return;

  m_controller.get_tracker().unsubscribe(m_revision_subscription);
  m_revision_subscription = 0;

  // Overlays and listeners go before the surface they live on
  m_markers.clear_all();
  m_markers.attach(nullptr);
  m_router.set_draw_session(nullptr);
  m_router.detach();
  m_reconciler.forget_all();
  m_draw.cancel();
  m_controller.teardown();

  reset_effects();
  m_results.clear();
  m_parcel_buckets = {};
  m_mounted = false;
  std::cout << "Map: unmounted" << std::endl;
}

auto map_canvas_t::last_result(const std::string &prefix) const -> std::optional<reconcile_result_e>
{
  auto it = m_results.find(prefix);
  if (it == m_results.end())
    return std::nullopt;
  return it->second;
}

auto map_canvas_t::sync_props() -> void
{
  m_router.set_callbacks(m_props.callbacks);
  m_router.set_annotations(m_props.features);
  m_router.set_active_tool(m_props.active_tool);
  m_draw.begin(m_props.active_tool);

  m_controller.set_basemap(m_props.viewport.basemap);
  m_controller.set_center(m_props.viewport.center);
}

auto map_canvas_t::run_effects() -> void
{
  // Effects triggered from inside an effect run once the current pass ends
  if (m_in_effects)
  {
    m_rerun = true;
    return;
  }

  m_in_effects = true;
  effects_guard_t guard{m_in_effects};
  do
  {
    m_rerun = false;
    if (!m_mounted || !m_controller.surface())
      break;

    const auto revision = m_controller.get_revision();
    run_guarded(domain_ids::PLAN_PARCELS, [&] { run_plan_parcels(revision); });
    run_guarded(domain_ids::PROJECT_BOUNDARY, [&] { run_project_boundary(revision); });
    run_guarded(domain_ids::TAX_PARCELS, [&] { run_tax_parcels(revision); });
    run_guarded(domain_ids::REFERENCE_PARCELS, [&] { run_reference_parcels(revision); });
    run_guarded(domain_ids::SALE_COMPS, [&] { run_sale_comps(revision); });
    run_guarded(domain_ids::RENT_COMPS, [&] { run_rent_comps(revision); });
    run_subject_marker(revision);
    run_guarded(domain_ids::RINGS, [&] { run_rings(revision); });
    run_guarded(domain_ids::ANNOTATIONS, [&] { run_annotations(revision); });
    run_guarded(domain_ids::DRAW_FEEDBACK, [&] { run_draw_feedback(revision); });
  } while (m_rerun);
}

auto map_canvas_t::run_guarded(const std::string &prefix, const std::function<void()> &effect) -> void
{
  try
  {
    effect();
  }
  catch (const surface_error_t &e)
  {
    // The effect key stays stale, the domain is rebuilt on the next pass
    std::cerr << "Map: " << prefix << " update failed: " << e.what() << std::endl;
    record(prefix, reconcile_result_e::NotReady);
  }
}

auto map_canvas_t::record(const std::string &prefix, reconcile_result_e result) -> reconcile_result_e
{
  m_results[prefix] = result;
  return result;
}

auto map_canvas_t::reset_effects() -> void
{
  m_plan_parcels = {};
  m_boundary = {};
  m_tax_parcels = {};
  m_reference_parcels = {};
  m_sale_comps = {};
  m_rent_comps = {};
  m_subject_marker = {};
  m_rings = {};
  m_annotations = {};
  m_draw_feedback = {};
}

auto map_canvas_t::run_plan_parcels(uint64_t revision) -> void
{
  collection_key_t key{revision, m_props.layers.is_visible(layer_ids::PLAN_PARCELS), m_props.plan_parcels};
  if (!m_plan_parcels.is_stale(key))
    return;

  auto result = record(domain_ids::PLAN_PARCELS, m_reconciler.reconcile(surface(), domains::plan_parcels(m_props.plan_parcels), std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_plan_parcels.last = key;
}

auto map_canvas_t::run_project_boundary(uint64_t revision) -> void
{
  auto center = m_props.viewport.center;
  std::tuple<uint64_t, bool, feature_collection_ptr, geo_position_t> key{revision, m_props.layers.is_visible(layer_ids::SITE_BOUNDARY),
                                                                         m_props.project_boundary, center};
  if (!m_boundary.is_stale(key))
    return;

  auto plan = domains::project_boundary(m_props.project_boundary, center);
  auto result = record(domain_ids::PROJECT_BOUNDARY, m_reconciler.reconcile(surface(), plan, std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_boundary.last = key;
}

auto map_canvas_t::run_tax_parcels(uint64_t revision) -> void
{
  std::tuple<uint64_t, bool, feature_collection_ptr, std::vector<std::string>, double> key{
      revision, m_props.layers.is_visible(layer_ids::TAX_PARCELS), m_props.tax_parcels, m_props.selected_tax_parcel_ids, m_props.parcel_min_zoom};
  if (!m_tax_parcels.is_stale(key))
    return;

  auto plan = domains::tax_parcels(m_props.tax_parcels, m_props.selected_tax_parcel_ids, m_props.parcel_min_zoom);
  auto result = record(domain_ids::TAX_PARCELS, m_reconciler.reconcile(surface(), plan, std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_tax_parcels.last = key;
}

auto map_canvas_t::run_reference_parcels(uint64_t revision) -> void
{
  std::tuple<uint64_t, bool, feature_collection_ptr, std::string, std::vector<std::string>, std::vector<std::string>, double> key{
      revision,
      m_props.layers.is_visible(layer_ids::PARCEL_OVERLAY),
      m_props.parcel_collection,
      m_props.parcel_subject_id,
      m_props.parcel_comp_ids,
      m_props.parcel_id_fields,
      m_props.parcel_min_zoom};
  if (!m_reference_parcels.is_stale(key))
    return;

  if (!m_controller.is_ready())
  {
    record(domain_ids::REFERENCE_PARCELS, reconcile_result_e::NotReady);
    return;
  }

  // Classified on every pass, never cached across inputs
  m_parcel_buckets = {};
  if (!is_empty(m_props.parcel_collection))
    m_parcel_buckets = classify_parcels(*m_props.parcel_collection, m_props.parcel_subject_id, m_props.parcel_comp_ids, m_props.parcel_id_fields);

  auto plan = domains::reference_parcels(m_parcel_buckets, m_props.parcel_min_zoom, m_props.parcel_id_fields);
  auto result = record(domain_ids::REFERENCE_PARCELS, m_reconciler.reconcile(surface(), plan, std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_reference_parcels.last = key;
}

auto map_canvas_t::run_sale_comps(uint64_t revision) -> void
{
  collection_key_t key{revision, m_props.layers.is_visible(layer_ids::SALE_COMPS), m_props.sale_comps};
  if (!m_sale_comps.is_stale(key))
    return;

  auto result = record(domain_ids::SALE_COMPS, m_reconciler.reconcile(surface(), domains::sale_comps(m_props.sale_comps), std::get<1>(key)));
  if (result == reconcile_result_e::NotReady)
    return;

  m_markers.sync_sale_comps(m_props.sale_comps, std::get<1>(key));
  m_sale_comps.last = key;
}

auto map_canvas_t::run_rent_comps(uint64_t revision) -> void
{
  collection_key_t key{revision, m_props.layers.is_visible(layer_ids::RENT_COMPS), m_props.rent_comps};
  if (!m_rent_comps.is_stale(key))
    return;

  auto result = record(domain_ids::RENT_COMPS, m_reconciler.reconcile(surface(), domains::rent_comps(m_props.rent_comps), std::get<1>(key)));
  if (result == reconcile_result_e::NotReady)
    return;

  m_markers.sync_rent_comps(m_props.rent_comps, std::get<1>(key));
  m_rent_comps.last = key;
}

auto map_canvas_t::run_subject_marker(uint64_t revision) -> void
{
  std::tuple<uint64_t, geo_position_t> key{revision, m_props.viewport.center};
  if (!m_subject_marker.is_stale(key) || !m_controller.is_loaded())
    return;

  m_markers.sync_subject(m_props.viewport.center);
  m_subject_marker.last = key;
}

auto map_canvas_t::run_rings(uint64_t revision) -> void
{
  std::tuple<uint64_t, bool, geo_position_t, std::vector<double>, double> key{
      revision, m_props.layers.is_visible(layer_ids::DEMO_RINGS), m_props.viewport.center, m_props.ring_radii, m_props.selected_ring_radius};
  if (!m_rings.is_stale(key))
    return;

  std::vector<demographic_ring_t> rings;
  if (std::get<1>(key))
    rings = generate_rings(m_props.viewport.center, m_props.ring_radii, m_props.selected_ring_radius);

  auto result = record(domain_ids::RINGS, m_reconciler.reconcile(surface(), domains::demographic_rings(rings), std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_rings.last = key;
}

auto map_canvas_t::run_annotations(uint64_t revision) -> void
{
  std::tuple<uint64_t, bool, std::vector<map_feature_t>, std::string> key{revision, m_props.layers.is_visible(layer_ids::DRAWN_SHAPES), m_props.features,
                                                                          m_props.selected_feature_id};
  if (!m_annotations.is_stale(key))
    return;

  auto plan = domains::annotations(m_props.features, m_props.selected_feature_id);
  auto result = record(domain_ids::ANNOTATIONS, m_reconciler.reconcile(surface(), plan, std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_annotations.last = key;
}

auto map_canvas_t::run_draw_feedback(uint64_t revision) -> void
{
  std::tuple<uint64_t, bool, feature_collection_ptr> key{revision, m_draw.is_active(), m_draw.get_feedback()};
  if (!m_draw_feedback.is_stale(key))
    return;

  auto result = record(domain_ids::DRAW_FEEDBACK, m_reconciler.reconcile(surface(), domains::draw_feedback(m_draw.get_feedback()), std::get<1>(key)));
  if (result != reconcile_result_e::NotReady)
    m_draw_feedback.last = key;
}

} // namespace site_mapper
