#pragma once

#include "core/geometry_classifier.hpp"
#include "core/layer_tree.hpp"
#include "core/map_types.hpp"
#include "core/ring_generator.hpp"
#include "map/draw_session.hpp"
#include "map/interaction_router.hpp"
#include "map/layer_reconciler.hpp"
#include "map/marker_manager.hpp"
#include "map/viewport_controller.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace site_mapper
{

// Declarative inputs of the map. Collections are immutable snapshots compared
// by pointer; hand in a new pointer to change the data.
struct map_canvas_props_t
{
  viewport_t viewport; // Zoom is only read at mount
  layer_tree_t layers = layer_tree_t::make_default();

  std::vector<map_feature_t> features; // Annotations
  std::string selected_feature_id;
  active_tool_e active_tool = active_tool_e::None;

  feature_collection_ptr plan_parcels;
  feature_collection_ptr project_boundary;
  feature_collection_ptr tax_parcels;
  std::vector<std::string> selected_tax_parcel_ids;
  feature_collection_ptr sale_comps;
  feature_collection_ptr rent_comps;

  feature_collection_ptr parcel_collection;
  std::string parcel_subject_id;
  std::vector<std::string> parcel_comp_ids;
  std::vector<std::string> parcel_id_fields = DEFAULT_PARCEL_ID_FIELDS;
  double parcel_min_zoom = DEFAULT_PARCEL_MIN_ZOOM;

  std::vector<double> ring_radii = DEFAULT_RING_RADII_MILES;
  double selected_ring_radius = 0.0; // Non-positive for none

  map_callbacks_t callbacks;
};

// The reactive map component. Each domain effect remembers the dependency key
// it last completed with and runs again only when the key changes; a pass
// that finds the surface not ready keeps the old key so it is retried.
class map_canvas_t
{
public:
  map_canvas_t();
  ~map_canvas_t();

  map_canvas_t(const map_canvas_t &) = delete;
  auto operator=(const map_canvas_t &) -> map_canvas_t & = delete;

  // Create the surface. A second mount without unmount is ignored.
  auto mount(const surface_factory_t &factory, const map_canvas_props_t &props) -> bool;
  auto render(const map_canvas_props_t &props) -> void;

  // Re-run effects with the last props
  auto refresh() -> void;
  auto unmount() -> void;

  auto is_mounted() const -> bool
  {
    return m_mounted;
  }
  auto surface() const -> map_surface_t *
  {
    return m_controller.surface();
  }
  auto get_controller() -> viewport_controller_t &
  {
    return m_controller;
  }
  auto get_router() -> interaction_router_t &
  {
    return m_router;
  }
  auto get_markers() const -> const marker_manager_t &
  {
    return m_markers;
  }
  auto get_draw_session() -> draw_session_t &
  {
    return m_draw;
  }
  auto get_props() const -> const map_canvas_props_t &
  {
    return m_props;
  }

  // Outcome of the latest pass of a domain, by prefix
  auto last_result(const std::string &prefix) const -> std::optional<reconcile_result_e>;

  // Classification used by the latest reference parcel pass
  auto get_parcel_buckets() const -> const parcel_buckets_t &
  {
    return m_parcel_buckets;
  }

private:
  template <typename Key> struct effect_t
  {
    std::optional<Key> last;

    auto is_stale(const Key &key) const -> bool
    {
      return !last || !(*last == key);
    }
  };

  auto sync_props() -> void;
  auto run_effects() -> void;
  auto record(const std::string &prefix, reconcile_result_e result) -> reconcile_result_e;
  // Surface errors are logged and leave the domain stale for the next pass
  auto run_guarded(const std::string &prefix, const std::function<void()> &effect) -> void;
  auto reset_effects() -> void;

  auto run_plan_parcels(uint64_t revision) -> void;
  auto run_project_boundary(uint64_t revision) -> void;
  auto run_tax_parcels(uint64_t revision) -> void;
  auto run_reference_parcels(uint64_t revision) -> void;
  auto run_sale_comps(uint64_t revision) -> void;
  auto run_rent_comps(uint64_t revision) -> void;
  auto run_subject_marker(uint64_t revision) -> void;
  auto run_rings(uint64_t revision) -> void;
  auto run_annotations(uint64_t revision) -> void;
  auto run_draw_feedback(uint64_t revision) -> void;

  map_canvas_props_t m_props;
  bool m_mounted = false;
  bool m_in_effects = false;
  bool m_rerun = false;
  size_t m_revision_subscription = 0;

  viewport_controller_t m_controller;
  interaction_router_t m_router;
  layer_reconciler_t m_reconciler;
  marker_manager_t m_markers;
  draw_session_t m_draw;

  parcel_buckets_t m_parcel_buckets;
  std::map<std::string, reconcile_result_e> m_results;

  using collection_key_t = std::tuple<uint64_t, bool, feature_collection_ptr>;

  effect_t<collection_key_t> m_plan_parcels;
  effect_t<std::tuple<uint64_t, bool, feature_collection_ptr, geo_position_t>> m_boundary;
  effect_t<std::tuple<uint64_t, bool, feature_collection_ptr, std::vector<std::string>, double>> m_tax_parcels;
  effect_t<std::tuple<uint64_t, bool, feature_collection_ptr, std::string, std::vector<std::string>, std::vector<std::string>, double>> m_reference_parcels;
  effect_t<collection_key_t> m_sale_comps;
  effect_t<collection_key_t> m_rent_comps;
  effect_t<std::tuple<uint64_t, geo_position_t>> m_subject_marker;
  effect_t<std::tuple<uint64_t, bool, geo_position_t, std::vector<double>, double>> m_rings;
  effect_t<std::tuple<uint64_t, bool, std::vector<map_feature_t>, std::string>> m_annotations;
  effect_t<std::tuple<uint64_t, bool, feature_collection_ptr>> m_draw_feedback;
};

} // namespace site_mapper
