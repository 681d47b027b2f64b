#pragma once

#include "core/map_types.hpp"
#include "core/popup_content.hpp"
#include "renderer/map_surface.hpp"
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace site_mapper
{

class draw_session_t;

// Host callbacks. The router reads them at event time, so replacing them on a
// re-render never requires re-registering surface listeners.
struct map_callbacks_t
{
  std::function<void(const view_state_t &)> on_viewport_change;
  std::function<void(geo_position_t)> on_map_click;
  std::function<void(const map_feature_t &)> on_feature_click;
  std::function<void(const feature_t &)> on_parcel_toggle;
  std::function<void(double radius_miles, geo_position_t)> on_ring_click;
  std::function<void(const drawn_feature_t &)> on_draw_complete;
};

enum class interaction_e
{
  None,         // Cursor affordance only
  FeatureClick, // User drawn annotation
  ParcelToggle, // Tax or reference parcel selection
  RingClick,
  Popup
};

using popup_builder_t = std::function<popup_content_t(const rendered_feature_t &)>;

struct interaction_binding_t
{
  std::string layer_id;
  interaction_e action = interaction_e::None;
  popup_builder_t popup;       // Shown on click when set
  bool hover_state = false;    // Track the hovered feature with feature-state
  double ring_radius = 0.0;    // RingClick only
  std::vector<std::string> id_fields; // ParcelToggle on reference parcels, tax ids otherwise
};

auto tool_cursor(active_tool_e tool) -> cursor_e;

// Routes layer-scoped pointer events to the host callbacks and owns the
// cursor state machine and the per-layer hover slots.
class interaction_router_t
{
public:
  interaction_router_t() = default;
  ~interaction_router_t();

  interaction_router_t(const interaction_router_t &) = delete;
  auto operator=(const interaction_router_t &) -> interaction_router_t & = delete;

  // Register the map-wide click listener. Detaches from a previous surface.
  auto attach(map_surface_t *surface) -> void;
  auto detach() -> void;

  auto set_callbacks(map_callbacks_t callbacks) -> void
  {
    m_callbacks = std::move(callbacks);
  }
  auto get_callbacks() const -> const map_callbacks_t &
  {
    return m_callbacks;
  }

  auto set_annotations(std::vector<map_feature_t> annotations) -> void
  {
    m_annotations = std::move(annotations);
  }
  auto set_draw_session(draw_session_t *session) -> void
  {
    m_draw_session = session;
  }

  auto set_active_tool(active_tool_e tool) -> void;
  auto get_active_tool() const -> active_tool_e
  {
    return m_tool;
  }

  // Register click/hover listeners for one layer. The returned ids are handed
  // back to unbind() before the layer is removed.
  auto bind(const interaction_binding_t &binding) -> std::vector<listener_id_t>;
  auto unbind(const std::vector<listener_id_t> &listener_ids) -> void;

  // Feature id currently highlighted on a layer
  auto hovered_feature(const std::string &layer_id) const -> std::optional<std::string>;
  auto bound_layer_count() const -> size_t
  {
    return m_bindings.size();
  }

private:
  struct hover_slot_t
  {
    std::string source_id;
    std::string feature_id;
  };

  struct bound_layer_t
  {
    interaction_binding_t binding;
    std::vector<listener_id_t> listeners;
  };

  auto handle_map_click(const map_event_t &event) -> void;
  auto handle_layer_click(const std::string &layer_id, const map_event_t &event) -> void;
  auto handle_enter(const std::string &layer_id) -> void;
  auto handle_leave(const std::string &layer_id) -> void;
  auto handle_hover_move(const std::string &layer_id, const map_event_t &event) -> void;
  auto clear_hover(const std::string &layer_id) -> void;

  // Layers whose click would fire under the current tool
  auto absorbing_layers() const -> std::vector<std::string>;
  auto apply_cursor() -> void;

  map_surface_t *m_surface = nullptr;
  listener_id_t m_map_click_listener = 0;

  map_callbacks_t m_callbacks;
  std::vector<map_feature_t> m_annotations;
  draw_session_t *m_draw_session = nullptr;
  active_tool_e m_tool = active_tool_e::None;

  std::map<std::string, bound_layer_t> m_bindings; // By layer id
  std::map<std::string, hover_slot_t> m_hover_slots;
  std::set<std::string> m_pointer_layers; // Layers under the pointer
};

} // namespace site_mapper
