#pragma once

#include "renderer/map_surface.hpp"
#include <map>
#include <set>

namespace site_mapper
{

// Add/remove counters, read by tests and the debug overlay
struct surface_stats_t
{
  size_t sources_added = 0;
  size_t sources_removed = 0;
  size_t layers_added = 0;
  size_t layers_removed = 0;
  size_t style_loads = 0;
  std::map<std::string, size_t> layer_adds; // Per layer id
};

// In-memory map surface. Holds sources, layers, feature-state, markers and
// listeners and dispatches pointer input the way a GPU map would; drawing is
// left to the view that owns it. Style loads complete on the next update().
class retained_surface_t : public map_surface_t
{
public:
  static constexpr double TILE_SIZE = 256.0;
  static constexpr double MIN_ZOOM = 0.0;
  static constexpr double MAX_ZOOM = 22.0;
  static constexpr double HIT_TOLERANCE_PX = 4.0;
  static constexpr double MARKER_HIT_RADIUS_PX = 14.0;

  explicit retained_surface_t(const viewport_t &viewport);
  ~retained_surface_t() override = default;

  // Host drivers
  auto update() -> void;
  auto set_viewport_size(double width, double height) -> void;
  auto pointer_move(geo_position_t position) -> void;
  auto pointer_leave() -> void;
  auto click(geo_position_t position) -> void;
  auto pan_to(geo_position_t center) -> void; // Interactive, no event until settle()
  auto zoom_to(double zoom) -> void;          // Interactive, no event until settle()
  auto settle() -> void;                      // Emits zoom_end / move_end for pending camera changes

  auto marker_at(geo_position_t position) const -> std::optional<marker_id_t>;

  // Geometry and property filter of a layer, without the zoom check
  auto draws_feature(const layer_spec_t &spec, const feature_t &feature) const -> bool;

  // Screen mapping for the current camera and viewport size, origin top-left
  auto geo_to_screen(geo_position_t position, double &out_x, double &out_y) const -> void;
  auto screen_to_geo(double x, double y) const -> geo_position_t;

  auto get_stats() const -> const surface_stats_t &
  {
    return m_stats;
  }
  auto reset_stats() -> void
  {
    m_stats = {};
  }
  auto is_destroyed() const -> bool
  {
    return m_destroyed;
  }
  auto get_viewport_width() const -> double
  {
    return m_width;
  }
  auto get_viewport_height() const -> double
  {
    return m_height;
  }

  // map_surface_t
  auto set_style(const std::string &style_id) -> void override;
  auto style_id() const -> const std::string & override;
  auto is_loaded() const -> bool override;
  auto is_style_loaded() const -> bool override;

  auto add_source(const std::string &id, feature_collection_ptr data) -> void override;
  auto has_source(const std::string &id) const -> bool override;
  auto remove_source(const std::string &id) -> void override;
  auto source(const std::string &id) const -> feature_collection_ptr override;
  auto source_ids() const -> std::vector<std::string> override;

  auto add_layer(const layer_spec_t &spec) -> void override;
  auto has_layer(const std::string &id) const -> bool override;
  auto remove_layer(const std::string &id) -> void override;
  auto move_layer(const std::string &id) -> void override;
  auto layer(const std::string &id) const -> const layer_spec_t * override;
  auto layer_ids() const -> std::vector<std::string> override;

  auto set_feature_state(const std::string &source_id, const std::string &feature_id, const std::string &key, bool value) -> void override;
  auto feature_state(const std::string &source_id, const std::string &feature_id, const std::string &key) const -> bool override;

  auto on(map_event_e type, event_handler_t handler) -> listener_id_t override;
  auto on(map_event_e type, const std::string &layer_id, event_handler_t handler) -> listener_id_t override;
  auto once(map_event_e type, event_handler_t handler) -> listener_id_t override;
  auto off(listener_id_t id) -> void override;
  auto listener_count() const -> size_t override;

  auto jump_to(geo_position_t center) -> void override;
  auto center() const -> geo_position_t override;
  auto zoom() const -> double override;
  auto bounds() const -> view_bounds_t override;

  auto query_rendered_features(geo_position_t position, const std::vector<std::string> &layer_ids) const -> std::vector<rendered_feature_t> override;

  auto set_cursor(cursor_e cursor) -> void override;
  auto cursor() const -> cursor_e override;

  auto add_marker(const marker_spec_t &spec) -> marker_id_t override;
  auto remove_marker(marker_id_t id) -> void override;
  auto toggle_marker_popup(marker_id_t id) -> void override;
  auto markers() const -> std::vector<marker_t> override;

  auto show_popup(geo_position_t anchor, popup_content_t content) -> void override;
  auto close_popup() -> void override;
  auto popup() const -> std::optional<popup_t> override;

  auto destroy() -> void override;

private:
  struct listener_t
  {
    listener_id_t id = 0;
    map_event_e type = map_event_e::Load;
    std::string layer_id; // Empty for map-wide listeners
    bool once = false;
    event_handler_t handler;
  };

  auto require_usable(const char *operation) const -> void;
  auto emit(map_event_e type, geo_position_t position) -> void;
  auto emit_layer(map_event_e type, const std::string &layer_id, geo_position_t position, std::vector<rendered_feature_t> hits) -> void;
  auto layers_with_listeners() const -> std::vector<std::string>;

  auto world_pixels(geo_position_t position) const -> std::pair<double, double>;
  auto feature_hit(const layer_spec_t &spec, const feature_t &feature, geo_position_t position) const -> bool;

  std::string m_style_id;
  bool m_loaded = false;
  bool m_style_pending = true;
  bool m_destroyed = false;

  geo_position_t m_center;
  double m_zoom = 0.0;
  geo_position_t m_settled_center;
  double m_settled_zoom = 0.0;
  double m_width = 800.0;
  double m_height = 600.0;

  std::map<std::string, feature_collection_ptr> m_sources;
  std::vector<layer_spec_t> m_layers; // Paint order
  std::map<std::string, std::map<std::string, std::map<std::string, bool>>> m_feature_state;

  std::vector<listener_t> m_listeners;
  listener_id_t m_next_listener_id = 1;
  std::set<std::string> m_hovered_layers;

  std::vector<marker_t> m_markers;
  marker_id_t m_next_marker_id = 1;
  std::optional<popup_t> m_popup;

  cursor_e m_cursor = cursor_e::Default;
  surface_stats_t m_stats;
};

} // namespace site_mapper
