#pragma once

#include "core/color.hpp"
#include "core/geojson.hpp"
#include "core/map_types.hpp"
#include "core/popup_content.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace site_mapper
{

// Raised by a surface on misuse (duplicate ids, unknown source, no style).
// The reconciler is structured so that this never happens in practice.
class surface_error_t : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

enum class layer_kind_e
{
  Fill,
  Line,
  Circle
};

// Which geometries of the source a layer draws
enum class geometry_filter_e
{
  Any,
  Polygon,
  LineOrPolygon,
  Point,
  NotPoint
};

struct paint_t
{
  color_t color = palette::BLACK;
  float opacity = 1.0f;
  float width = 1.0f; // Line width, or circle radius

  // Fill opacity while the feature-state "hover" of a feature is set
  std::optional<float> hover_opacity;

  // Applied to features whose "selected" property is true
  std::optional<float> selected_opacity;
  std::optional<float> selected_width;

  // Fill outline or circle stroke
  std::optional<color_t> outline_color;
  float outline_width = 0.0f;

  std::vector<float> dash; // Empty for a solid line

  // A feature property holding "#RRGGBB" that overrides color when present
  std::string color_property;
};

struct layer_filter_t
{
  geometry_filter_e geometry = geometry_filter_e::Any;

  // When property is set only features whose value is listed are drawn
  std::string property;
  std::vector<std::string> values;
};

struct layer_spec_t
{
  std::string id;
  layer_kind_e kind = layer_kind_e::Fill;
  std::string source;
  double min_zoom = 0.0;
  paint_t paint;
  layer_filter_t filter;
};

enum class map_event_e
{
  Load,
  StyleLoad,
  Click,
  MouseMove,
  MouseEnter,
  MouseLeave,
  MoveEnd,
  ZoomEnd
};

auto map_event_name(map_event_e type) -> const char *;

struct rendered_feature_t
{
  std::string layer_id;
  std::string source_id;
  feature_t feature;
};

struct map_event_t
{
  map_event_e type = map_event_e::Load;
  geo_position_t position;
  std::vector<rendered_feature_t> features; // Hits of the scoped layer, top-most first
};

using listener_id_t = uint64_t;
using marker_id_t = uint64_t;
using event_handler_t = std::function<void(const map_event_t &)>;

enum class cursor_e
{
  Default,
  Pointer,
  Crosshair,
  Move,
  NotAllowed
};

auto cursor_name(cursor_e cursor) -> const char *;

enum class marker_style_e
{
  Pin,
  Subject
};

struct marker_spec_t
{
  geo_position_t position;
  color_t color = palette::SALE_COMPS;
  marker_style_e style = marker_style_e::Pin;
  popup_content_t popup;
};

struct marker_t
{
  marker_id_t id = 0;
  marker_spec_t spec;
  bool popup_open = false;
};

struct popup_t
{
  geo_position_t anchor;
  popup_content_t content;
};

// Imperative, stateful map surface. A style swap destroys every source, layer
// and feature-state at once; markers and listeners survive it.
class map_surface_t
{
public:
  virtual ~map_surface_t() = default;

  // Style
  virtual auto set_style(const std::string &style_id) -> void = 0;
  virtual auto style_id() const -> const std::string & = 0;
  virtual auto is_loaded() const -> bool = 0;       // Initial load has completed
  virtual auto is_style_loaded() const -> bool = 0; // No style swap pending

  // Sources
  virtual auto add_source(const std::string &id, feature_collection_ptr data) -> void = 0;
  virtual auto has_source(const std::string &id) const -> bool = 0;
  virtual auto remove_source(const std::string &id) -> void = 0;
  virtual auto source(const std::string &id) const -> feature_collection_ptr = 0;
  virtual auto source_ids() const -> std::vector<std::string> = 0;

  // Layers, in paint order (first is drawn first)
  virtual auto add_layer(const layer_spec_t &spec) -> void = 0;
  virtual auto has_layer(const std::string &id) const -> bool = 0;
  virtual auto remove_layer(const std::string &id) -> void = 0;
  virtual auto move_layer(const std::string &id) -> void = 0; // To the top
  virtual auto layer(const std::string &id) const -> const layer_spec_t * = 0;
  virtual auto layer_ids() const -> std::vector<std::string> = 0;

  // Feature-state, cleared together with its source
  virtual auto set_feature_state(const std::string &source_id, const std::string &feature_id, const std::string &key, bool value) -> void = 0;
  virtual auto feature_state(const std::string &source_id, const std::string &feature_id, const std::string &key) const -> bool = 0;

  // Events
  virtual auto on(map_event_e type, event_handler_t handler) -> listener_id_t = 0;
  virtual auto on(map_event_e type, const std::string &layer_id, event_handler_t handler) -> listener_id_t = 0;
  virtual auto once(map_event_e type, event_handler_t handler) -> listener_id_t = 0;
  virtual auto off(listener_id_t id) -> void = 0;
  virtual auto listener_count() const -> size_t = 0;

  // Camera
  virtual auto jump_to(geo_position_t center) -> void = 0;
  virtual auto center() const -> geo_position_t = 0;
  virtual auto zoom() const -> double = 0;
  virtual auto bounds() const -> view_bounds_t = 0;

  // Hit test at a position against the given layers, top-most layer first
  virtual auto query_rendered_features(geo_position_t position, const std::vector<std::string> &layer_ids) const -> std::vector<rendered_feature_t> = 0;

  virtual auto set_cursor(cursor_e cursor) -> void = 0;
  virtual auto cursor() const -> cursor_e = 0;

  // Markers are DOM-like overlays and are not part of the style
  virtual auto add_marker(const marker_spec_t &spec) -> marker_id_t = 0;
  virtual auto remove_marker(marker_id_t id) -> void = 0;
  virtual auto toggle_marker_popup(marker_id_t id) -> void = 0;
  virtual auto markers() const -> std::vector<marker_t> = 0;

  // Single free-standing popup
  virtual auto show_popup(geo_position_t anchor, popup_content_t content) -> void = 0;
  virtual auto close_popup() -> void = 0;
  virtual auto popup() const -> std::optional<popup_t> = 0;

  // Drop listeners, markers, sources and layers. Later calls are no-ops.
  virtual auto destroy() -> void = 0;
};

using surface_factory_t = std::function<std::unique_ptr<map_surface_t>(const viewport_t &)>;

} // namespace site_mapper
