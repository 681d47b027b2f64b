#include "renderer/retained_surface.hpp"
#include "core/geo_math.hpp"
#include "core/geometry_ops.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <iostream>

namespace site_mapper
{

auto map_event_name(map_event_e type) -> const char *
{
  switch (type)
  {
  case map_event_e::Load:
    return "load";
  case map_event_e::StyleLoad:
    return "style.load";
  case map_event_e::Click:
    return "click";
  case map_event_e::MouseMove:
    return "mousemove";
  case map_event_e::MouseEnter:
    return "mouseenter";
  case map_event_e::MouseLeave:
    return "mouseleave";
  case map_event_e::MoveEnd:
    return "moveend";
  case map_event_e::ZoomEnd:
    return "zoomend";
  }
  return "unknown";
}

auto cursor_name(cursor_e cursor) -> const char *
{
  switch (cursor)
  {
  case cursor_e::Pointer:
    return "pointer";
  case cursor_e::Crosshair:
    return "crosshair";
  case cursor_e::Move:
    return "move";
  case cursor_e::NotAllowed:
    return "not-allowed";
  default:
    return "default";
  }
}

retained_surface_t::retained_surface_t(const viewport_t &viewport)
    : m_style_id(viewport.basemap), m_center(viewport.center), m_zoom(std::clamp(viewport.zoom, MIN_ZOOM, MAX_ZOOM)), m_settled_center(m_center),
      m_settled_zoom(m_zoom)
{
}

// --- Host drivers ---

auto retained_surface_t::update() -> void
{
  if (m_destroyed || !m_style_pending)
    return;

  m_style_pending = false;
  m_stats.style_loads++;

  if (!m_loaded)
  {
    m_loaded = true;
    std::cout << "Surface: loaded with style " << m_style_id << std::endl;
    emit(map_event_e::Load, m_center);

    // A load handler may have started another style already
    if (m_destroyed || m_style_pending)
      return;
  }
  emit(map_event_e::StyleLoad, m_center);
}

auto retained_surface_t::set_viewport_size(double width, double height) -> void
{
  m_width = std::max(width, 1.0);
  m_height = std::max(height, 1.0);
}

auto retained_surface_t::pointer_move(geo_position_t position) -> void
{
  if (m_destroyed)
    return;

  emit(map_event_e::MouseMove, position);

  for (const auto &layer_id : layers_with_listeners())
  {
    auto hits = query_rendered_features(position, {layer_id});
    bool was_hovered = m_hovered_layers.contains(layer_id);

    if (hits.empty())
    {
      if (was_hovered)
      {
        m_hovered_layers.erase(layer_id);
        emit_layer(map_event_e::MouseLeave, layer_id, position, {});
      }
      continue;
    }

    if (!was_hovered)
    {
      m_hovered_layers.insert(layer_id);
      emit_layer(map_event_e::MouseEnter, layer_id, position, hits);
    }
    emit_layer(map_event_e::MouseMove, layer_id, position, std::move(hits));
  }
}

auto retained_surface_t::pointer_leave() -> void
{
  if (m_destroyed)
    return;

  auto hovered = m_hovered_layers;
  m_hovered_layers.clear();
  for (const auto &layer_id : hovered)
    emit_layer(map_event_e::MouseLeave, layer_id, m_center, {});
}

auto retained_surface_t::click(geo_position_t position) -> void
{
  if (m_destroyed)
    return;

  // Markers swallow their own clicks
  if (auto marker = marker_at(position))
  {
    toggle_marker_popup(*marker);
    return;
  }

  m_popup.reset();

  // Listeners fire in registration order; layer-scoped ones only on a hit
  std::vector<listener_id_t> ids;
  for (const auto &listener : m_listeners)
  {
    if (listener.type == map_event_e::Click)
      ids.push_back(listener.id);
  }

  for (auto id : ids)
  {
    auto it = std::find_if(m_listeners.begin(), m_listeners.end(), [id](const listener_t &l) { return l.id == id; });
    if (it == m_listeners.end())
      continue;

    map_event_t event;
    event.type = map_event_e::Click;
    event.position = position;

    if (!it->layer_id.empty())
    {
      event.features = query_rendered_features(position, {it->layer_id});
      if (event.features.empty())
        continue;
    }

    auto handler = it->handler;
    if (it->once)
      m_listeners.erase(it);
    handler(event);

    if (m_destroyed)
      return;
  }
}

auto retained_surface_t::pan_to(geo_position_t center) -> void
{
  m_center.lon = std::clamp(center.lon, -180.0, 180.0);
  m_center.lat = std::clamp(center.lat, -85.0511, 85.0511);
}

auto retained_surface_t::zoom_to(double zoom) -> void
{
  m_zoom = std::clamp(zoom, MIN_ZOOM, MAX_ZOOM);
}

auto retained_surface_t::settle() -> void
{
  if (m_destroyed)
    return;

  bool zoomed = m_zoom != m_settled_zoom;
  bool moved = zoomed || !(m_center == m_settled_center);
  m_settled_zoom = m_zoom;
  m_settled_center = m_center;

  if (zoomed)
    emit(map_event_e::ZoomEnd, m_center);
  if (moved)
    emit(map_event_e::MoveEnd, m_center);
}

auto retained_surface_t::marker_at(geo_position_t position) const -> std::optional<marker_id_t>
{
  auto [px, py] = world_pixels(position);

  // Last added marker is drawn on top
  for (auto it = m_markers.rbegin(); it != m_markers.rend(); ++it)
  {
    auto [mx, my] = world_pixels(it->spec.position);
    if (std::hypot(px - mx, py - my) <= MARKER_HIT_RADIUS_PX)
      return it->id;
  }
  return std::nullopt;
}

auto retained_surface_t::geo_to_screen(geo_position_t position, double &out_x, double &out_y) const -> void
{
  auto [cx, cy] = world_pixels(m_center);
  auto [px, py] = world_pixels(position);
  out_x = px - cx + m_width * 0.5;
  out_y = py - cy + m_height * 0.5;
}

auto retained_surface_t::screen_to_geo(double x, double y) const -> geo_position_t
{
  auto [cx, cy] = world_pixels(m_center);
  double scale = TILE_SIZE * std::pow(2.0, m_zoom);
  double wx = (cx + x - m_width * 0.5) / scale;
  double wy = (cy + y - m_height * 0.5) / scale;

  geo_position_t result;
  geo::world_to_lat_lon(wx, wy, result.lat, result.lon);
  return result;
}

// --- Style ---

auto retained_surface_t::set_style(const std::string &style_id) -> void
{
  require_usable("set_style");

  // A style swap is destructive: every source, layer and feature-state goes
  m_layers.clear();
  m_sources.clear();
  m_feature_state.clear();
  m_hovered_layers.clear();

  m_style_id = style_id;
  m_style_pending = true;
  std::cout << "Surface: switching style to " << style_id << std::endl;
}

auto retained_surface_t::style_id() const -> const std::string &
{
  return m_style_id;
}

auto retained_surface_t::is_loaded() const -> bool
{
  return m_loaded && !m_destroyed;
}

auto retained_surface_t::is_style_loaded() const -> bool
{
  return m_loaded && !m_style_pending && !m_destroyed;
}

// --- Sources ---

auto retained_surface_t::add_source(const std::string &id, feature_collection_ptr data) -> void
{
  require_usable("add_source");
  if (!is_style_loaded())
    throw surface_error_t(std::format("add_source({}): style is not done loading", id));
  if (m_sources.contains(id))
    throw surface_error_t(std::format("There is already a source with ID \"{}\"", id));

  m_sources[id] = data ? std::move(data) : make_collection({});
  m_stats.sources_added++;
}

auto retained_surface_t::has_source(const std::string &id) const -> bool
{
  return m_sources.contains(id);
}

auto retained_surface_t::remove_source(const std::string &id) -> void
{
  require_usable("remove_source");
  if (!m_sources.contains(id))
    throw surface_error_t(std::format("There is no source with ID \"{}\"", id));

  for (const auto &layer : m_layers)
  {
    if (layer.source == id)
      throw surface_error_t(std::format("Source \"{}\" cannot be removed while layer \"{}\" is using it", id, layer.id));
  }

  m_sources.erase(id);
  m_feature_state.erase(id);
  m_stats.sources_removed++;
}

auto retained_surface_t::source(const std::string &id) const -> feature_collection_ptr
{
  auto it = m_sources.find(id);
  return it == m_sources.end() ? nullptr : it->second;
}

auto retained_surface_t::source_ids() const -> std::vector<std::string>
{
  std::vector<std::string> ids;
  ids.reserve(m_sources.size());
  for (const auto &[id, data] : m_sources)
    ids.push_back(id);
  return ids;
}

// --- Layers ---

auto retained_surface_t::add_layer(const layer_spec_t &spec) -> void
{
  require_usable("add_layer");
  if (!is_style_loaded())
    throw surface_error_t(std::format("add_layer({}): style is not done loading", spec.id));
  if (has_layer(spec.id))
    throw surface_error_t(std::format("Layer with id \"{}\" already exists on this map", spec.id));
  if (!m_sources.contains(spec.source))
    throw surface_error_t(std::format("Layer \"{}\" references unknown source \"{}\"", spec.id, spec.source));

  m_layers.push_back(spec);
  m_stats.layers_added++;
  m_stats.layer_adds[spec.id]++;
}

auto retained_surface_t::has_layer(const std::string &id) const -> bool
{
  return layer(id) != nullptr;
}

auto retained_surface_t::remove_layer(const std::string &id) -> void
{
  require_usable("remove_layer");
  auto removed = std::erase_if(m_layers, [&id](const layer_spec_t &l) { return l.id == id; });
  if (removed == 0)
    throw surface_error_t(std::format("Cannot remove non-existing layer \"{}\"", id));

  m_hovered_layers.erase(id);
  m_stats.layers_removed++;
}

auto retained_surface_t::move_layer(const std::string &id) -> void
{
  require_usable("move_layer");
  auto it = std::find_if(m_layers.begin(), m_layers.end(), [&id](const layer_spec_t &l) { return l.id == id; });
  if (it == m_layers.end())
    throw surface_error_t(std::format("The layer \"{}\" does not exist in the map's style", id));

  std::rotate(it, it + 1, m_layers.end());
}

auto retained_surface_t::layer(const std::string &id) const -> const layer_spec_t *
{
  for (const auto &spec : m_layers)
  {
    if (spec.id == id)
      return &spec;
  }
  return nullptr;
}

auto retained_surface_t::layer_ids() const -> std::vector<std::string>
{
  std::vector<std::string> ids;
  ids.reserve(m_layers.size());
  for (const auto &spec : m_layers)
    ids.push_back(spec.id);
  return ids;
}

// --- Feature-state ---

auto retained_surface_t::set_feature_state(const std::string &source_id, const std::string &feature_id, const std::string &key, bool value) -> void
{
  require_usable("set_feature_state");
  if (!m_sources.contains(source_id))
    throw surface_error_t(std::format("The source \"{}\" does not exist in the map's style", source_id));

  m_feature_state[source_id][feature_id][key] = value;
}

auto retained_surface_t::feature_state(const std::string &source_id, const std::string &feature_id, const std::string &key) const -> bool
{
  auto src = m_feature_state.find(source_id);
  if (src == m_feature_state.end())
    return false;
  auto feat = src->second.find(feature_id);
  if (feat == src->second.end())
    return false;
  auto value = feat->second.find(key);
  return value != feat->second.end() && value->second;
}

// --- Events ---

auto retained_surface_t::on(map_event_e type, event_handler_t handler) -> listener_id_t
{
  require_usable("on");
  auto id = m_next_listener_id++;
  m_listeners.push_back({id, type, {}, false, std::move(handler)});
  return id;
}

auto retained_surface_t::on(map_event_e type, const std::string &layer_id, event_handler_t handler) -> listener_id_t
{
  require_usable("on");
  auto id = m_next_listener_id++;
  m_listeners.push_back({id, type, layer_id, false, std::move(handler)});
  return id;
}

auto retained_surface_t::once(map_event_e type, event_handler_t handler) -> listener_id_t
{
  require_usable("once");
  auto id = m_next_listener_id++;
  m_listeners.push_back({id, type, {}, true, std::move(handler)});
  return id;
}

auto retained_surface_t::off(listener_id_t id) -> void
{
  std::erase_if(m_listeners, [id](const listener_t &l) { return l.id == id; });
}

auto retained_surface_t::listener_count() const -> size_t
{
  return m_listeners.size();
}

// --- Camera ---

auto retained_surface_t::jump_to(geo_position_t center) -> void
{
  require_usable("jump_to");
  pan_to(center);
  settle();
}

auto retained_surface_t::center() const -> geo_position_t
{
  return m_center;
}

auto retained_surface_t::zoom() const -> double
{
  return m_zoom;
}

auto retained_surface_t::bounds() const -> view_bounds_t
{
  auto top_left = screen_to_geo(0.0, 0.0);
  auto bottom_right = screen_to_geo(m_width, m_height);
  return {{top_left.lon, bottom_right.lat}, {bottom_right.lon, top_left.lat}};
}

auto retained_surface_t::query_rendered_features(geo_position_t position, const std::vector<std::string> &layer_ids) const -> std::vector<rendered_feature_t>
{
  std::vector<rendered_feature_t> hits;

  for (auto it = m_layers.rbegin(); it != m_layers.rend(); ++it)
  {
    const auto &spec = *it;
    if (!layer_ids.empty() && std::find(layer_ids.begin(), layer_ids.end(), spec.id) == layer_ids.end())
      continue;
    if (m_zoom < spec.min_zoom)
      continue;

    auto data = source(spec.source);
    if (!data)
      continue;

    for (auto feat = data->features.rbegin(); feat != data->features.rend(); ++feat)
    {
      if (draws_feature(spec, *feat) && feature_hit(spec, *feat, position))
        hits.push_back({spec.id, spec.source, *feat});
    }
  }
  return hits;
}

auto retained_surface_t::set_cursor(cursor_e cursor) -> void
{
  m_cursor = cursor;
}

auto retained_surface_t::cursor() const -> cursor_e
{
  return m_cursor;
}

// --- Markers ---

auto retained_surface_t::add_marker(const marker_spec_t &spec) -> marker_id_t
{
  require_usable("add_marker");
  auto id = m_next_marker_id++;
  m_markers.push_back({id, spec, false});
  return id;
}

auto retained_surface_t::remove_marker(marker_id_t id) -> void
{
  std::erase_if(m_markers, [id](const marker_t &m) { return m.id == id; });
}

auto retained_surface_t::toggle_marker_popup(marker_id_t id) -> void
{
  for (auto &marker : m_markers)
  {
    if (marker.id == id)
    {
      marker.popup_open = !marker.popup_open;
      return;
    }
  }
}

auto retained_surface_t::markers() const -> std::vector<marker_t>
{
  return m_markers;
}

// --- Popup ---

auto retained_surface_t::show_popup(geo_position_t anchor, popup_content_t content) -> void
{
  require_usable("show_popup");
  m_popup = popup_t{anchor, std::move(content)};
}

auto retained_surface_t::close_popup() -> void
{
  m_popup.reset();
}

auto retained_surface_t::popup() const -> std::optional<popup_t>
{
  return m_popup;
}

auto retained_surface_t::destroy() -> void
{
  if (m_destroyed)
    return;

  m_destroyed = true;
  m_listeners.clear();
  m_markers.clear();
  m_layers.clear();
  m_sources.clear();
  m_feature_state.clear();
  m_hovered_layers.clear();
  m_popup.reset();
  std::cout << "Surface: destroyed" << std::endl;
}

// --- Internals ---

auto retained_surface_t::require_usable(const char *operation) const -> void
{
  if (m_destroyed)
    throw surface_error_t(std::format("{}: surface has been destroyed", operation));
}

auto retained_surface_t::emit(map_event_e type, geo_position_t position) -> void
{
  std::vector<listener_id_t> ids;
  for (const auto &listener : m_listeners)
  {
    if (listener.type == type && listener.layer_id.empty())
      ids.push_back(listener.id);
  }

  for (auto id : ids)
  {
    auto it = std::find_if(m_listeners.begin(), m_listeners.end(), [id](const listener_t &l) { return l.id == id; });
    if (it == m_listeners.end())
      continue;

    auto handler = it->handler;
    if (it->once)
      m_listeners.erase(it);

    map_event_t event;
    event.type = type;
    event.position = position;
    handler(event);

    if (m_destroyed)
      return;
  }
}

auto retained_surface_t::emit_layer(map_event_e type, const std::string &layer_id, geo_position_t position, std::vector<rendered_feature_t> hits) -> void
{
  std::vector<listener_id_t> ids;
  for (const auto &listener : m_listeners)
  {
    if (listener.type == type && listener.layer_id == layer_id)
      ids.push_back(listener.id);
  }

  map_event_t event;
  event.type = type;
  event.position = position;
  event.features = std::move(hits);

  for (auto id : ids)
  {
    auto it = std::find_if(m_listeners.begin(), m_listeners.end(), [id](const listener_t &l) { return l.id == id; });
    if (it == m_listeners.end())
      continue;

    auto handler = it->handler;
    handler(event);

    if (m_destroyed)
      return;
  }
}

auto retained_surface_t::layers_with_listeners() const -> std::vector<std::string>
{
  std::vector<std::string> ids;
  for (const auto &listener : m_listeners)
  {
    if (listener.layer_id.empty() || listener.type == map_event_e::Click)
      continue;
    if (std::find(ids.begin(), ids.end(), listener.layer_id) == ids.end())
      ids.push_back(listener.layer_id);
  }
  return ids;
}

auto retained_surface_t::world_pixels(geo_position_t position) const -> std::pair<double, double>
{
  double wx = 0.0;
  double wy = 0.0;
  geo::lat_lon_to_world(position.lat, position.lon, wx, wy);
  double scale = TILE_SIZE * std::pow(2.0, m_zoom);
  return {wx * scale, wy * scale};
}

auto retained_surface_t::draws_feature(const layer_spec_t &spec, const feature_t &feature) const -> bool
{
  const auto &geometry = feature.geometry;
  switch (spec.filter.geometry)
  {
  case geometry_filter_e::Polygon:
    if (!geometry.is_polygonal())
      return false;
    break;
  case geometry_filter_e::LineOrPolygon:
    if (!geometry.is_linear() && !geometry.is_polygonal())
      return false;
    break;
  case geometry_filter_e::Point:
    if (!geometry.is_point_like())
      return false;
    break;
  case geometry_filter_e::NotPoint:
    if (geometry.is_point_like())
      return false;
    break;
  default:
    break;
  }

  if (spec.filter.property.empty())
    return true;

  auto value = geojson::property_string(feature.properties, spec.filter.property);
  return !value.empty() && std::find(spec.filter.values.begin(), spec.filter.values.end(), value) != spec.filter.values.end();
}

auto retained_surface_t::feature_hit(const layer_spec_t &spec, const feature_t &feature, geo_position_t position) const -> bool
{
  const auto &geometry = feature.geometry;

  switch (spec.kind)
  {
  case layer_kind_e::Fill:
  {
    if (!geometry.is_polygonal())
      return false;
    for (const auto &polygon : geometry.parts)
    {
      if (geometry_ops::point_in_polygon(position, polygon))
        return true;
    }
    return false;
  }
  case layer_kind_e::Line:
  {
    if (!geometry.is_linear() && !geometry.is_polygonal())
      return false;

    auto [px, py] = world_pixels(position);
    double reach = spec.paint.width * 0.5 + HIT_TOLERANCE_PX;
    for (const auto &part : geometry.parts)
    {
      for (const auto &ring : part)
      {
        for (size_t i = 0; i + 1 < ring.size(); ++i)
        {
          auto [ax, ay] = world_pixels(ring[i]);
          auto [bx, by] = world_pixels(ring[i + 1]);
          double dx = bx - ax;
          double dy = by - ay;
          double len_sq = dx * dx + dy * dy;
          double t = len_sq > 0.0 ? std::clamp(((px - ax) * dx + (py - ay) * dy) / len_sq, 0.0, 1.0) : 0.0;
          if (std::hypot(ax + t * dx - px, ay + t * dy - py) <= reach)
            return true;
        }
      }
    }
    return false;
  }
  case layer_kind_e::Circle:
  {
    if (!geometry.is_point_like())
      return false;

    auto [px, py] = world_pixels(position);
    double reach = spec.paint.width + spec.paint.outline_width + HIT_TOLERANCE_PX;
    for (const auto &part : geometry.parts)
    {
      for (const auto &ring : part)
      {
        for (const auto &p : ring)
        {
          auto [x, y] = world_pixels(p);
          if (std::hypot(x - px, y - py) <= reach)
            return true;
        }
      }
    }
    return false;
  }
  }
  return false;
}

} // namespace site_mapper
