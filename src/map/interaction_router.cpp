#include "map/interaction_router.hpp"
#include "map/draw_session.hpp"
#include <algorithm>

namespace site_mapper
{

auto tool_cursor(active_tool_e tool) -> cursor_e
{
  switch (tool)
  {
  case active_tool_e::Point:
  case active_tool_e::Line:
  case active_tool_e::Polygon:
    return cursor_e::Crosshair;
  case active_tool_e::Edit:
    return cursor_e::Move;
  case active_tool_e::Delete:
    return cursor_e::NotAllowed;
  default:
    return cursor_e::Default;
  }
}

interaction_router_t::~interaction_router_t()
{
  detach();
}

auto interaction_router_t::attach(map_surface_t *surface) -> void
{
  if (surface == m_surface)
    return;

  detach();
  m_surface = surface;
  if (!m_surface)
    return;

  m_map_click_listener = m_surface->on(map_event_e::Click, [this](const map_event_t &event) { handle_map_click(event); });
  apply_cursor();
}

auto interaction_router_t::detach() -> void
{
  if (!m_surface)
    return;

  for (auto &[layer_id, bound] : m_bindings)
  {
    for (auto id : bound.listeners)
      m_surface->off(id);
  }
  if (m_map_click_listener != 0)
    m_surface->off(m_map_click_listener);

  m_map_click_listener = 0;
  m_bindings.clear();
  m_hover_slots.clear();
  m_pointer_layers.clear();
  m_surface = nullptr;
}

auto interaction_router_t::set_active_tool(active_tool_e tool) -> void
{
  m_tool = tool;
  apply_cursor();
}

auto interaction_router_t::bind(const interaction_binding_t &binding) -> std::vector<listener_id_t>
{
  std::vector<listener_id_t> ids;
  if (!m_surface || binding.layer_id.empty())
    return ids;

  const std::string layer_id = binding.layer_id;

  ids.push_back(m_surface->on(map_event_e::MouseEnter, layer_id, [this, layer_id](const map_event_t &) { handle_enter(layer_id); }));
  ids.push_back(m_surface->on(map_event_e::MouseLeave, layer_id, [this, layer_id](const map_event_t &) { handle_leave(layer_id); }));

  if (binding.hover_state)
    ids.push_back(m_surface->on(map_event_e::MouseMove, layer_id, [this, layer_id](const map_event_t &event) { handle_hover_move(layer_id, event); }));

  if (binding.action != interaction_e::None || binding.popup)
    ids.push_back(m_surface->on(map_event_e::Click, layer_id, [this, layer_id](const map_event_t &event) { handle_layer_click(layer_id, event); }));

  auto &bound = m_bindings[layer_id];
  bound.binding = binding;
  bound.listeners.insert(bound.listeners.end(), ids.begin(), ids.end());
  return ids;
}

auto interaction_router_t::unbind(const std::vector<listener_id_t> &listener_ids) -> void
{
  if (!m_surface)
    return;

  for (auto id : listener_ids)
    m_surface->off(id);

  for (auto it = m_bindings.begin(); it != m_bindings.end();)
  {
    auto &listeners = it->second.listeners;
    std::erase_if(listeners, [&listener_ids](listener_id_t id) { return std::find(listener_ids.begin(), listener_ids.end(), id) != listener_ids.end(); });

    if (!listeners.empty())
    {
      ++it;
      continue;
    }

    const auto layer_id = it->first;
    it = m_bindings.erase(it);
    clear_hover(layer_id);
    if (m_pointer_layers.erase(layer_id) > 0 && m_pointer_layers.empty())
      apply_cursor();
  }
}

auto interaction_router_t::hovered_feature(const std::string &layer_id) const -> std::optional<std::string>
{
  auto it = m_hover_slots.find(layer_id);
  if (it == m_hover_slots.end())
    return std::nullopt;
  return it->second.feature_id;
}

auto interaction_router_t::handle_map_click(const map_event_t &event) -> void
{
  if (is_draw_tool(m_tool))
  {
    if (m_draw_session)
      m_draw_session->add_vertex(event.position);
    return;
  }

  // Clicks that land on an interactive layer belong to that layer
  auto absorbing = absorbing_layers();
  if (m_surface && !absorbing.empty() && !m_surface->query_rendered_features(event.position, absorbing).empty())
    return;

  if (m_callbacks.on_map_click)
    m_callbacks.on_map_click(event.position);
}

auto interaction_router_t::handle_layer_click(const std::string &layer_id, const map_event_t &event) -> void
{
  auto it = m_bindings.find(layer_id);
  if (it == m_bindings.end() || event.features.empty() || !m_surface)
    return;

  const auto &binding = it->second.binding;
  const auto &hit = event.features.front();

  switch (binding.action)
  {
  case interaction_e::FeatureClick:
  {
    if (is_draw_tool(m_tool))
      return;

    auto feature_id = geojson::property_string(hit.feature.properties, "id");
    if (feature_id.empty())
      feature_id = hit.feature.id;

    auto match = std::find_if(m_annotations.begin(), m_annotations.end(), [&feature_id](const map_feature_t &f) { return f.id == feature_id; });
    if (match != m_annotations.end() && m_callbacks.on_feature_click)
      m_callbacks.on_feature_click(*match);
    return;
  }
  case interaction_e::ParcelToggle:
  {
    if (is_draw_tool(m_tool))
      return;

    auto parcel_id = binding.id_fields.empty() ? popups::tax_parcel_id(hit.feature) : popups::reference_parcel_id(hit.feature, binding.id_fields);

    // Without an identifier there is nothing to toggle, the popup still shows
    if (!parcel_id.empty() && m_callbacks.on_parcel_toggle)
    {
      feature_t toggled = hit.feature;
      toggled.id = parcel_id;
      m_callbacks.on_parcel_toggle(toggled);
    }
    break;
  }
  case interaction_e::RingClick:
  {
    if (m_tool != active_tool_e::None)
      return;
    if (m_callbacks.on_ring_click)
      m_callbacks.on_ring_click(binding.ring_radius, event.position);
    break;
  }
  case interaction_e::Popup:
    if (is_draw_tool(m_tool))
      return;
    break;
  default:
    break;
  }

  // The callback may have torn the binding down
  it = m_bindings.find(layer_id);
  if (it != m_bindings.end() && it->second.binding.popup && m_surface)
    m_surface->show_popup(event.position, it->second.binding.popup(hit));
}

auto interaction_router_t::handle_enter(const std::string &layer_id) -> void
{
  m_pointer_layers.insert(layer_id);
  if (m_surface && m_tool == active_tool_e::None)
    m_surface->set_cursor(cursor_e::Pointer);
}

auto interaction_router_t::handle_leave(const std::string &layer_id) -> void
{
  m_pointer_layers.erase(layer_id);
  clear_hover(layer_id);

  // Still over another interactive layer
  if (!m_pointer_layers.empty() && m_tool == active_tool_e::None)
    return;
  apply_cursor();
}

auto interaction_router_t::handle_hover_move(const std::string &layer_id, const map_event_t &event) -> void
{
  if (!m_surface || event.features.empty())
    return;

  const auto &hit = event.features.front();
  if (hit.feature.id.empty())
    return;

  auto slot = m_hover_slots.find(layer_id);
  if (slot != m_hover_slots.end())
  {
    if (slot->second.feature_id == hit.feature.id && slot->second.source_id == hit.source_id)
      return;

    // Clear the previous highlight before setting the next one
    if (m_surface->has_source(slot->second.source_id))
      m_surface->set_feature_state(slot->second.source_id, slot->second.feature_id, "hover", false);
  }

  m_hover_slots[layer_id] = {hit.source_id, hit.feature.id};
  m_surface->set_feature_state(hit.source_id, hit.feature.id, "hover", true);
}

auto interaction_router_t::clear_hover(const std::string &layer_id) -> void
{
  auto slot = m_hover_slots.find(layer_id);
  if (slot == m_hover_slots.end())
    return;

  if (m_surface && m_surface->has_source(slot->second.source_id))
    m_surface->set_feature_state(slot->second.source_id, slot->second.feature_id, "hover", false);
  m_hover_slots.erase(slot);
}

auto interaction_router_t::absorbing_layers() const -> std::vector<std::string>
{
  std::vector<std::string> ids;
  for (const auto &[layer_id, bound] : m_bindings)
  {
    const auto &binding = bound.binding;
    if (binding.action == interaction_e::None && !binding.popup)
      continue;
    if (binding.action == interaction_e::RingClick && m_tool != active_tool_e::None)
      continue;
    ids.push_back(layer_id);
  }
  return ids;
}

auto interaction_router_t::apply_cursor() -> void
{
  if (!m_surface)
    return;

  if (m_tool == active_tool_e::None && !m_pointer_layers.empty())
    m_surface->set_cursor(cursor_e::Pointer);
  else
    m_surface->set_cursor(tool_cursor(m_tool));
}

} // namespace site_mapper
