#include "map/viewport_controller.hpp"
#include <iostream>

namespace site_mapper
{

viewport_controller_t::~viewport_controller_t()
{
  teardown();
}

auto viewport_controller_t::initialize(const surface_factory_t &factory, const viewport_t &viewport) -> bool
{
  if (m_surface)
    return false;

  m_surface = factory(viewport);
  if (!m_surface)
  {
    std::cerr << "Viewport: surface factory returned nothing" << std::endl;
    return false;
  }

  m_basemap = viewport.basemap;
  m_desired_basemap = viewport.basemap;
  m_desired_center = viewport.center;
  m_last_center.reset();

  m_listeners.push_back(m_surface->on(map_event_e::Load, [this](const map_event_t &) { handle_load(); }));
  m_listeners.push_back(m_surface->on(map_event_e::MoveEnd, [this](const map_event_t &) { emit_view_state(); }));
  m_listeners.push_back(m_surface->on(map_event_e::ZoomEnd, [this](const map_event_t &) { emit_view_state(); }));
  return true;
}

auto viewport_controller_t::set_basemap(const std::string &basemap) -> bool
{
  m_desired_basemap = basemap;
  return apply_basemap();
}

auto viewport_controller_t::set_center(geo_position_t center) -> bool
{
  m_desired_center = center;
  return apply_center();
}

auto viewport_controller_t::teardown() -> void
{
  if (!m_surface)
    return;

  for (auto id : m_listeners)
    m_surface->off(id);
  m_listeners.clear();

  if (m_style_load_listener != 0)
  {
    m_surface->off(m_style_load_listener);
    m_style_load_listener = 0;
  }
  m_tracker.cancel();

  m_surface->destroy();
  m_surface.reset();
  m_last_center.reset();
}

auto viewport_controller_t::current_view_state() const -> std::optional<view_state_t>
{
  if (!m_surface)
    return std::nullopt;
  return view_state_t{m_surface->center(), m_surface->zoom(), m_surface->bounds()};
}

auto viewport_controller_t::handle_load() -> void
{
  // Requests made while the initial style was loading
  apply_basemap();
  apply_center();

  emit_view_state();
  if (m_on_load)
    m_on_load();
}

auto viewport_controller_t::apply_basemap() -> bool
{
  if (!m_surface || !m_surface->is_loaded())
    return false;
  if (m_desired_basemap == m_basemap)
    return false;

  m_basemap = m_desired_basemap;

  // Last request wins: the previous swap's completion is dropped
  if (m_style_load_listener != 0)
    m_surface->off(m_style_load_listener);

  auto token = m_tracker.begin_request();
  m_surface->set_style(m_basemap);
  m_style_load_listener = m_surface->once(map_event_e::StyleLoad,
                                          [this, token](const map_event_t &)
                                          {
                                            m_style_load_listener = 0;
                                            m_tracker.complete(token);
                                          });
  return true;
}

auto viewport_controller_t::apply_center() -> bool
{
  if (!m_surface || !m_surface->is_loaded())
    return false;
  if (m_last_center && *m_last_center == m_desired_center)
    return false;

  m_surface->jump_to(m_desired_center);
  m_last_center = m_desired_center;
  return true;
}

auto viewport_controller_t::emit_view_state() -> void
{
  if (!m_on_view_state)
    return;
  if (auto state = current_view_state())
    m_on_view_state(*state);
}

} // namespace site_mapper
