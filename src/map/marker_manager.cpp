#include "map/marker_manager.hpp"
#include "core/geometry_ops.hpp"
#include "core/popup_content.hpp"

namespace site_mapper
{

marker_manager_t::~marker_manager_t()
{
  clear_all();
}

auto marker_manager_t::attach(map_surface_t *surface) -> void
{
  if (surface == m_surface)
    return;

  clear_all();
  m_surface = surface;
}

auto marker_manager_t::sync_sale_comps(const feature_collection_ptr &comps, bool visible) -> size_t
{
  return sync_comps(marker_domains::SALE_COMPS, comps, visible, palette::SALE_COMPS, &popups::sale_comp);
}

auto marker_manager_t::sync_rent_comps(const feature_collection_ptr &comps, bool visible) -> size_t
{
  return sync_comps(marker_domains::RENT_COMPS, comps, visible, palette::RENT_COMPS, &popups::rent_comp);
}

auto marker_manager_t::sync_subject(geo_position_t center) -> void
{
  clear(marker_domains::SUBJECT);
  if (!m_surface)
    return;

  marker_spec_t spec;
  spec.position = center;
  spec.color = palette::SUBJECT;
  spec.style = marker_style_e::Subject;
  spec.popup = popups::subject_property(center);
  m_markers[marker_domains::SUBJECT].push_back(m_surface->add_marker(spec));
}

auto marker_manager_t::clear(const std::string &domain) -> void
{
  auto it = m_markers.find(domain);
  if (it == m_markers.end())
    return;

  if (m_surface)
  {
    for (auto id : it->second)
      m_surface->remove_marker(id);
  }
  m_markers.erase(it);
}

auto marker_manager_t::clear_all() -> void
{
  while (!m_markers.empty())
    clear(m_markers.begin()->first);
}

auto marker_manager_t::count(const std::string &domain) const -> size_t
{
  auto it = m_markers.find(domain);
  return it == m_markers.end() ? 0 : it->second.size();
}

auto marker_manager_t::sync_comps(const std::string &domain, const feature_collection_ptr &comps, bool visible, color_t default_color,
                                  popup_content_t (*build_popup)(const nlohmann::json &)) -> size_t
{
  clear(domain);
  if (!m_surface || !visible || is_empty(comps))
    return 0;

  auto &ids = m_markers[domain];
  for (const auto &feature : comps->features)
  {
    auto anchor = geometry_ops::anchor_point(feature.geometry);
    if (!anchor)
      continue;

    marker_spec_t spec;
    spec.position = *anchor;
    spec.color = parse_hex_color(geojson::property_string(feature.properties, "color")).value_or(default_color);
    spec.style = marker_style_e::Pin;
    spec.popup = build_popup(feature.properties);
    ids.push_back(m_surface->add_marker(spec));
  }
  return ids.size();
}

} // namespace site_mapper
