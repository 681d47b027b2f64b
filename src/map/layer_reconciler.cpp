#include "map/layer_reconciler.hpp"
#include <algorithm>
#include <iostream>

namespace site_mapper
{

auto reconcile_result_name(reconcile_result_e result) -> const char *
{
  switch (result)
  {
  case reconcile_result_e::NotReady:
    return "not-ready";
  case reconcile_result_e::Cleared:
    return "cleared";
  case reconcile_result_e::Rendered:
    return "rendered";
  }
  return "unknown";
}

layer_reconciler_t::layer_reconciler_t(interaction_router_t &router) : m_router(router)
{
}

auto layer_reconciler_t::matches_prefix(const std::string &id, const std::string &prefix) -> bool
{
  if (prefix.empty())
    return false;
  if (id == prefix)
    return true;
  return id.size() > prefix.size() + 1 && id.compare(0, prefix.size(), prefix) == 0 && id[prefix.size()] == '-';
}

auto layer_reconciler_t::reconcile(map_surface_t *surface, const domain_plan_t &plan, bool visible) -> reconcile_result_e
{
  if (!surface || !surface->is_style_loaded())
    return reconcile_result_e::NotReady;

  // 1. Listeners first, then layers, then sources
  remove_domain(*surface, plan.prefix);

  // 2. Nothing to draw
  bool has_data = std::any_of(plan.sources.begin(), plan.sources.end(), [](const source_plan_t &s) { return !is_empty(s.data); });
  if (!visible || !has_data)
    return reconcile_result_e::Cleared;

  // 3. Sources; empty ones are skipped along with their layers
  for (const auto &source : plan.sources)
  {
    if (is_empty(source.data))
      continue;
    if (!matches_prefix(source.id, plan.prefix))
      std::cerr << "Reconciler: source " << source.id << " is outside domain " << plan.prefix << std::endl;
    surface->add_source(source.id, source.data);
  }

  // 4. Layers in plan order
  for (const auto &layer : plan.layers)
  {
    if (!surface->has_source(layer.source))
      continue;
    if (!matches_prefix(layer.id, plan.prefix))
      std::cerr << "Reconciler: layer " << layer.id << " is outside domain " << plan.prefix << std::endl;
    surface->add_layer(layer);
  }

  // 5. Interactions, remembered so the next pass can release them
  auto &listeners = m_listeners[plan.prefix];
  for (const auto &binding : plan.bindings)
  {
    if (!surface->has_layer(binding.layer_id))
      continue;
    auto ids = m_router.bind(binding);
    listeners.insert(listeners.end(), ids.begin(), ids.end());
  }

  // 6. Keep overlays above this domain
  for (const auto &layer_id : plan.raise)
  {
    if (surface->has_layer(layer_id))
      surface->move_layer(layer_id);
  }

  return reconcile_result_e::Rendered;
}

auto layer_reconciler_t::clear(map_surface_t *surface, const std::string &prefix) -> reconcile_result_e
{
  if (!surface || !surface->is_style_loaded())
    return reconcile_result_e::NotReady;

  remove_domain(*surface, prefix);
  return reconcile_result_e::Cleared;
}

auto layer_reconciler_t::forget_all() -> void
{
  m_listeners.clear();
}

auto layer_reconciler_t::listener_count(const std::string &prefix) const -> size_t
{
  auto it = m_listeners.find(prefix);
  return it == m_listeners.end() ? 0 : it->second.size();
}

auto layer_reconciler_t::remove_domain(map_surface_t &surface, const std::string &prefix) -> void
{
  auto it = m_listeners.find(prefix);
  if (it != m_listeners.end())
  {
    m_router.unbind(it->second);
    m_listeners.erase(it);
  }

  for (const auto &layer_id : surface.layer_ids())
  {
    if (matches_prefix(layer_id, prefix))
      surface.remove_layer(layer_id);
  }

  for (const auto &source_id : surface.source_ids())
  {
    if (matches_prefix(source_id, prefix))
      surface.remove_source(source_id);
  }
}

} // namespace site_mapper
