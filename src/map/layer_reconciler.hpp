#pragma once

#include "core/geojson.hpp"
#include "map/interaction_router.hpp"
#include "renderer/map_surface.hpp"
#include <map>
#include <string>
#include <vector>

namespace site_mapper
{

enum class reconcile_result_e
{
  NotReady, // No surface, or a style is still loading. Retry later.
  Cleared,  // Hidden or nothing to draw; the domain is gone from the surface
  Rendered
};

auto reconcile_result_name(reconcile_result_e result) -> const char *;

struct source_plan_t
{
  std::string id;
  feature_collection_ptr data;
};

// Everything one data domain should have on the surface. Every source and
// layer id must equal the prefix or start with "prefix-".
struct domain_plan_t
{
  std::string prefix;
  std::vector<source_plan_t> sources;
  std::vector<layer_spec_t> layers; // Paint order: fills, strokes, emphasis last
  std::vector<interaction_binding_t> bindings;
  std::vector<std::string> raise; // Moved to the top when present, in order
};

// Brings one domain's sources, layers and listeners on the surface in line
// with a plan. Each pass removes everything the domain owns before adding,
// so repeated passes never hit a duplicate id and never stack listeners.
class layer_reconciler_t
{
public:
  explicit layer_reconciler_t(interaction_router_t &router);

  auto reconcile(map_surface_t *surface, const domain_plan_t &plan, bool visible) -> reconcile_result_e;

  // Remove a domain from the surface
  auto clear(map_surface_t *surface, const std::string &prefix) -> reconcile_result_e;

  // Drop recorded listener ids without touching a surface (it is gone)
  auto forget_all() -> void;

  auto listener_count(const std::string &prefix) const -> size_t;

  static auto matches_prefix(const std::string &id, const std::string &prefix) -> bool;

private:
  auto remove_domain(map_surface_t &surface, const std::string &prefix) -> void;

  interaction_router_t &m_router;
  std::map<std::string, std::vector<listener_id_t>> m_listeners; // By prefix
};

} // namespace site_mapper
