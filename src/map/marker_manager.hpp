#pragma once

#include "core/geojson.hpp"
#include "renderer/map_surface.hpp"
#include <map>
#include <string>
#include <vector>

namespace site_mapper
{

namespace marker_domains
{
inline constexpr const char *SALE_COMPS = "sale-comps";
inline constexpr const char *RENT_COMPS = "rent-comps";
inline constexpr const char *SUBJECT = "subject";
} // namespace marker_domains

// Point overlays with popups, one list per domain. Every sync removes the
// markers the domain created last time before adding new ones.
class marker_manager_t
{
public:
  marker_manager_t() = default;
  ~marker_manager_t();

  marker_manager_t(const marker_manager_t &) = delete;
  auto operator=(const marker_manager_t &) -> marker_manager_t & = delete;

  auto attach(map_surface_t *surface) -> void;

  // Returns the number of markers placed. Features without a usable anchor
  // (lines, degenerate or self-intersecting polygons) are skipped.
  auto sync_sale_comps(const feature_collection_ptr &comps, bool visible) -> size_t;
  auto sync_rent_comps(const feature_collection_ptr &comps, bool visible) -> size_t;
  auto sync_subject(geo_position_t center) -> void;

  auto clear(const std::string &domain) -> void;

  // Idempotent; used by teardown
  auto clear_all() -> void;

  auto count(const std::string &domain) const -> size_t;

private:
  auto sync_comps(const std::string &domain, const feature_collection_ptr &comps, bool visible, color_t default_color,
                  popup_content_t (*build_popup)(const nlohmann::json &)) -> size_t;

  map_surface_t *m_surface = nullptr;
  std::map<std::string, std::vector<marker_id_t>> m_markers;
};

} // namespace site_mapper
