#include "core/basemaps.hpp"
#include <format>

namespace site_mapper
{
namespace basemaps
{

auto catalog() -> const std::vector<basemap_t> &
{
  static const std::vector<basemap_t> entries = {
      {"satellite", "Satellite", {tile_layer_e::Imagery}},
      {"hybrid", "Hybrid", {tile_layer_e::Imagery, tile_layer_e::ImageryLabels}},
      {"streets", "Streets", {tile_layer_e::Streets}},
      {"terrain", "Terrain", {tile_layer_e::Topo}},
  };
  return entries;
}

auto find(const std::string &id) -> const basemap_t *
{
  std::string key = id == "roadmap" ? "streets" : id;
  for (const auto &entry : catalog())
  {
    if (entry.id == key)
      return &entry;
  }
  return nullptr;
}

auto layer_name(tile_layer_e layer) -> const char *
{
  switch (layer)
  {
  case tile_layer_e::Streets:
    return "streets";
  case tile_layer_e::Imagery:
    return "imagery";
  case tile_layer_e::ImageryLabels:
    return "imagery-labels";
  case tile_layer_e::Topo:
    return "topo";
  }
  return "unknown";
}

auto max_zoom(tile_layer_e layer) -> int
{
  switch (layer)
  {
  case tile_layer_e::Streets:
    return 19;
  case tile_layer_e::Topo:
    return 17;
  default:
    return 19;
  }
}

auto tile_url(tile_layer_e layer, int z, int x, int y) -> std::string
{
  switch (layer)
  {
  case tile_layer_e::Streets:
    return std::format("https://tile.openstreetmap.org/{}/{}/{}.png", z, x, y);
  case tile_layer_e::Imagery:
    return std::format("https://server.arcgisonline.com/ArcGIS/rest/services/World_Imagery/MapServer/tile/{}/{}/{}", z, y, x);
  case tile_layer_e::ImageryLabels:
    return std::format("https://server.arcgisonline.com/ArcGIS/rest/services/Reference/World_Boundaries_and_Places/MapServer/tile/{}/{}/{}", z, y,
                       x);
  case tile_layer_e::Topo:
    return std::format("https://tile.opentopomap.org/{}/{}/{}.png", z, x, y);
  }
  return {};
}

auto cache_path(tile_layer_e layer, int z, int x, int y) -> std::string
{
  return std::format(".cache/tiles/{}/{}_{}_{}.png", layer_name(layer), z, x, y);
}

} // namespace basemaps
} // namespace site_mapper
