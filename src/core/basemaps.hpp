#pragma once

#include <string>
#include <vector>

namespace site_mapper
{

// Raster tile sets a basemap is stacked from, bottom first
enum class tile_layer_e
{
  Streets,
  Imagery,
  ImageryLabels,
  Topo
};

struct basemap_t
{
  std::string id;
  std::string label;
  std::vector<tile_layer_e> layers;
};

namespace basemaps
{

// Ids accepted by set_basemap, in menu order
auto catalog() -> const std::vector<basemap_t> &;

// Aliases ("roadmap") resolve to their canonical entry; nullptr when unknown
auto find(const std::string &id) -> const basemap_t *;

auto layer_name(tile_layer_e layer) -> const char *;
auto max_zoom(tile_layer_e layer) -> int;

// XYZ tile url. Esri services take row before column.
auto tile_url(tile_layer_e layer, int z, int x, int y) -> std::string;

// Disk cache location relative to the working directory
auto cache_path(tile_layer_e layer, int z, int x, int y) -> std::string;

} // namespace basemaps
} // namespace site_mapper
