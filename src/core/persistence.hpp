#pragma once

#include "core/geometry_classifier.hpp"
#include "core/layer_tree.hpp"
#include "core/map_types.hpp"
#include "core/ring_generator.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace site_mapper
{
namespace persistence
{

// Annotations supplied with the project, read from a GeoJSON FeatureCollection.
// Drawn shapes live in memory only and are never written back.
auto load_annotations(const std::string &filename, std::vector<map_feature_t> &features) -> bool;

struct workspace_t
{
  struct project_t
  {
    // Missing or unusable coordinates fall back to DEFAULT_CENTER
    std::optional<double> lat;
    std::optional<double> lon;
    double zoom = DEFAULT_ZOOM;
    std::string basemap = DEFAULT_BASEMAP;
  } project;

  struct parcels_t
  {
    std::string subject_id;
    std::vector<std::string> comp_ids;
    std::vector<std::string> id_fields = DEFAULT_PARCEL_ID_FIELDS;
    double min_zoom = DEFAULT_PARCEL_MIN_ZOOM;
  } parcels;

  struct rings_t
  {
    std::vector<double> radii_miles = DEFAULT_RING_RADII_MILES;
    double selected_miles = 0.0;
  } rings;

  // Group and item ids of the layer tree
  std::map<std::string, bool> layers;

  // GeoJSON files, relative to the working directory. Empty to skip.
  struct data_t
  {
    std::string plan_parcels;
    std::string project_boundary;
    std::string tax_parcels;
    std::string sale_comps;
    std::string rent_comps;
    std::string reference_parcels;
    std::string annotations;
  } data;

  auto center() const -> geo_position_t
  {
    return resolve_project_center(project.lat, project.lon);
  }
};

auto save_workspace(const std::string &filename, const workspace_t &workspace) -> bool;
auto load_workspace(const std::string &filename, workspace_t &workspace) -> bool;

// Copy visibility between the workspace and a layer tree. Unknown ids are ignored.
auto apply_layers(const workspace_t &workspace, layer_tree_t &tree) -> void;
auto capture_layers(const layer_tree_t &tree, workspace_t &workspace) -> void;

} // namespace persistence
} // namespace site_mapper
