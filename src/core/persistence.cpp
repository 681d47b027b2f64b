#include "core/persistence.hpp"
#include "core/geojson.hpp"
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace site_mapper
{
namespace persistence
{

namespace
{

auto read_json(const std::string &filename, json &out) -> bool
{
  std::ifstream file(filename);
  if (!file.is_open())
  {
    return false;
  }

  try
  {
    file >> out;
  }
  catch (const json::parse_error &e)
  {
    std::cerr << "JSON Parse Error in " << filename << ": " << e.what() << std::endl;
    return false;
  }
  return true;
}

auto write_json(const std::string &filename, const json &j) -> bool
{
  std::ofstream file(filename);
  if (!file.is_open())
  {
    std::cerr << "Persistence: cannot write " << filename << std::endl;
    return false;
  }

  file << j.dump(4);
  return true;
}

auto optional_number(const json &j, const char *key) -> std::optional<double>
{
  if (!j.contains(key))
    return std::nullopt;
  return geojson::property_number(j, key);
}

auto string_list(const json &j, const char *key, std::vector<std::string> &out) -> void
{
  if (!j.contains(key) || !j[key].is_array())
    return;

  out.clear();
  for (const auto &item : j[key])
  {
    if (item.is_string())
      out.push_back(item.get<std::string>());
  }
}

} // namespace

auto load_annotations(const std::string &filename, std::vector<map_feature_t> &features) -> bool
{
  json j;
  if (!read_json(filename, j))
    return false;

  auto collection = geojson::parse_collection(j);

  features.clear();
  for (auto &feature : collection.features)
  {
    if (feature.id.empty())
    {
      std::cerr << "Annotations: skipping feature without id" << std::endl;
      continue;
    }

    map_feature_t annotation;
    annotation.id = feature.id;
    annotation.geometry = std::move(feature.geometry);
    annotation.label = geojson::property_string(feature.properties, "label");
    annotation.category = geojson::property_string(feature.properties, "category");
    features.push_back(std::move(annotation));
  }

  std::cout << "Annotations: loaded " << features.size() << " from " << filename << std::endl;
  return true;
}

auto save_workspace(const std::string &filename, const workspace_t &workspace) -> bool
{
  json j;

  j["project"] = {{"lat", workspace.project.lat ? json(*workspace.project.lat) : json(nullptr)},
                  {"lon", workspace.project.lon ? json(*workspace.project.lon) : json(nullptr)},
                  {"zoom", workspace.project.zoom},
                  {"basemap", workspace.project.basemap}};

  j["parcels"] = {{"subject_id", workspace.parcels.subject_id},
                  {"comp_ids", workspace.parcels.comp_ids},
                  {"id_fields", workspace.parcels.id_fields},
                  {"min_zoom", workspace.parcels.min_zoom}};

  j["rings"] = {{"radii_miles", workspace.rings.radii_miles}, {"selected_miles", workspace.rings.selected_miles}};

  j["layers"] = json::object();
  for (const auto &[id, visible] : workspace.layers)
    j["layers"][id] = visible;

  j["data"] = {{"plan_parcels", workspace.data.plan_parcels},
               {"project_boundary", workspace.data.project_boundary},
               {"tax_parcels", workspace.data.tax_parcels},
               {"sale_comps", workspace.data.sale_comps},
               {"rent_comps", workspace.data.rent_comps},
               {"reference_parcels", workspace.data.reference_parcels},
               {"annotations", workspace.data.annotations}};

  return write_json(filename, j);
}

auto load_workspace(const std::string &filename, workspace_t &workspace) -> bool
{
  json j;
  if (!read_json(filename, j))
    return false;

  if (!j.is_object())
  {
    std::cerr << "Workspace: " << filename << " is not a JSON object" << std::endl;
    return false;
  }

  try
  {
    if (j.contains("project") && j["project"].is_object())
    {
      const auto &project = j["project"];
      // Project records carry coordinates as numbers or strings
      workspace.project.lat = optional_number(project, "lat");
      workspace.project.lon = optional_number(project, "lon");
      workspace.project.zoom = project.value("zoom", DEFAULT_ZOOM);
      workspace.project.basemap = project.value("basemap", DEFAULT_BASEMAP);
    }

    if (j.contains("parcels") && j["parcels"].is_object())
    {
      const auto &parcels = j["parcels"];
      workspace.parcels.subject_id = geojson::property_string(parcels, "subject_id");
      string_list(parcels, "comp_ids", workspace.parcels.comp_ids);
      string_list(parcels, "id_fields", workspace.parcels.id_fields);
      if (workspace.parcels.id_fields.empty())
        workspace.parcels.id_fields = DEFAULT_PARCEL_ID_FIELDS;
      workspace.parcels.min_zoom = parcels.value("min_zoom", DEFAULT_PARCEL_MIN_ZOOM);
    }

    if (j.contains("rings") && j["rings"].is_object())
    {
      const auto &rings = j["rings"];
      if (rings.contains("radii_miles") && rings["radii_miles"].is_array())
      {
        workspace.rings.radii_miles.clear();
        for (const auto &item : rings["radii_miles"])
        {
          if (item.is_number() && item.get<double>() > 0.0)
            workspace.rings.radii_miles.push_back(item.get<double>());
        }
      }
      workspace.rings.selected_miles = rings.value("selected_miles", 0.0);
    }

    if (j.contains("layers") && j["layers"].is_object())
    {
      workspace.layers.clear();
      for (const auto &[id, visible] : j["layers"].items())
      {
        if (visible.is_boolean())
          workspace.layers[id] = visible.get<bool>();
      }
    }

    if (j.contains("data") && j["data"].is_object())
    {
      const auto &data = j["data"];
      workspace.data.plan_parcels = data.value("plan_parcels", "");
      workspace.data.project_boundary = data.value("project_boundary", "");
      workspace.data.tax_parcels = data.value("tax_parcels", "");
      workspace.data.sale_comps = data.value("sale_comps", "");
      workspace.data.rent_comps = data.value("rent_comps", "");
      workspace.data.reference_parcels = data.value("reference_parcels", "");
      workspace.data.annotations = data.value("annotations", "");
    }
  }
  catch (const json::type_error &e)
  {
    std::cerr << "Workspace: bad value in " << filename << ": " << e.what() << std::endl;
    return false;
  }

  std::cout << "Workspace: loaded " << filename << std::endl;
  return true;
}

auto apply_layers(const workspace_t &workspace, layer_tree_t &tree) -> void
{
  for (const auto &[id, visible] : workspace.layers)
  {
    if (!tree.set_group_visible(id, visible) && !tree.set_item_visible(id, visible))
      std::cerr << "Workspace: unknown layer " << id << std::endl;
  }
}

auto capture_layers(const layer_tree_t &tree, workspace_t &workspace) -> void
{
  workspace.layers.clear();
  for (const auto &group : tree.get_groups())
  {
    workspace.layers[group.id] = group.visible;
    for (const auto &item : group.items)
      workspace.layers[item.id] = item.visible;
  }
}

} // namespace persistence
} // namespace site_mapper
