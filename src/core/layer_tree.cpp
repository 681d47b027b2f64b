#include "core/layer_tree.hpp"
#include <utility>

namespace site_mapper
{

layer_tree_t::layer_tree_t(std::vector<layer_group_t> groups) : m_groups(std::move(groups))
{
}

auto layer_tree_t::make_default() -> layer_tree_t
{
  std::vector<layer_group_t> groups;

  groups.push_back({"project-boundary",
                    "Project Boundary",
                    true,
                    true,
                    {{layer_ids::SITE_BOUNDARY, "Site Boundary", true, std::nullopt},
                     {layer_ids::PLAN_PARCELS, "Plan Parcels", true, std::nullopt},
                     {layer_ids::TAX_PARCELS, "Tax Parcels", true, std::nullopt}}});

  groups.push_back({"location-intel", "Location Intelligence", true, true, {{layer_ids::DEMO_RINGS, "Demographic Rings", true, std::nullopt}}});

  groups.push_back({"comparables",
                    "Comparables",
                    true,
                    true,
                    {{layer_ids::SALE_COMPS, "Sale Comps", true, std::nullopt}, {layer_ids::RENT_COMPS, "Rent Comps", true, std::nullopt}}});

  groups.push_back({"annotations", "Annotations", true, true, {{layer_ids::DRAWN_SHAPES, "Drawn Shapes", true, std::nullopt}}});

  groups.push_back({"reference-parcels", "Reference Parcels", true, false, {{layer_ids::PARCEL_OVERLAY, "Parcel Overlay", true, std::nullopt}}});

  return layer_tree_t(std::move(groups));
}

auto layer_tree_t::is_visible(const std::string &item_id) const -> bool
{
  for (const auto &group : m_groups)
  {
    for (const auto &item : group.items)
    {
      if (item.id == item_id)
        return group.visible && item.visible;
    }
  }
  return false;
}

auto layer_tree_t::set_item_visible(const std::string &item_id, bool visible) -> bool
{
  auto *item = find_item_mutable(item_id);
  if (!item)
    return false;
  item->visible = visible;
  return true;
}

auto layer_tree_t::set_group_visible(const std::string &group_id, bool visible) -> bool
{
  for (auto &group : m_groups)
  {
    if (group.id == group_id)
    {
      group.visible = visible;
      return true;
    }
  }
  return false;
}

auto layer_tree_t::set_item_count(const std::string &item_id, std::optional<size_t> count) -> bool
{
  auto *item = find_item_mutable(item_id);
  if (!item)
    return false;
  item->count = count;
  return true;
}

auto layer_tree_t::find_item(const std::string &item_id) const -> const layer_item_t *
{
  for (const auto &group : m_groups)
    for (const auto &item : group.items)
      if (item.id == item_id)
        return &item;
  return nullptr;
}

auto layer_tree_t::find_group(const std::string &group_id) const -> const layer_group_t *
{
  for (const auto &group : m_groups)
    if (group.id == group_id)
      return &group;
  return nullptr;
}

auto layer_tree_t::find_item_mutable(const std::string &item_id) -> layer_item_t *
{
  for (auto &group : m_groups)
    for (auto &item : group.items)
      if (item.id == item_id)
        return &item;
  return nullptr;
}

} // namespace site_mapper
