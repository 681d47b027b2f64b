#pragma once

#include <optional>
#include <string>
#include <vector>

namespace site_mapper
{

struct layer_item_t
{
  std::string id;
  std::string label;
  bool visible = true;
  std::optional<size_t> count; // Feature count shown next to the label
};

struct layer_group_t
{
  std::string id;
  std::string label;
  bool visible = true;
  bool expanded = true;
  std::vector<layer_item_t> items;
};

// Visibility tree shown in the layer panel. The map core only reads the
// visibility flags; an item is effectively visible when both it and its group
// are visible.
class layer_tree_t
{
public:
  layer_tree_t() = default;
  explicit layer_tree_t(std::vector<layer_group_t> groups);

  static auto make_default() -> layer_tree_t;

  auto is_visible(const std::string &item_id) const -> bool;

  auto set_item_visible(const std::string &item_id, bool visible) -> bool;
  auto set_group_visible(const std::string &group_id, bool visible) -> bool;
  auto set_item_count(const std::string &item_id, std::optional<size_t> count) -> bool;

  auto find_item(const std::string &item_id) const -> const layer_item_t *;
  auto find_group(const std::string &group_id) const -> const layer_group_t *;

  auto get_groups() const -> const std::vector<layer_group_t> &
  {
    return m_groups;
  }
  auto get_groups() -> std::vector<layer_group_t> &
  {
    return m_groups;
  }

private:
  auto find_item_mutable(const std::string &item_id) -> layer_item_t *;

  std::vector<layer_group_t> m_groups;
};

namespace layer_ids
{
inline constexpr const char *SITE_BOUNDARY = "site-boundary";
inline constexpr const char *PLAN_PARCELS = "plan-parcels";
inline constexpr const char *TAX_PARCELS = "tax-parcels";
inline constexpr const char *DEMO_RINGS = "demo-rings";
inline constexpr const char *SALE_COMPS = "sale-comps";
inline constexpr const char *RENT_COMPS = "rent-comps";
inline constexpr const char *DRAWN_SHAPES = "drawn-shapes";
inline constexpr const char *PARCEL_OVERLAY = "parcel-overlay";
} // namespace layer_ids

} // namespace site_mapper
