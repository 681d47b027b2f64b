#pragma once

#include "core/geojson.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace site_mapper
{

struct popup_row_t
{
  std::string label;
  std::string value;
};

struct popup_table_t
{
  std::vector<std::string> columns;
  std::vector<std::vector<std::string>> rows;
};

// Structured popup body; the renderer decides how it looks
struct popup_content_t
{
  std::string title;
  std::vector<std::string> address_lines;
  std::vector<popup_row_t> rows; // Only rows with a value
  std::optional<popup_table_t> table;

  auto has_details() const -> bool
  {
    return !address_lines.empty() || !rows.empty() || (table && !table->rows.empty());
  }
};

namespace popups
{

// "123 Main St, Springfield, CA 90000" -> {"123 Main St", "Springfield, CA 90000"}
auto split_address_lines(const std::string &address) -> std::vector<std::string>;

// Identifier used when toggling tax parcels: parcel_id, tax_parcel_id,
// PARCELID, APN, then the feature id
auto tax_parcel_id(const feature_t &feature) -> std::string;

// Raw identifier of a reference parcel: the first non-empty field, then the
// feature id
auto reference_parcel_id(const feature_t &feature, const std::vector<std::string> &fields) -> std::string;

auto sale_comp(const nlohmann::json &properties) -> popup_content_t;
auto rent_comp(const nlohmann::json &properties) -> popup_content_t;
auto plan_parcel(const nlohmann::json &properties) -> popup_content_t;
auto tax_parcel(const feature_t &feature) -> popup_content_t;
auto reference_parcel(const nlohmann::json &properties) -> popup_content_t;
auto subject_property(geo_position_t center) -> popup_content_t;

} // namespace popups
} // namespace site_mapper
