#include "core/popup_content.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <set>

using json = nlohmann::json;

namespace site_mapper
{
namespace popups
{

namespace
{

auto add_row(popup_content_t &content, const char *label, const std::string &value) -> void
{
  if (!value.empty())
    content.rows.push_back({label, value});
}

auto positive(const json &props, const char *key) -> std::optional<double>
{
  auto value = geojson::property_number(props, key);
  if (value && *value > 0.0)
    return value;
  return std::nullopt;
}

auto money(std::optional<double> value) -> std::string
{
  return value ? std::format("${:.0f}", *value) : std::string();
}

auto fixed(std::optional<double> value, int digits) -> std::string
{
  return value ? std::format("{:.{}f}", *value, digits) : std::string();
}

auto whole(std::optional<double> value) -> std::string
{
  return value ? std::format("{:.0f}", std::round(*value)) : std::string();
}

// Assessor attributes nest the interesting fields when present
auto resolve_parcel_props(const json &props) -> const json &
{
  if (props.is_object() && props.contains("assessor_attrs") && props["assessor_attrs"].is_object())
    return props["assessor_attrs"];
  return props;
}

} // namespace

auto split_address_lines(const std::string &address) -> std::vector<std::string>
{
  std::vector<std::string> lines;
  auto trim = [](std::string s)
  {
    s.erase(0, s.find_first_not_of(" \t"));
    s.erase(s.find_last_not_of(" \t") + 1);
    return s;
  };

  auto text = trim(address);
  if (text.empty())
    return lines;

  auto comma = text.find(',');
  if (comma == std::string::npos)
  {
    lines.push_back(text);
    return lines;
  }

  lines.push_back(trim(text.substr(0, comma)));
  auto rest = trim(text.substr(comma + 1));
  if (!rest.empty())
    lines.push_back(rest);
  return lines;
}

auto tax_parcel_id(const feature_t &feature) -> std::string
{
  auto id = geojson::first_property_string(feature.properties, {"parcel_id", "tax_parcel_id", "PARCELID", "APN"});
  return id.empty() ? feature.id : id;
}

auto reference_parcel_id(const feature_t &feature, const std::vector<std::string> &fields) -> std::string
{
  for (const auto &field : fields)
  {
    auto value = geojson::property_string(feature.properties, field);
    if (!value.empty())
      return value;
  }
  return feature.id;
}

auto sale_comp(const json &props) -> popup_content_t
{
  popup_content_t content;
  auto name = geojson::property_string(props, "name");
  content.title = name.empty() ? "Sale Comp" : "Sale Comp: " + name;

  add_row(content, "Price", money(positive(props, "price")));
  add_row(content, "$/Unit", money(positive(props, "price_per_unit")));
  add_row(content, "Date", geojson::property_string(props, "date"));
  add_row(content, "Type", geojson::property_string(props, "type"));
  return content;
}

auto rent_comp(const json &props) -> popup_content_t
{
  popup_content_t content;
  auto name = geojson::property_string(props, "name");
  content.title = name.empty() ? "Rent Comp" : "Rent Comp: " + name;
  content.address_lines = split_address_lines(geojson::property_string(props, "address"));

  auto distance = positive(props, "distance_miles");
  add_row(content, "Distance", distance ? std::format("{:.2f} mi", *distance) : std::string());
  add_row(content, "Year Built", whole(positive(props, "year_built")));
  add_row(content, "Units", whole(positive(props, "total_units")));

  if (props.is_object() && props.contains("floorplans") && props["floorplans"].is_array())
  {
    popup_table_t table;
    table.columns = {"Unit Type", "Bed", "Bath", "SF", "Rent"};
    for (const auto &plan : props["floorplans"])
    {
      if (!plan.is_object())
        continue;

      auto baths = geojson::property_number(plan, "bathrooms");
      std::string bath_text;
      if (baths)
        bath_text = *baths == std::floor(*baths) ? std::format("{:.0f}", *baths) : std::format("{}", *baths);

      auto rent = geojson::property_number(plan, "asking_rent");
      if (!rent)
        rent = geojson::property_number(plan, "effective_rent");

      table.rows.push_back({geojson::property_string(plan, "unit_type"), whole(geojson::property_number(plan, "bedrooms")), bath_text,
                            whole(geojson::property_number(plan, "avg_sqft")), money(rent)});
    }
    content.table = std::move(table);
  }
  return content;
}

auto plan_parcel(const json &props) -> popup_content_t
{
  popup_content_t content;
  content.title = "Plan Parcel";

  add_row(content, "Parcel", geojson::property_string(props, "parcel_id"));
  add_row(content, "Name", geojson::property_string(props, "parcel_name"));
  add_row(content, "Area", geojson::property_string(props, "area_name"));
  add_row(content, "Phase", geojson::property_string(props, "phase_name"));
  add_row(content, "Gross Acres", fixed(geojson::property_number(props, "gross_acres"), 2));
  add_row(content, "Net Acres", fixed(geojson::property_number(props, "net_acres"), 2));

  auto confidence = geojson::property_number(props, "confidence");
  add_row(content, "Confidence", confidence ? std::format("{:.0f}%", *confidence * 100.0) : std::string());
  add_row(content, "Product", geojson::property_string(props, "land_use_product"));
  return content;
}

auto tax_parcel(const feature_t &feature) -> popup_content_t
{
  const auto parcel_id = tax_parcel_id(feature);
  const auto &props = resolve_parcel_props(feature.properties);

  popup_content_t content;
  content.title = parcel_id.empty() ? "Parcel" : "Parcel " + parcel_id;
  content.address_lines = split_address_lines(geojson::first_property_string(props, {"address", "SITUS_ADDRESS", "SITEADDRESS"}));

  add_row(content, "Parcel ID", parcel_id);
  add_row(content, "Owner", geojson::first_property_string(props, {"owner", "OWNER_NAME", "OWNERNME1"}));

  auto acres_text = geojson::first_property_string(props, {"acres", "ACRES", "GROSSAC"});
  if (!acres_text.empty())
  {
    auto acres = geojson::property_number(json{{"v", acres_text}}, "v");
    add_row(content, "Acres", acres ? std::format("{:.2f}", *acres) : acres_text);
  }
  add_row(content, "Use Code", geojson::first_property_string(props, {"use_code", "USE_CODE", "USECD"}));
  add_row(content, "Use Desc", geojson::first_property_string(props, {"use_desc", "USE_DESC", "USEDSCRP"}));

  // Remaining scalar attributes follow the known ones
  static const std::set<std::string> used_keys = {"owner",    "OWNER_NAME", "OWNERNME1", "address",  "SITUS_ADDRESS", "SITEADDRESS", "acres",   "ACRES",
                                                  "GROSSAC",  "use_code",   "USE_CODE",  "USECD",    "use_desc",      "USE_DESC",    "USEDSCRP"};
  if (props.is_object())
  {
    for (const auto &[key, value] : props.items())
    {
      if (used_keys.contains(key) || value.is_null() || value.is_object() || value.is_array())
        continue;
      add_row(content, key.c_str(), geojson::property_string(props, key));
    }
  }
  return content;
}

auto reference_parcel(const json &props) -> popup_content_t
{
  popup_content_t content;
  content.title = "Parcel";

  add_row(content, "APN", geojson::first_property_string(props, {"APN", "apn"}));
  add_row(content, "AIN", geojson::first_property_string(props, {"AIN", "ain"}));
  content.address_lines = split_address_lines(geojson::first_property_string(props, {"SitusFullAddress", "situs_full_address", "address"}));
  add_row(content, "Use", geojson::first_property_string(props, {"UseDescription", "use_description"}));
  return content;
}

auto subject_property(geo_position_t center) -> popup_content_t
{
  popup_content_t content;
  content.title = "Subject Property";
  if (std::isfinite(center.lat))
    add_row(content, "Latitude", std::format("{:.6f}", center.lat));
  if (std::isfinite(center.lon))
    add_row(content, "Longitude", std::format("{:.6f}", center.lon));
  return content;
}

} // namespace popups
} // namespace site_mapper
