#include "../core/popup_content.hpp"
#include <cassert>
#include <iostream>

using namespace site_mapper;
using json = nlohmann::json;

namespace
{
auto row(const popup_content_t &content, const std::string &label) -> std::string
{
  for (const auto &r : content.rows)
  {
    if (r.label == label)
      return r.value;
  }
  return {};
}
} // namespace

void test_sale_comp()
{
  std::cout << "Testing sale comp popup..." << std::endl;
  auto content = popups::sale_comp({{"name", "Mesa Ridge"}, {"price", 4500000}, {"price_per_unit", "0"}, {"date", "2024-03-01"}, {"type", nullptr}});
  assert(content.title == "Sale Comp: Mesa Ridge");
  assert(row(content, "Price") == "$4500000");
  // Zero and missing values are left out
  assert(row(content, "$/Unit").empty());
  assert(row(content, "Type").empty());
  assert(content.rows.size() == 2);
  assert(content.rows[0].label == "Price" && content.rows[1].label == "Date");

  auto empty = popups::sale_comp(json::object());
  assert(empty.title == "Sale Comp");
  assert(!empty.has_details());
}

void test_rent_comp()
{
  std::cout << "Testing rent comp popup..." << std::endl;
  json props = {{"name", "The Vue"},
                {"address", "100 Main St, Gilbert, AZ 85233"},
                {"distance_miles", 1.234},
                {"year_built", "2019"},
                {"total_units", 312},
                {"floorplans", json::array({{{"unit_type", "1x1"}, {"bedrooms", 1}, {"bathrooms", 1}, {"avg_sqft", 712.4}, {"asking_rent", 1450}},
                                            {{"unit_type", "2x2"}, {"bedrooms", 2}, {"bathrooms", 2.5}, {"effective_rent", "1895"}}})}};

  auto content = popups::rent_comp(props);
  assert(content.title == "Rent Comp: The Vue");
  assert(content.address_lines.size() == 2);
  assert(content.address_lines[0] == "100 Main St");
  assert(content.address_lines[1] == "Gilbert, AZ 85233");
  assert(row(content, "Distance") == "1.23 mi");
  assert(row(content, "Year Built") == "2019");
  assert(row(content, "Units") == "312");

  assert(content.table);
  assert(content.table->columns.size() == 5);
  assert(content.table->rows.size() == 2);
  const auto &first = content.table->rows[0];
  assert(first[0] == "1x1" && first[1] == "1" && first[2] == "1" && first[3] == "712" && first[4] == "$1450");
  const auto &second = content.table->rows[1];
  assert(second[2] == "2.5" && second[3].empty() && second[4] == "$1895");
}

void test_parcels()
{
  std::cout << "Testing parcel popups..." << std::endl;
  feature_t tax;
  tax.id = "f-9";
  tax.properties = {{"parcel_id", "304-12-001"}, {"assessor_attrs", {{"OWNER_NAME", "Desert Land LLC"}, {"ACRES", "12.5"}, {"ZONING", "AG"}}}};

  assert(popups::tax_parcel_id(tax) == "304-12-001");
  auto content = popups::tax_parcel(tax);
  assert(content.title == "Parcel 304-12-001");
  assert(row(content, "Owner") == "Desert Land LLC");
  assert(row(content, "Acres") == "12.50");
  assert(row(content, "ZONING") == "AG");

  feature_t bare;
  bare.id = "f-10";
  assert(popups::tax_parcel_id(bare) == "f-10");

  auto reference = popups::reference_parcel({{"apn", "5012-003-004"}, {"SitusFullAddress", "12 Oak Ave, Pasadena CA"}, {"UseDescription", "Single"}});
  assert(row(reference, "APN") == "5012-003-004");
  assert(row(reference, "AIN").empty());
  assert(reference.address_lines.size() == 2);
  assert(row(reference, "Use") == "Single");

  auto plan = popups::plan_parcel({{"parcel_id", "A-1"}, {"gross_acres", 10.456}, {"confidence", 0.87}});
  assert(row(plan, "Gross Acres") == "10.46");
  assert(row(plan, "Confidence") == "87%");
}

void test_subject_and_addresses()
{
  std::cout << "Testing subject popup and address splitting..." << std::endl;
  auto subject = popups::subject_property({-111.612, 33.279});
  assert(subject.title == "Subject Property");
  assert(row(subject, "Latitude") == "33.279000");
  assert(row(subject, "Longitude") == "-111.612000");

  assert(popups::split_address_lines("  ").empty());
  assert(popups::split_address_lines("Lot 7").size() == 1);
  auto lines = popups::split_address_lines("1 A St ,  B, C");
  assert(lines.size() == 2 && lines[0] == "1 A St" && lines[1] == "B, C");
}

int main()
{
  test_sale_comp();
  test_rent_comp();
  test_parcels();
  test_subject_and_addresses();
  std::cout << "Popup Content Verification Passed" << std::endl;
  return 0;
}
