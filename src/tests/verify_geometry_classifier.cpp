#include "../core/geometry_classifier.hpp"
#include <cassert>
#include <iostream>

using namespace site_mapper;

namespace
{
auto parcel(const std::string &field, const nlohmann::json &value) -> feature_t
{
  feature_t feature;
  feature.geometry = geometry_t::polygon({{{0.0, 0.0}, {0.001, 0.0}, {0.001, 0.001}, {0.0, 0.001}, {0.0, 0.0}}});
  feature.properties = {{field, value}};
  return feature;
}
} // namespace

void test_normalize()
{
  std::cout << "Testing parcel id normalization..." << std::endl;
  assert(normalize_parcel_id("12-345-678") == "12345678");
  assert(normalize_parcel_id("12 345 678") == "12345678");
  assert(normalize_parcel_id("ab.c-1") == "ABC1");
  assert(normalize_parcel_id("--  --").empty());

  auto once = normalize_parcel_id("5012-a 003*");
  assert(normalize_parcel_id(once) == once);
  std::cout << "  " << once << std::endl;
}

void test_subject_scenario()
{
  std::cout << "Testing subject matching across formats..." << std::endl;
  feature_collection_t collection;
  collection.features = {parcel("APN", "12-345-678"), parcel("APN", "12 345 678"), parcel("APN", "99-999-999")};

  auto buckets = classify_parcels(collection, "12-345-678", {});
  std::cout << "  subject=" << buckets.subject.size() << " comp=" << buckets.comp.size() << " other=" << buckets.other.size() << std::endl;
  assert(buckets.subject.size() == 2);
  assert(buckets.comp.empty());
  assert(buckets.other.size() == 1);
  assert(geojson::property_string(buckets.other.front().properties, "APN") == "99-999-999");
  assert(buckets.total() == collection.size());
}

void test_subject_wins_over_comp()
{
  std::cout << "Testing subject precedence..." << std::endl;
  feature_collection_t collection;
  collection.features = {parcel("AIN", "1111"), parcel("ain", "2222"), parcel("apn", "3333")};

  auto buckets = classify_parcels(collection, "1111", {"1111", "2222"});
  assert(buckets.subject.size() == 1);
  assert(buckets.comp.size() == 1);
  assert(buckets.other.size() == 1);
  assert(geojson::property_string(buckets.comp.front().properties, "ain") == "2222");
}

void test_numeric_identifiers()
{
  std::cout << "Testing numeric identifier values..." << std::endl;
  feature_collection_t collection;
  collection.features = {parcel("AIN", 5551234), parcel("AIN", "555-1234"), parcel("AIN", nullptr)};

  auto buckets = classify_parcels(collection, "", {"5551234"});
  assert(buckets.subject.empty());
  assert(buckets.comp.size() == 2);
  assert(buckets.other.size() == 1);
}

void test_empty_inputs_never_match()
{
  std::cout << "Testing empty subject and comp set..." << std::endl;
  feature_collection_t collection;
  collection.features = {parcel("APN", ""), parcel("APN", "---"), parcel("OTHER", "12")};

  auto buckets = classify_parcels(collection, "", {});
  assert(buckets.subject.empty());
  assert(buckets.comp.empty());
  assert(buckets.other.size() == 3);

  auto nothing = classify_parcels(feature_collection_t{}, "12", {"34"});
  assert(nothing.total() == 0);
}

void test_custom_fields()
{
  std::cout << "Testing custom identifier fields..." << std::endl;
  feature_collection_t collection;
  collection.features = {parcel("PARCEL_NO", "77-1"), parcel("APN", "77-1")};

  auto buckets = classify_parcels(collection, "771", {}, {"PARCEL_NO"});
  assert(buckets.subject.size() == 1);
  assert(geojson::property_string(buckets.subject.front().properties, "PARCEL_NO") == "77-1");
  assert(buckets.other.size() == 1);
}

void test_partition_keeps_order()
{
  std::cout << "Testing partition order and completeness..." << std::endl;
  feature_collection_t collection;
  for (int i = 0; i < 20; ++i)
    collection.features.push_back(parcel("APN", std::to_string(i % 5)));

  geometry_classifier_t classifier("0", {"1", "2", "2"});
  auto buckets = classifier.partition(collection);
  assert(buckets.total() == collection.size());
  assert(buckets.subject.size() == 4);
  assert(buckets.comp.size() == 8);
  assert(buckets.other.size() == 8);

  // Comps keep their input order: 1, 2, 1, 2, ...
  for (size_t i = 0; i < buckets.comp.size(); ++i)
    assert(geojson::property_string(buckets.comp[i].properties, "APN") == (i % 2 == 0 ? "1" : "2"));
}

int main()
{
  test_normalize();
  test_subject_scenario();
  test_subject_wins_over_comp();
  test_numeric_identifiers();
  test_empty_inputs_never_match();
  test_custom_fields();
  test_partition_keeps_order();
  std::cout << "Geometry Classifier Verification Passed" << std::endl;
  return 0;
}
