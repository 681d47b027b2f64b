#pragma once

#include "core/geojson.hpp"
#include <string>
#include <vector>

namespace site_mapper
{

// Raw identifier fields carried by reference parcel datasets. Different source
// datasets spell the same parcel number differently.
inline const std::vector<std::string> DEFAULT_PARCEL_ID_FIELDS = {"APN", "AIN", "apn", "ain"};

enum class parcel_class_e
{
  Subject,
  Comp,
  Other
};

struct parcel_buckets_t
{
  std::vector<feature_t> subject;
  std::vector<feature_t> comp;
  std::vector<feature_t> other;

  auto total() const -> size_t
  {
    return subject.size() + comp.size() + other.size();
  }
};

// Strip every non-alphanumeric character and uppercase the rest.
// "12-345-678", "12 345 678" and "12345678" all normalize to "12345678".
auto normalize_parcel_id(const std::string &value) -> std::string;

// Normalized, non-empty identifiers of a feature across all candidate fields
auto parcel_identifiers(const feature_t &feature, const std::vector<std::string> &fields = DEFAULT_PARCEL_ID_FIELDS) -> std::vector<std::string>;

class geometry_classifier_t
{
public:
  geometry_classifier_t(const std::string &subject_id, const std::vector<std::string> &comp_ids, std::vector<std::string> fields = DEFAULT_PARCEL_ID_FIELDS);

  auto classify(const feature_t &feature) const -> parcel_class_e;

  // Partition a collection. Every input feature lands in exactly one bucket,
  // input order is kept within a bucket.
  auto partition(const feature_collection_t &collection) const -> parcel_buckets_t;

  auto get_subject_key() const -> const std::string &
  {
    return m_subject_key;
  }

private:
  std::string m_subject_key;
  std::vector<std::string> m_comp_keys; // Sorted, unique
  std::vector<std::string> m_fields;
};

auto classify_parcels(const feature_collection_t &collection, const std::string &subject_id, const std::vector<std::string> &comp_ids,
                      const std::vector<std::string> &fields = DEFAULT_PARCEL_ID_FIELDS) -> parcel_buckets_t;

} // namespace site_mapper
