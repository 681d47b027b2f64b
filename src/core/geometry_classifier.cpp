#include "core/geometry_classifier.hpp"
#include <algorithm>
#include <cctype>

namespace site_mapper
{

auto normalize_parcel_id(const std::string &value) -> std::string
{
  std::string result;
  result.reserve(value.size());
  for (unsigned char c : value)
  {
    if (std::isalnum(c))
      result.push_back(static_cast<char>(std::toupper(c)));
  }
  return result;
}

auto parcel_identifiers(const feature_t &feature, const std::vector<std::string> &fields) -> std::vector<std::string>
{
  std::vector<std::string> keys;
  for (const auto &field : fields)
  {
    auto key = normalize_parcel_id(geojson::property_string(feature.properties, field));
    if (!key.empty() && std::find(keys.begin(), keys.end(), key) == keys.end())
      keys.push_back(std::move(key));
  }
  return keys;
}

geometry_classifier_t::geometry_classifier_t(const std::string &subject_id, const std::vector<std::string> &comp_ids, std::vector<std::string> fields)
    : m_subject_key(normalize_parcel_id(subject_id)), m_fields(std::move(fields))
{
  for (const auto &id : comp_ids)
  {
    auto key = normalize_parcel_id(id);
    if (!key.empty())
      m_comp_keys.push_back(std::move(key));
  }
  std::sort(m_comp_keys.begin(), m_comp_keys.end());
  m_comp_keys.erase(std::unique(m_comp_keys.begin(), m_comp_keys.end()), m_comp_keys.end());
}

auto geometry_classifier_t::classify(const feature_t &feature) const -> parcel_class_e
{
  const auto keys = parcel_identifiers(feature, m_fields);

  // Subject takes precedence over comp regardless of which field matched
  if (!m_subject_key.empty() && std::find(keys.begin(), keys.end(), m_subject_key) != keys.end())
    return parcel_class_e::Subject;

  const bool is_comp = std::any_of(keys.begin(), keys.end(), [&](const std::string &key) { return std::binary_search(m_comp_keys.begin(), m_comp_keys.end(), key); });
  return is_comp ? parcel_class_e::Comp : parcel_class_e::Other;
}

auto geometry_classifier_t::partition(const feature_collection_t &collection) const -> parcel_buckets_t
{
  parcel_buckets_t buckets;
  for (const auto &feature : collection.features)
  {
    switch (classify(feature))
    {
    case parcel_class_e::Subject:
      buckets.subject.push_back(feature);
      break;
    case parcel_class_e::Comp:
      buckets.comp.push_back(feature);
      break;
    case parcel_class_e::Other:
      buckets.other.push_back(feature);
      break;
    }
  }
  return buckets;
}

auto classify_parcels(const feature_collection_t &collection, const std::string &subject_id, const std::vector<std::string> &comp_ids, const std::vector<std::string> &fields)
    -> parcel_buckets_t
{
  return geometry_classifier_t(subject_id, comp_ids, fields).partition(collection);
}

} // namespace site_mapper
