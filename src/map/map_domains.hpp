#pragma once

#include "core/geometry_classifier.hpp"
#include "core/map_types.hpp"
#include "core/ring_generator.hpp"
#include "map/layer_reconciler.hpp"
#include <string>
#include <vector>

namespace site_mapper
{

// Domain prefixes. Each owns every source and layer id under it.
namespace domain_ids
{
inline constexpr const char *PLAN_PARCELS = "plan-parcels";
inline constexpr const char *PROJECT_BOUNDARY = "project-boundary";
inline constexpr const char *TAX_PARCELS = "tax-parcels";
inline constexpr const char *REFERENCE_PARCELS = "la-parcels";
inline constexpr const char *SALE_COMPS = "sale-comps";
inline constexpr const char *RENT_COMPS = "rent-comps";
inline constexpr const char *ANNOTATIONS = "user-features";
inline constexpr const char *RINGS = "ring";
inline constexpr const char *DRAW_FEEDBACK = "draw-feedback";
} // namespace domain_ids

namespace domains
{

auto plan_parcels(const feature_collection_ptr &parcels) -> domain_plan_t;

// Polygon outline when the boundary holds a polygon, otherwise a point at the
// project center
auto project_boundary(const feature_collection_ptr &boundary, geo_position_t center) -> domain_plan_t;

// Selected parcels get emphasis layers filtered on parcel_id
auto tax_parcels(const feature_collection_ptr &parcels, const std::vector<std::string> &selected_ids, double min_zoom) -> domain_plan_t;

// Neutral, comp and subject sources, emphasis painted last
auto reference_parcels(const parcel_buckets_t &buckets, double min_zoom, const std::vector<std::string> &id_fields = DEFAULT_PARCEL_ID_FIELDS) -> domain_plan_t;

auto sale_comps(const feature_collection_ptr &comps) -> domain_plan_t;

// Source only; rent comps are drawn as markers
auto rent_comps(const feature_collection_ptr &comps) -> domain_plan_t;

auto annotations(const std::vector<map_feature_t> &features, const std::string &selected_id) -> domain_plan_t;

auto demographic_rings(const std::vector<demographic_ring_t> &rings) -> domain_plan_t;

auto draw_feedback(const feature_collection_ptr &feedback) -> domain_plan_t;

} // namespace domains
} // namespace site_mapper
