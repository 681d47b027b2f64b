#pragma once

#include "core/geojson.hpp"
#include <optional>

namespace site_mapper
{
namespace geometry_ops
{

// Vertex mean of the outer rings, closing vertex excluded.
// Returns nullopt for degenerate (fewer than three distinct vertices, zero
// area), self-intersecting or non-finite polygons.
auto polygon_centroid(const geometry_t &geometry) -> std::optional<geo_position_t>;

// The single point a marker is anchored to: the point itself, the first vertex
// of a multipoint, the centroid of a polygon. Lines have no anchor.
auto anchor_point(const geometry_t &geometry) -> std::optional<geo_position_t>;

// Planar signed area of a ring in degree units (positive when counter-clockwise)
auto ring_signed_area(const ring_t &ring) -> double;

auto is_finite(const geometry_t &geometry) -> bool;

// True when no two non-adjacent edges of the ring cross
auto is_simple_ring(const ring_t &ring) -> bool;

// Ray casting against the outer ring minus holes
auto point_in_polygon(const geo_position_t &point, const polygon_t &polygon) -> bool;

// Shortest distance in degrees from a point to a polyline (planar)
auto distance_to_polyline(const geo_position_t &point, const ring_t &line) -> double;

// Great-circle length in meters of a polyline
auto line_length_m(const ring_t &line) -> double;

// Geodesic area in square meters of a closed ring (spherical excess
// approximation, absolute value)
auto ring_area_m2(const ring_t &ring) -> double;

} // namespace geometry_ops
} // namespace site_mapper
