#pragma once

#include "core/geojson.hpp"
#include "core/color.hpp"
#include <string>
#include <vector>

namespace site_mapper
{

constexpr int RING_MIN_STEPS = 64;

inline const std::vector<double> DEFAULT_RING_RADII_MILES = {1.0, 3.0, 5.0};

// Paint parameters, baseline vs. selected emphasis
constexpr float RING_FILL_OPACITY = 0.26f;
constexpr float RING_FILL_OPACITY_SELECTED = 0.42f;
constexpr float RING_LINE_WIDTH = 1.9f;
constexpr float RING_LINE_WIDTH_SELECTED = 3.4f;
constexpr float RING_HALO_EXTRA_WIDTH = 2.0f;

struct demographic_ring_t
{
  double radius_miles = 0.0;
  bool selected = false;
  float fill_opacity = RING_FILL_OPACITY;
  float line_width = RING_LINE_WIDTH;
  float halo_width = RING_LINE_WIDTH + RING_HALO_EXTRA_WIDTH;
  color_t color = palette::BLACK;
  feature_t feature; // Closed polygon around the center
};

// Closed polygon approximating a great-circle of radius_miles around center.
// steps is clamped to at least RING_MIN_STEPS; the ring holds steps + 1
// positions with the first repeated at the end.
auto generate_ring(geo_position_t center, double radius_miles, int steps = RING_MIN_STEPS) -> geometry_t;

// One ring per distinct radius, in input order. Non-positive radii are
// skipped. At most one ring is selected: the one whose radius equals
// selected_radius (pass a non-positive value for none).
auto generate_rings(geo_position_t center, const std::vector<double> &radii_miles, double selected_radius) -> std::vector<demographic_ring_t>;

// Source id of a ring on the map surface, "ring-3" for the three mile ring
auto ring_source_id(double radius_miles) -> std::string;

// Fill color keyed by ring radius, inner rings warmer
auto ring_color(double radius_miles) -> color_t;

} // namespace site_mapper
