#include "core/ring_generator.hpp"
#include "core/geo_math.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <set>

namespace site_mapper
{

auto generate_ring(geo_position_t center, double radius_miles, int steps) -> geometry_t
{
  steps = std::max(steps, RING_MIN_STEPS);
  const double radius_m = radius_miles * geo::METERS_PER_MILE;

  ring_t ring;
  ring.reserve(static_cast<size_t>(steps) + 1);
  for (int i = 0; i < steps; ++i)
  {
    // Counter-clockwise from north, matching the outer ring winding of GeoJSON
    double bearing = -360.0 * static_cast<double>(i) / static_cast<double>(steps);
    geo_position_t p;
    geo::destination_point(center.lat, center.lon, radius_m, bearing, p.lat, p.lon);
    ring.push_back(p);
  }
  ring.push_back(ring.front());

  return geometry_t::polygon({std::move(ring)});
}

auto ring_source_id(double radius_miles) -> std::string
{
  return std::format("ring-{}", radius_miles);
}

auto ring_color(double radius_miles) -> color_t
{
  if (radius_miles <= 1.0)
    return color_from_hex(0xDC2626);
  if (radius_miles <= 3.0)
    return color_from_hex(0xF59E0B);
  return color_from_hex(0x2563EB);
}

auto generate_rings(geo_position_t center, const std::vector<double> &radii_miles, double selected_radius) -> std::vector<demographic_ring_t>
{
  std::vector<demographic_ring_t> rings;
  rings.reserve(radii_miles.size());

  bool selection_used = false;
  std::set<std::string> source_ids;
  for (double radius : radii_miles)
  {
    if (!(radius > 0.0) || !std::isfinite(radius))
      continue;

    // Repeated radii would share a source id on the surface
    if (!source_ids.insert(ring_source_id(radius)).second)
      continue;

    demographic_ring_t ring;
    ring.radius_miles = radius;
    ring.selected = !selection_used && selected_radius > 0.0 && radius == selected_radius;
    selection_used = selection_used || ring.selected;

    ring.fill_opacity = ring.selected ? RING_FILL_OPACITY_SELECTED : RING_FILL_OPACITY;
    ring.line_width = ring.selected ? RING_LINE_WIDTH_SELECTED : RING_LINE_WIDTH;
    ring.halo_width = ring.line_width + RING_HALO_EXTRA_WIDTH;
    ring.color = ring_color(radius);

    ring.feature.id = ring_source_id(radius);
    ring.feature.geometry = generate_ring(center, radius);
    ring.feature.properties = {{"radius_miles", radius}, {"selected", ring.selected}};

    rings.push_back(std::move(ring));
  }
  return rings;
}

} // namespace site_mapper
