#include "../core/geo_math.hpp"
#include "../core/geometry_ops.hpp"
#include "../core/ring_generator.hpp"
#include <cassert>
#include <cmath>
#include <iostream>

using namespace site_mapper;

void test_ring_radius()
{
  std::cout << "Testing ring vertex distances..." << std::endl;
  const geo_position_t center = {-111.612, 33.279};
  const double radius_m = 3.0 * geo::METERS_PER_MILE;

  auto geometry = generate_ring(center, 3.0);
  assert(geometry.type == geometry_type_e::Polygon);
  assert(geometry.parts.size() == 1 && geometry.parts.front().size() == 1);

  const auto &ring = geometry.parts.front().front();
  assert(ring.size() == static_cast<size_t>(RING_MIN_STEPS) + 1);
  assert(ring.front() == ring.back());

  double worst = 0.0;
  for (const auto &p : ring)
  {
    double d = geo::distance(center.lat, center.lon, p.lat, p.lon);
    worst = std::max(worst, std::abs(d - radius_m));
  }
  std::cout << "  Max radius error: " << worst << " m" << std::endl;
  assert(worst < 0.5);

  // Counter-clockwise outer ring, simple, with a usable centroid
  assert(geometry_ops::ring_signed_area(ring) > 0.0);
  assert(geometry_ops::is_simple_ring(ring));
  auto centroid = geometry_ops::polygon_centroid(geometry);
  assert(centroid);
  assert(std::abs(centroid->lat - center.lat) < 1e-3 && std::abs(centroid->lon - center.lon) < 1e-3);
}

void test_step_clamp()
{
  std::cout << "Testing step clamp..." << std::endl;
  auto coarse = generate_ring({0.0, 0.0}, 1.0, 8);
  assert(coarse.parts.front().front().size() == static_cast<size_t>(RING_MIN_STEPS) + 1);

  auto fine = generate_ring({0.0, 0.0}, 1.0, 128);
  assert(fine.parts.front().front().size() == 129);
}

void test_rings_with_selection()
{
  std::cout << "Testing ring set with a selected radius..." << std::endl;
  auto rings = generate_rings({0.0, 0.0}, {1.0, 3.0, 5.0}, 3.0);
  assert(rings.size() == 3);

  for (const auto &ring : rings)
  {
    std::cout << "  " << ring.radius_miles << " mi selected=" << ring.selected << " opacity=" << ring.fill_opacity << " width=" << ring.line_width
              << std::endl;
    if (ring.radius_miles == 3.0)
    {
      assert(ring.selected);
      assert(ring.fill_opacity == RING_FILL_OPACITY_SELECTED);
      assert(ring.line_width == RING_LINE_WIDTH_SELECTED);
    }
    else
    {
      assert(!ring.selected);
      assert(ring.fill_opacity == RING_FILL_OPACITY);
      assert(ring.line_width == RING_LINE_WIDTH);
    }
    assert(ring.halo_width == ring.line_width + RING_HALO_EXTRA_WIDTH);
    assert(ring.feature.id == ring_source_id(ring.radius_miles));
    assert(ring.feature.properties["selected"].get<bool>() == ring.selected);
  }
  assert(rings[0].radius_miles == 1.0 && rings[2].radius_miles == 5.0);
}

void test_rings_without_selection()
{
  std::cout << "Testing ring set without selection..." << std::endl;
  auto rings = generate_rings({10.0, 10.0}, {1.0, -2.0, 0.0, 5.0}, 0.0);
  assert(rings.size() == 2);
  for (const auto &ring : rings)
    assert(!ring.selected);

}

void test_repeated_radii()
{
  std::cout << "Testing repeated radii..." << std::endl;
  auto rings = generate_rings({10.0, 10.0}, {1.0, 3.0, 3.0, 1.0, 5.0}, 3.0);
  assert(rings.size() == 3);
  assert(rings[0].radius_miles == 1.0 && rings[1].radius_miles == 3.0 && rings[2].radius_miles == 5.0);
  assert(!rings[0].selected && rings[1].selected && !rings[2].selected);

  // Every ring gets its own source id
  for (size_t i = 0; i < rings.size(); ++i)
  {
    for (size_t j = i + 1; j < rings.size(); ++j)
      assert(rings[i].feature.id != rings[j].feature.id);
  }

  auto same = generate_rings({10.0, 10.0}, {2.0, 2.0}, 2.0);
  assert(same.size() == 1 && same[0].selected);
}

void test_source_ids()
{
  std::cout << "Testing ring source ids..." << std::endl;
  assert(ring_source_id(3.0) == "ring-3");
  assert(ring_source_id(0.5) == "ring-0.5");
}

int main()
{
  test_ring_radius();
  test_step_clamp();
  test_rings_with_selection();
  test_rings_without_selection();
  test_repeated_radii();
  test_source_ids();
  std::cout << "Ring Generator Verification Passed" << std::endl;
  return 0;
}
