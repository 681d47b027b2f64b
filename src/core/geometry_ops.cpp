#include "core/geometry_ops.hpp"
#include "core/geo_math.hpp"
#include <algorithm>
#include <cmath>
#include <limits>

namespace site_mapper
{
namespace geometry_ops
{

namespace
{

// Ring without the repeated closing vertex
auto open_ring(const ring_t &ring) -> ring_t
{
  ring_t result = ring;
  if (result.size() > 1 && result.front() == result.back())
    result.pop_back();
  return result;
}

auto cross(const geo_position_t &o, const geo_position_t &a, const geo_position_t &b) -> double
{
  return (a.lon - o.lon) * (b.lat - o.lat) - (a.lat - o.lat) * (b.lon - o.lon);
}

auto segments_cross(const geo_position_t &a1, const geo_position_t &a2, const geo_position_t &b1, const geo_position_t &b2) -> bool
{
  double d1 = cross(b1, b2, a1);
  double d2 = cross(b1, b2, a2);
  double d3 = cross(a1, a2, b1);
  double d4 = cross(a1, a2, b2);
  return ((d1 > 0.0 && d2 < 0.0) || (d1 < 0.0 && d2 > 0.0)) && ((d3 > 0.0 && d4 < 0.0) || (d3 < 0.0 && d4 > 0.0));
}

auto point_in_ring(const geo_position_t &point, const ring_t &ring) -> bool
{
  int crossings = 0;
  size_t n = ring.size();

  for (size_t i = 0; i < n; ++i)
  {
    size_t j = (i + 1) % n;

    if (((ring[i].lat <= point.lat && point.lat < ring[j].lat) || (ring[j].lat <= point.lat && point.lat < ring[i].lat)) &&
        (point.lon < (ring[j].lon - ring[i].lon) * (point.lat - ring[i].lat) / (ring[j].lat - ring[i].lat) + ring[i].lon))
    {
      crossings++;
    }
  }

  return (crossings % 2) == 1;
}

auto distance_to_segment(const geo_position_t &p, const geo_position_t &a, const geo_position_t &b) -> double
{
  double dx = b.lon - a.lon;
  double dy = b.lat - a.lat;
  double len_sq = dx * dx + dy * dy;
  double t = 0.0;
  if (len_sq > 0.0)
    t = std::clamp(((p.lon - a.lon) * dx + (p.lat - a.lat) * dy) / len_sq, 0.0, 1.0);

  double cx = a.lon + t * dx - p.lon;
  double cy = a.lat + t * dy - p.lat;
  return std::sqrt(cx * cx + cy * cy);
}

} // namespace

auto ring_signed_area(const ring_t &ring) -> double
{
  auto pts = open_ring(ring);
  if (pts.size() < 3)
    return 0.0;

  double sum = 0.0;
  for (size_t i = 0; i < pts.size(); ++i)
  {
    size_t j = (i + 1) % pts.size();
    sum += pts[i].lon * pts[j].lat - pts[j].lon * pts[i].lat;
  }
  return sum * 0.5;
}

auto is_finite(const geometry_t &geometry) -> bool
{
  for (const auto &part : geometry.parts)
    for (const auto &ring : part)
      for (const auto &p : ring)
        if (!std::isfinite(p.lon) || !std::isfinite(p.lat))
          return false;
  return true;
}

auto is_simple_ring(const ring_t &ring) -> bool
{
  auto pts = open_ring(ring);
  size_t n = pts.size();
  if (n < 4)
    return true;

  for (size_t i = 0; i < n; ++i)
  {
    const auto &a1 = pts[i];
    const auto &a2 = pts[(i + 1) % n];
    for (size_t j = i + 2; j < n; ++j)
    {
      // First and last edge share a vertex
      if (i == 0 && j == n - 1)
        continue;
      if (segments_cross(a1, a2, pts[j], pts[(j + 1) % n]))
        return false;
    }
  }
  return true;
}

auto polygon_centroid(const geometry_t &geometry) -> std::optional<geo_position_t>
{
  if (!geometry.is_polygonal() || !is_finite(geometry))
    return std::nullopt;

  double sum_lon = 0.0;
  double sum_lat = 0.0;
  size_t count = 0;

  for (const auto &polygon : geometry.parts)
  {
    if (polygon.empty())
      continue;

    const auto &outer = polygon.front();
    auto pts = open_ring(outer);
    if (pts.size() < 3 || std::abs(ring_signed_area(outer)) <= std::numeric_limits<double>::epsilon())
      return std::nullopt;
    if (!is_simple_ring(outer))
      return std::nullopt;

    for (const auto &p : pts)
    {
      sum_lon += p.lon;
      sum_lat += p.lat;
      count++;
    }
  }

  if (count == 0)
    return std::nullopt;

  return geo_position_t{sum_lon / static_cast<double>(count), sum_lat / static_cast<double>(count)};
}

auto anchor_point(const geometry_t &geometry) -> std::optional<geo_position_t>
{
  switch (geometry.type)
  {
  case geometry_type_e::Point:
  case geometry_type_e::MultiPoint:
  {
    if (geometry.parts.empty() || geometry.parts.front().empty() || geometry.parts.front().front().empty())
      return std::nullopt;
    auto p = geometry.parts.front().front().front();
    if (!std::isfinite(p.lon) || !std::isfinite(p.lat))
      return std::nullopt;
    return p;
  }
  case geometry_type_e::Polygon:
  case geometry_type_e::MultiPolygon:
    return polygon_centroid(geometry);
  default:
    return std::nullopt;
  }
}

auto point_in_polygon(const geo_position_t &point, const polygon_t &polygon) -> bool
{
  if (polygon.empty() || !point_in_ring(point, polygon.front()))
    return false;

  for (size_t i = 1; i < polygon.size(); ++i)
  {
    if (point_in_ring(point, polygon[i]))
      return false;
  }
  return true;
}

auto distance_to_polyline(const geo_position_t &point, const ring_t &line) -> double
{
  if (line.empty())
    return std::numeric_limits<double>::infinity();
  if (line.size() == 1)
    return distance_to_segment(point, line.front(), line.front());

  double best = std::numeric_limits<double>::infinity();
  for (size_t i = 0; i + 1 < line.size(); ++i)
    best = std::min(best, distance_to_segment(point, line[i], line[i + 1]));
  return best;
}

auto line_length_m(const ring_t &line) -> double
{
  double total = 0.0;
  for (size_t i = 0; i + 1 < line.size(); ++i)
    total += geo::distance(line[i].lat, line[i].lon, line[i + 1].lat, line[i + 1].lon);
  return total;
}

auto ring_area_m2(const ring_t &ring) -> double
{
  auto pts = open_ring(ring);
  if (pts.size() < 3)
    return 0.0;

  double total = 0.0;
  for (size_t i = 0; i < pts.size(); ++i)
  {
    const auto &p1 = pts[i];
    const auto &p2 = pts[(i + 1) % pts.size()];
    total += geo::to_radians(p2.lon - p1.lon) * (2.0 + std::sin(geo::to_radians(p1.lat)) + std::sin(geo::to_radians(p2.lat)));
  }
  return std::abs(total * geo::EARTH_MEAN_RADIUS * geo::EARTH_MEAN_RADIUS / 2.0);
}

} // namespace geometry_ops
} // namespace site_mapper
