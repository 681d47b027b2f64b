#pragma once

#include <cmath>

namespace site_mapper
{
namespace geo
{
constexpr double PI = 3.14159265358979323846;
constexpr double EARTH_RADIUS = 6378137.0;

// Mean radius used for distance based synthesis (rings, measurements)
constexpr double EARTH_MEAN_RADIUS = 6371008.8;

constexpr double METERS_PER_MILE = 1609.344;
constexpr double FEET_PER_METER = 3.280839895;
constexpr double SQ_FEET_PER_ACRE = 43560.0;

inline auto to_radians(double deg) -> double
{
  return deg * PI / 180.0;
}

inline auto to_degrees(double rad) -> double
{
  return rad * 180.0 / PI;
}

// Convert Latitude/Longitude to Web Mercator World Coordinate (0.0 to 1.0)
inline auto lat_lon_to_world(double lat, double lon, double &out_x, double &out_y) -> void
{
  out_x = (lon + 180.0) / 360.0;

  double sin_lat = std::sin(lat * PI / 180.0);
  // Clamp to prevent singularity at poles
  if (sin_lat > 0.9999)
    sin_lat = 0.9999;
  if (sin_lat < -0.9999)
    sin_lat = -0.9999;

  out_y = 0.5 - std::log((1.0 + sin_lat) / (1.0 - sin_lat)) / (4.0 * PI);
}

// Convert World Coordinate (0.0 to 1.0) to Tile Indices
inline auto world_to_tile(double wx, double wy, int zoom, int &out_tx, int &out_ty) -> void
{
  double scale = static_cast<double>(1 << zoom);
  out_tx = static_cast<int>(std::floor(wx * scale));
  out_ty = static_cast<int>(std::floor(wy * scale));
}

// Convert Web Mercator World Coordinate (0.0 to 1.0) back to Latitude/Longitude
inline auto world_to_lat_lon(double wx, double wy, double &out_lat, double &out_lon) -> void
{
  out_lon = (wx * 360.0) - 180.0;

  double n = PI - 2.0 * PI * wy;
  out_lat = (180.0 / PI) * std::atan(0.5 * (std::exp(n) - std::exp(-n)));
}

// Move a point by distance (meters) and bearing (degrees) along a great circle
inline auto destination_point(double lat, double lon, double dist_m, double bearing_deg, double &out_lat, double &out_lon) -> void
{
  double lat_rad = to_radians(lat);
  double lon_rad = to_radians(lon);
  double bearing_rad = to_radians(bearing_deg);
  double angular_dist = dist_m / EARTH_MEAN_RADIUS;

  double lat2_rad = std::asin(std::sin(lat_rad) * std::cos(angular_dist) + std::cos(lat_rad) * std::sin(angular_dist) * std::cos(bearing_rad));
  double lon2_rad = lon_rad + std::atan2(std::sin(bearing_rad) * std::sin(angular_dist) * std::cos(lat_rad), std::cos(angular_dist) - std::sin(lat_rad) * std::sin(lat2_rad));

  out_lat = to_degrees(lat2_rad);
  out_lon = to_degrees(lon2_rad);

  // Normalize to -180..180
  if (out_lon > 180.0)
    out_lon -= 360.0;
  if (out_lon < -180.0)
    out_lon += 360.0;
}

// Calculate great-circle distance between two points in meters (Haversine)
inline auto distance(double lat1, double lon1, double lat2, double lon2) -> double
{
  double lat1_rad = to_radians(lat1);
  double lat2_rad = to_radians(lat2);
  double delta_lat = to_radians(lat2 - lat1);
  double delta_lon = to_radians(lon2 - lon1);

  double a = std::sin(delta_lat / 2.0) * std::sin(delta_lat / 2.0) + std::cos(lat1_rad) * std::cos(lat2_rad) * std::sin(delta_lon / 2.0) * std::sin(delta_lon / 2.0);
  double c = 2.0 * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
  return EARTH_MEAN_RADIUS * c;
}

// Resolution of the Web Mercator projection at a latitude (meters per screen pixel)
inline auto meters_per_pixel(double lat, double zoom, double tile_size = 256.0) -> double
{
  return std::cos(to_radians(lat)) * 2.0 * PI * EARTH_RADIUS / (tile_size * std::pow(2.0, zoom));
}

} // namespace geo
} // namespace site_mapper
