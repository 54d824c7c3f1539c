#include "util.hpp"

#include <algorithm>
#include <cmath>

#define EARTH_RADIUS (6378137.0)
#define WORLD_SIZE (2.0 * M_PI * EARTH_RADIUS)
#define MAX_LATITUDE (85.0511287798066)
#define MAX_TILE_ZOOM (30)

namespace footprint { namespace util {

namespace {

inline double tile_longitude(int x, double n) {
  return x / n * 360.0 - 180.0;
}

// inverse of the mercator projection for the northern edge of a row of
// tiles. both neighbours of an edge call this with the same integer, so
// they agree on it exactly.
inline double tile_latitude(int y, double n) {
  return std::atan(std::sinh(M_PI * (1.0 - 2.0 * y / n))) * 180.0 / M_PI;
}

polygon_2d project_polygon(const polygon_2d &poly) {
  polygon_2d result;

  for (auto const &p : poly.outer()) {
    result.outer().push_back(lonlat_to_merc(p.get<0>(), p.get<1>()));
  }

  result.inners().resize(poly.inners().size());
  for (std::size_t i = 0; i < poly.inners().size(); ++i) {
    for (auto const &p : poly.inners()[i]) {
      result.inners()[i].push_back(lonlat_to_merc(p.get<0>(), p.get<1>()));
    }
  }

  return result;
}

} // anonymous namespace

box_2d bbox_for_tile(int z, int x, int y) {
  const double n = std::ldexp(1.0, z);

  return box_2d(
    point_2d(tile_longitude(x, n), tile_latitude(y + 1, n)),
    point_2d(tile_longitude(x + 1, n), tile_latitude(y, n)));
}

// get the mercator bounding box for a tile coordinate
box_2d box_for_tile(int z, int x, int y) {
  const double scale = WORLD_SIZE / std::ldexp(1.0, z);
  const double half_world = 0.5 * WORLD_SIZE;

  return box_2d(
    point_2d(x * scale - half_world, half_world - (y+1) * scale),
    point_2d((x+1) * scale - half_world, half_world - y * scale));
}

bool valid_tile(int z, int x, int y, int max_zoom) {
  if ((z < 0) || (z > std::min(max_zoom, MAX_TILE_ZOOM))) {
    return false;
  }

  const long long n = 1LL << z;
  return (x >= 0) && (x < n) && (y >= 0) && (y < n);
}

point_2d lonlat_to_merc(double lon, double lat) {
  lat = std::max(-MAX_LATITUDE, std::min(MAX_LATITUDE, lat));

  const double x = lon * M_PI / 180.0 * EARTH_RADIUS;
  const double y = std::log(std::tan(M_PI / 4.0 + lat * M_PI / 360.0)) * EARTH_RADIUS;

  return point_2d(x, y);
}

multi_polygon_2d project_to_merc(const multi_polygon_2d &geom) {
  multi_polygon_2d result;
  result.reserve(geom.size());

  for (auto const &poly : geom) {
    result.push_back(project_polygon(poly));
  }

  return result;
}

double projected_area(const multi_polygon_2d &geom) {
  double area = 0.0;

  for (auto const &poly : project_to_merc(geom)) {
    // the stored orientation isn't trusted, so fix it up before
    // measuring - otherwise holes might add area instead.
    polygon_2d p(poly);
    bg::correct(p);
    area += std::abs(bg::area(p));
  }

  return area;
}

} } // namespace footprint::util
