#ifndef FOOTPRINT_UTIL_HPP
#define FOOTPRINT_UTIL_HPP

#include "geometry.hpp"

namespace footprint { namespace util {

// returns the geographic (WGS84 lon/lat) bounding box of a conventional
// z/x/y tile. min_corner is (west, south) and max_corner is (east, north).
// the arguments must already be valid, see `valid_tile`.
box_2d bbox_for_tile(int z, int x, int y);

// returns the bounding box in mercator coordinates for a
// conventional z/x/y tile.
box_2d box_for_tile(int z, int x, int y);

// true if 0 <= z <= max_zoom and both x and y are in [0, 2^z).
bool valid_tile(int z, int x, int y, int max_zoom);

// project a WGS84 lon/lat position onto spherical mercator (EPSG:3857).
// latitude is clamped to the range the projection covers.
point_2d lonlat_to_merc(double lon, double lat);

// project every vertex of a lon/lat geometry onto spherical mercator.
multi_polygon_2d project_to_merc(const multi_polygon_2d &geom);

// area of the geometry in projected (EPSG:3857) square metres.
double projected_area(const multi_polygon_2d &geom);

} } // namespace footprint::util

#endif // FOOTPRINT_UTIL_HPP
