#ifndef FOOTPRINT_WKB_HPP
#define FOOTPRINT_WKB_HPP

#include "geometry.hpp"

#include <string>

namespace footprint { namespace wkb {

/* Decode an OGC well-known binary geometry into polygons.
 *
 * Either byte order is accepted, as are the ISO and EWKB flavours of
 * the type code (Z/M dimensions are read and discarded, an EWKB SRID
 * is skipped). Polygon and MultiPolygon geometries are appended to
 * `out` and the function returns true. Any other geometry type leaves
 * `out` untouched and returns false.
 *
 * Throws std::runtime_error if the data is truncated or malformed.
 */
bool read_polygons(const std::string &data, multi_polygon_2d &out);

/* Same as `read_polygons`, but for well-known text. */
bool read_polygons_wkt(const std::string &text, multi_polygon_2d &out);

// encode polygons as little-endian WKB. a single polygon is written as
// a Polygon, anything else as a MultiPolygon.
std::string write_polygons(const multi_polygon_2d &geom);

} } // namespace footprint::wkb

#endif /* FOOTPRINT_WKB_HPP */
