#ifndef FOOTPRINT_GEOMETRY_HPP
#define FOOTPRINT_GEOMETRY_HPP

#include <cstdint>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/geometries/polygon.hpp>
#include <boost/geometry/geometries/multi_polygon.hpp>

namespace footprint {

namespace bg = boost::geometry;

// geographic (lon, lat) or projected (x, y) coordinates, depending on
// where they're used.
using point_2d = bg::model::point<double, 2, bg::cs::cartesian>;
using box_2d = bg::model::box<point_2d>;
// the OGC standard states that the outer ring of a polygon should
// contain points ordered in a counter-clockwise direction, which is
// the opposite of boost::geometry's default, and that rings should
// be closed (i.e: first point == last point), which is the default.
using polygon_2d = bg::model::polygon<point_2d, false, true>;
using multi_polygon_2d = bg::model::multi_polygon<polygon_2d>;

// integer coordinates in the tile-local grid. counter-clockwise with
// respect to the raw coordinate values means a positive area by the
// surveyor's formula, which is what vector tiles want for exterior
// rings (it appears clockwise once y is flipped to point down).
using tile_point = bg::model::point<std::int64_t, 2, bg::cs::cartesian>;
using tile_box = bg::model::box<tile_point>;
using tile_ring = bg::model::ring<tile_point, false, true>;
using tile_polygon = bg::model::polygon<tile_point, false, true>;
using tile_multi_polygon = bg::model::multi_polygon<tile_polygon>;

} // namespace footprint

#endif /* FOOTPRINT_GEOMETRY_HPP */
