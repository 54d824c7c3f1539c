#ifndef FOOTPRINT_BUILDING_HPP
#define FOOTPRINT_BUILDING_HPP

#include "geometry.hpp"

#include <string>
#include <boost/optional.hpp>

namespace footprint {

/* A building footprint, as read from the dataset.
 *
 * The geometry is in WGS84 lon/lat and `bbox` is the precomputed
 * envelope stored alongside it. The bbox is only used as a cheap
 * prefilter, exact intersection tests use the geometry.
 */
struct building {
  std::string id;
  multi_polygon_2d geometry;
  box_2d bbox;
  boost::optional<std::string> name;
  boost::optional<double> height;
  boost::optional<std::string> building_class;
  boost::optional<std::string> subtype;
  boost::optional<int> num_floors;
};

} // namespace footprint

#endif /* FOOTPRINT_BUILDING_HPP */
