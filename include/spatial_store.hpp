#ifndef FOOTPRINT_SPATIAL_STORE_HPP
#define FOOTPRINT_SPATIAL_STORE_HPP

#include "building.hpp"
#include "either.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace footprint {

/* Why a query didn't produce a result. Modelled on HTTP status codes,
 * in the same way as the other status enums, which makes them easy to
 * read in logs.
 */
enum class query_status : std::uint16_t {
  /* the store failed: it's unavailable, the query was malformed or
   * the index is missing. */
  store_error = 500,
  /* the query ran past its deadline and was interrupted. */
  timeout = 504,
};

struct query_error {
  query_status status;
  std::string message;
};

/* Count and total area of the features in a region. */
struct aggregate_stats {
  aggregate_stats() : count(0), area(0.0) {}
  aggregate_stats(std::uint64_t c, double a) : count(c), area(a) {}

  std::uint64_t count;
  // square metres, measured in spherical mercator (EPSG:3857)
  double area;
};

typedef either<std::vector<building>, query_error> query_response;
typedef either<aggregate_stats, query_error> aggregate_response;

/* Interface for handles onto the indexed building dataset.
 *
 * A handle is owned by exactly one worker: implementations are not
 * required to be safe for concurrent use, and should not be shared.
 * Failures are reported in the response rather than thrown.
 */
struct spatial_store {
  virtual ~spatial_store();

  // returns every feature whose bbox overlaps `bbox` (lon/lat), i.e:
  //   bbox.xmin <= maxLon AND bbox.xmax >= minLon AND
  //   bbox.ymin <= maxLat AND bbox.ymax >= minLat
  // this is a prefilter only; the geometry may not touch `bbox`.
  virtual query_response query_in_bbox(const box_2d &bbox) = 0;

  // count and projected area of the same set of features.
  virtual aggregate_response aggregate_in_bbox(const box_2d &bbox) = 0;
};

} // namespace footprint

#endif /* FOOTPRINT_SPATIAL_STORE_HPP */
