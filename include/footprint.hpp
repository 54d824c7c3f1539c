#ifndef FOOTPRINT_HPP
#define FOOTPRINT_HPP

#include "building.hpp"
#include "spatial_store.hpp"
#include "tile.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace footprint {

/* Settings for building vector tiles. */
struct tile_options {
  tile_options();

  // name of the single layer in each tile.
  std::string layer_name;

  // number of integer units across the width of the tile.
  unsigned int extent;

  // the size of the buffer, in the same units as `extent`, which adds
  // a "border" around the tile so that renderers don't draw the clip
  // edge of a polygon which continues into the next tile.
  unsigned int buffer;

  // below this zoom, tiles are always empty and the store isn't queried.
  int min_zoom;
};

/**
 * make_vector_tile adds building footprints to a vector tile object.
 *
 * Each feature is projected to spherical mercator, snapped to the
 * integer grid of the tile, clipped to the tile plus its buffer and
 * written with its `id`, `name`, `height` and `class` attributes to a
 * layer named by `options.layer_name`. Features which don't overlap
 * the tile, or which collapse to nothing on the grid, are skipped. A
 * feature whose geometry can't be processed is logged and skipped,
 * and doesn't affect the rest of the tile.
 *
 * If no features are written, then the tile is left without any
 * layers, which serialises to an empty (but valid) vector tile.
 *
 * Returns true if any features were added to the tile.
 */
bool make_vector_tile(tile &tile,
                      const std::vector<building> &features,
                      const tile_options &options);

enum class tile_status {
  // tile was built from the results of a store query
  ok,
  // tile is empty because the zoom is below the minimum
  below_min_zoom,
  // tile is empty because the store query failed
  degraded
};

std::ostream &operator<<(std::ostream &, tile_status);

/* Build the buildings tile at the coordinates of `tile`, querying the
 * store for the features in the tile's lon/lat bounds.
 *
 * Store failures are logged and result in an empty tile with status
 * `degraded`, so that callers can avoid caching it.
 */
tile_status make_building_tile(tile &tile,
                               spatial_store &store,
                               const tile_options &options);

} // namespace footprint

#endif /* FOOTPRINT_HPP */
