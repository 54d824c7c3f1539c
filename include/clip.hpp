#ifndef FOOTPRINT_CLIP_HPP
#define FOOTPRINT_CLIP_HPP

#include "geometry.hpp"

namespace footprint { namespace clip {

/* Project lon/lat polygons to spherical mercator and then onto the
 * integer grid of a tile, with `extent` units across the tile, (0, 0)
 * at the north-west corner and y increasing southwards.
 *
 * Consecutive vertices which round to the same grid point are merged.
 */
tile_multi_polygon to_tile_coords(const multi_polygon_2d &geom,
                                  const box_2d &merc_envelope,
                                  unsigned int extent);

/* Clip tile grid polygons to the tile, grown by `buffer` units on each
 * side.
 *
 * The result only contains valid polygons with non-zero area, with
 * exterior rings of positive and interior rings of negative area.
 * Polygons which collapsed or became invalid when they were snapped
 * to the grid are dropped. Throws if the clipping itself fails.
 */
tile_multi_polygon clip_to_tile(const tile_multi_polygon &geom,
                                unsigned int extent,
                                unsigned int buffer);

} } // namespace footprint::clip

#endif /* FOOTPRINT_CLIP_HPP */
