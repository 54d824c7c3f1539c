#include "clip.hpp"
#include "util.hpp"

#include <cmath>

#include <boost/geometry/algorithms/remove_spikes.hpp>

namespace footprint { namespace clip {

namespace {

// a closed ring needs at least three distinct points, plus the repeat
// of the first one.
const std::size_t min_ring_size = 4;

struct grid_transform {
  grid_transform(const box_2d &envelope, unsigned int extent)
    : m_min_x(envelope.min_corner().get<0>()),
      m_max_y(envelope.max_corner().get<1>()),
      m_scale_x(extent / (envelope.max_corner().get<0>() - m_min_x)),
      m_scale_y(extent / (m_max_y - envelope.min_corner().get<1>())) {
  }

  tile_point operator()(const point_2d &lonlat) const {
    const point_2d merc = util::lonlat_to_merc(lonlat.get<0>(), lonlat.get<1>());
    return tile_point(
      std::int64_t(std::llround((merc.get<0>() - m_min_x) * m_scale_x)),
      std::int64_t(std::llround((m_max_y - merc.get<1>()) * m_scale_y)));
  }

  double m_min_x, m_max_y, m_scale_x, m_scale_y;
};

template <typename Ring>
tile_ring transform_ring(const Ring &ring, const grid_transform &transform) {
  tile_ring result;
  result.reserve(ring.size());
  for (auto const &p : ring) {
    result.push_back(transform(p));
  }
  bg::unique(result);
  return result;
}

// tidy up a polygon after snapping to the grid. returns false if there's
// nothing worth keeping.
bool clean_polygon(tile_polygon &poly) {
  bg::unique(poly);
  bg::remove_spikes(poly);

  if (poly.outer().size() < min_ring_size) {
    return false;
  }

  auto &inners = poly.inners();
  for (auto itr = inners.begin(); itr != inners.end(); ) {
    if (itr->size() < min_ring_size) {
      itr = inners.erase(itr);
    } else {
      ++itr;
    }
  }

  bg::correct(poly);

  return (bg::area(poly) > 0) && bg::is_valid(poly);
}

} // anonymous namespace

tile_multi_polygon to_tile_coords(const multi_polygon_2d &geom,
                                  const box_2d &merc_envelope,
                                  unsigned int extent) {
  const grid_transform transform(merc_envelope, extent);

  tile_multi_polygon result;
  result.reserve(geom.size());

  for (auto const &poly : geom) {
    tile_polygon tp;
    tp.outer() = transform_ring(poly.outer(), transform);
    for (auto const &inner : poly.inners()) {
      tp.inners().push_back(transform_ring(inner, transform));
    }
    result.push_back(std::move(tp));
  }

  return result;
}

tile_multi_polygon clip_to_tile(const tile_multi_polygon &geom,
                                unsigned int extent,
                                unsigned int buffer) {
  const std::int64_t lo = -std::int64_t(buffer);
  const std::int64_t hi = std::int64_t(extent) + std::int64_t(buffer);
  const tile_box clip_box(tile_point(lo, lo), tile_point(hi, hi));

  tile_multi_polygon result;

  for (auto const &input : geom) {
    tile_polygon poly(input);
    if (!clean_polygon(poly)) {
      continue;
    }

    const tile_box envelope = bg::return_envelope<tile_box>(poly);

    if (bg::covered_by(envelope, clip_box)) {
      result.push_back(std::move(poly));

    } else if (!bg::disjoint(envelope, clip_box)) {
      tile_multi_polygon clipped;
      bg::intersection(clip_box, poly, clipped);

      for (auto &part : clipped) {
        if (clean_polygon(part)) {
          result.push_back(std::move(part));
        }
      }
    }
  }

  return result;
}

} } // namespace footprint::clip
