#include "footprint.hpp"
#include "backend.hpp"
#include "clip.hpp"
#include "logging/logger.hpp"
#include "store_io.hpp"
#include "util.hpp"
#include "vector_tile.pb.h"

#include <chrono>
#include <ostream>

#include <boost/format.hpp>

namespace footprint {

namespace {

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

} // anonymous namespace

tile_options::tile_options()
  : layer_name("buildings"),
    extent(4096),
    buffer(256),
    min_zoom(10) {
}

bool make_vector_tile(tile &tile,
                      const std::vector<building> &features,
                      const tile_options &options) {
  const box_2d envelope = util::box_for_tile(tile.z, tile.x, tile.y);

  backend b(tile.mvt(), options.extent);
  b.start_tile_layer(options.layer_name);

  for (auto const &feature : features) {
    tile_multi_polygon geom;
    try {
      geom = clip::clip_to_tile(
        clip::to_tile_coords(feature.geometry, envelope, options.extent),
        options.extent, options.buffer);

    } catch (const std::exception &e) {
      LOG_WARNING(boost::format("Dropping feature \"%1%\" from tile %2%/%3%/%4%: %5%")
                  % feature.id % tile.z % tile.x % tile.y % e.what());
      continue;
    }

    if (geom.empty()) {
      continue;
    }

    b.start_tile_feature(feature);
    b.add_path(geom);
    b.stop_tile_feature();
  }

  const bool painted = b.feature_count() > 0;
  b.stop_tile_layer();

  return painted;
}

std::ostream &operator<<(std::ostream &out, tile_status status) {
  switch (status) {
  case tile_status::ok:             out << "OK"; break;
  case tile_status::below_min_zoom: out << "Below Minimum Zoom"; break;
  case tile_status::degraded:       out << "Degraded"; break;
  }
  return out;
}

tile_status make_building_tile(tile &tile,
                               spatial_store &store,
                               const tile_options &options) {
  if (int(tile.z) < options.min_zoom) {
    return tile_status::below_min_zoom;
  }

  const auto start = std::chrono::steady_clock::now();
  const box_2d bbox = util::bbox_for_tile(tile.z, tile.x, tile.y);

  query_response response = store.query_in_bbox(bbox);
  const double query_time = seconds_since(start);

  if (response.is_right()) {
    LOG_ERROR(boost::format("Query for tile %1%/%2%/%3% failed: %4%")
              % tile.z % tile.x % tile.y % response.right());
    return tile_status::degraded;
  }

  const std::vector<building> &features = response.left();
  make_vector_tile(tile, features, options);

  LOG_DEBUG(boost::format("Tile %1%/%2%/%3%: total=%4$.3fs, query=%5$.3fs, features=%6%")
            % tile.z % tile.x % tile.y % seconds_since(start) % query_time % features.size());

  return tile_status::ok;
}

} // namespace footprint
