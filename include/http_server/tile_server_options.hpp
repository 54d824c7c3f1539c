#ifndef TILE_SERVER_OPTIONS_HPP
#define TILE_SERVER_OPTIONS_HPP

#include <memory>
#include <string>

#include "footprint.hpp"
#include "map_page.hpp"
#include "http_server/access_logger.hpp"

namespace http {
namespace server3 {

struct tile_server_options {
  tile_server_options();

  /// settings for making the tiles.
  footprint::tile_options tile;

  /// defaults for the map page.
  footprint::map_page_options page;

  /// tiles are only served up to this zoom.
  int max_zoom;

  /// max-age directive for tiles which can be cached.
  unsigned int max_age;

  /// zlib level for gzipped tiles. -1 is the zlib default.
  int compression_level;

  /// called for each request, if set.
  std::shared_ptr<access_logger> logger;
};

} } // namespace http::server3

#endif /* TILE_SERVER_OPTIONS_HPP */
