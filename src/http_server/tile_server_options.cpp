#include "http_server/tile_server_options.hpp"

namespace http {
namespace server3 {

tile_server_options::tile_server_options()
  : tile(),
    page(),
    max_zoom(22),
    max_age(3600),
    compression_level(-1),
    logger() {
}

} } // namespace http::server3
