#include "http_server/tile_handler_factory.hpp"
#include "http_server/tile_request_handler.hpp"

namespace http {
namespace server3 {

tile_handler_factory::tile_handler_factory(const tile_server_options &opts,
                                           store_factory make_store,
                                           std::shared_ptr<footprint::view_register> views,
                                           std::shared_ptr<footprint::stats_register> stats)
  : options_(opts),
    make_store_(make_store),
    views_(views),
    stats_(stats) {
}

tile_handler_factory::~tile_handler_factory() {
}

void tile_handler_factory::thread_setup(boost::thread_specific_ptr<request_handler> &ptr) {
  ptr.reset(new tile_request_handler(options_, make_store_(), views_, stats_));
}

} // namespace server3
} // namespace http
