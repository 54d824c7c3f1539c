#ifndef TILE_HANDLER_FACTORY_HPP
#define TILE_HANDLER_FACTORY_HPP

#include <functional>
#include <memory>
#include <boost/thread/tss.hpp>

#include "spatial_store.hpp"
#include "view_state.hpp"
#include "http_server/handler_factory.hpp"
#include "http_server/tile_server_options.hpp"

namespace http {
namespace server3 {

/* Each thread needs its own handle onto the building store, since the
 * handles can't be shared. Rather than pool them, this factory opens a
 * new store for each thread, and gives it a `tile_request_handler`
 * which owns it. The view and stats registers are shared by all of
 * the handlers.
 */
struct tile_handler_factory : public handler_factory {
  typedef std::function<std::unique_ptr<footprint::spatial_store> ()> store_factory;

  tile_handler_factory(const tile_server_options &options,
                       store_factory make_store,
                       std::shared_ptr<footprint::view_register> views,
                       std::shared_ptr<footprint::stats_register> stats);
  virtual ~tile_handler_factory();

  virtual void thread_setup(boost::thread_specific_ptr<request_handler> &tss);

private:
  tile_server_options options_;
  store_factory make_store_;
  std::shared_ptr<footprint::view_register> views_;
  std::shared_ptr<footprint::stats_register> stats_;
};

} } // namespace http::server3

#endif /* TILE_HANDLER_FACTORY_HPP */
