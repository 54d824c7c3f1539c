#ifndef HTTP_SERVER3_TILE_REQUEST_HANDLER_HPP
#define HTTP_SERVER3_TILE_REQUEST_HANDLER_HPP

#include <map>
#include <memory>
#include <string>

#include "spatial_store.hpp"
#include "view_state.hpp"
#include "http_server/request_handler.hpp"
#include "http_server/tile_server_options.hpp"

namespace http {
namespace server3 {

struct reply;
struct request;

/// The handler for building tiles, the view register and the map page.
class tile_request_handler
  : public request_handler
{
public:
  tile_request_handler(const tile_server_options &options,
                       std::unique_ptr<footprint::spatial_store> store,
                       std::shared_ptr<footprint::view_register> views,
                       std::shared_ptr<footprint::stats_register> stats);

  /// Handle a request and produce a reply.
  void handle_request(const request& req, reply& rep);

private:
  tile_server_options options_;

  /// this thread's own handle onto the building store.
  std::unique_ptr<footprint::spatial_store> store_;

  std::shared_ptr<footprint::view_register> views_;
  std::shared_ptr<footprint::stats_register> stats_;

  /// Cache-Control header value for tiles. pre-rendered to a string.
  std::string cache_control_value_;

  /// Implementation detail of handling a request and producing a reply.
  void handle_request_impl(const request& req, reply& rep);

  void handle_request_tile(const request &req, reply &rep, const std::string &path);
  void handle_update_view(const request &req, reply &rep);
  void handle_get_bounds(reply &rep);
  void handle_stats(reply &rep);
  void handle_map_page(reply &rep, const std::map<std::string, std::string> &params);
};

} // namespace server3
} // namespace http

#endif // HTTP_SERVER3_TILE_REQUEST_HANDLER_HPP
