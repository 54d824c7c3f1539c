#include "http_server/tile_request_handler.hpp"
#include "http_server/parse_path.hpp"
#include "http_server/reply.hpp"
#include "http_server/request.hpp"

#include <chrono>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>

#include "footprint.hpp"
#include "logging/logger.hpp"
#include "map_page.hpp"
#include "util.hpp"
#include "view_json.hpp"

namespace {

const char *tile_content_type = "application/vnd.mapbox-vector-tile";
const char *json_content_type = "application/json";

void set_content(http::server3::reply &rep, http::server3::reply::status_type status,
                 const std::string &content_type, const std::string &content) {
  rep.status = status;
  rep.content = content;
  rep.headers.clear();
  rep.set_header("Content-Length", boost::lexical_cast<std::string>(rep.content.size()));
  rep.set_header("Content-Type", content_type);
}

void method_not_allowed(http::server3::reply &rep, const std::string &allow) {
  rep = http::server3::reply::stock_reply(http::server3::reply::method_not_allowed);
  rep.set_header("Allow", allow);
}

bool accepts_gzip(const http::server3::request &req) {
  boost::optional<std::string> encoding = req.find_header("Accept-Encoding");
  return encoding && boost::algorithm::icontains(*encoding, "gzip");
}

} // anonymous namespace

namespace http {
namespace server3 {

tile_request_handler::tile_request_handler(const tile_server_options &options,
                                           std::unique_ptr<footprint::spatial_store> store,
                                           std::shared_ptr<footprint::view_register> views,
                                           std::shared_ptr<footprint::stats_register> stats)
  : options_(options),
    store_(std::move(store)),
    views_(views),
    stats_(stats),
    cache_control_value_((boost::format("public, max-age=%1%") % options.max_age).str()) {
}

void tile_request_handler::handle_request(const request &req, reply &rep) {
  try {
    handle_request_impl(req, rep);

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Error while handling \"%1% %2%\": %3%") % req.method % req.uri % e.what());
    rep = reply::stock_reply(reply::internal_server_error);
  }

  rep.set_header("Access-Control-Allow-Origin", "*");
  rep.set_header("Date", http_date(
    boost::posix_time::second_clock::universal_time()));

  if (options_.logger) {
    options_.logger->log(req, rep);
  }
}

void tile_request_handler::handle_request_impl(const request &req, reply &rep) {
  std::string path;
  std::map<std::string, std::string> params;
  if (!split_uri(req.uri, path, params)) {
    rep = reply::stock_reply(reply::bad_request);
    return;
  }

  if (req.method == "OPTIONS") {
    rep = reply::stock_reply(reply::no_content);
    rep.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    rep.set_header("Access-Control-Allow-Headers", "Content-Type");
    rep.set_header("Access-Control-Max-Age", "86400");
    return;
  }

  if (path == "/update-view") {
    if (req.method != "POST") { method_not_allowed(rep, "POST, OPTIONS"); return; }
    handle_update_view(req, rep);
    return;
  }

  if (req.method != "GET") {
    method_not_allowed(rep, "GET, OPTIONS");
    return;
  }

  if (path == "/health") {
    set_content(rep, reply::ok, "text/plain", "OK");

  } else if (path == "/get-bounds") {
    handle_get_bounds(rep);

  } else if (path == "/stats") {
    handle_stats(rep);

  } else if (path == "/") {
    handle_map_page(rep, params);

  } else if (boost::algorithm::starts_with(path, "/tiles/")) {
    handle_request_tile(req, rep, path);

  } else {
    rep = reply::stock_reply(reply::not_found);
  }
}

void tile_request_handler::handle_request_tile(const request &req, reply &rep,
                                               const std::string &path) {
  int z = 0, x = 0, y = 0;
  if (!parse_tile_path(path, z, x, y)) {
    rep = reply::stock_reply(reply::not_found);
    return;
  }

  if (!footprint::util::valid_tile(z, x, y, options_.max_zoom)) {
    set_content(rep, reply::bad_request, "text/plain",
                (boost::format("Invalid tile coordinates %1%/%2%/%3%.") % z % x % y).str());
    return;
  }

  const auto start = std::chrono::steady_clock::now();

  footprint::tile tile(z, x, y);
  const footprint::tile_status status =
    footprint::make_building_tile(tile, *store_, options_.tile);

  const bool gzip = accepts_gzip(req);
  set_content(rep, reply::ok, tile_content_type,
              gzip ? tile.get_gzip_data(options_.compression_level) : tile.get_data());

  if (gzip) {
    rep.set_header("Content-Encoding", "gzip");
  }
  rep.set_header("Vary", "Accept-Encoding");

  // a degraded tile is only a stand-in, and shouldn't be kept.
  if (status != footprint::tile_status::degraded) {
    rep.set_header("Cache-Control", cache_control_value_);
  }

  LOG_DEBUG(boost::format("Tile %1%/%2%/%3%: total=%4$.3fs, size=%5% bytes, status=%6%")
            % z % x % y
            % std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count()
            % rep.content.size() % status);
}

void tile_request_handler::handle_update_view(const request &req, reply &rep) {
  footprint::either<footprint::viewport, std::string> update =
    footprint::json::parse_view_update(req.body);

  if (update.is_right()) {
    set_content(rep, reply::bad_request, json_content_type,
                footprint::json::status_response(update.right()));
    return;
  }

  views_->set_view(update.left());
  set_content(rep, reply::ok, json_content_type,
              footprint::json::status_response(boost::none));
}

void tile_request_handler::handle_get_bounds(reply &rep) {
  set_content(rep, reply::ok, json_content_type,
              footprint::json::bounds_response(views_->get_view()));
}

void tile_request_handler::handle_stats(reply &rep) {
  boost::optional<footprint::stats_snapshot> snapshot = stats_->get();
  set_content(rep, reply::ok, json_content_type,
              footprint::json::stats_to_json(snapshot.get_value_or(footprint::stats_snapshot())));
}

void tile_request_handler::handle_map_page(reply &rep, const std::map<std::string, std::string> &params) {
  set_content(rep, reply::ok, "text/html; charset=utf-8",
              footprint::make_map_page(params, options_.page));
}

} // namespace server3
} // namespace http
