#include "common.hpp"
#include "logging/logger.hpp"
#include "http_server/server.hpp"
#include "http_server/parse_path.hpp"
#include "http_server/request.hpp"
#include "http_server/request_parser.hpp"
#include "http_server/reply.hpp"
#include "http_server/tile_handler_factory.hpp"
#include "store/sqlite_store.hpp"
#include "tile.hpp"
#include "view_json.hpp"
#include "vector_tile.pb.h"

#include <atomic>
#include <iostream>
#include <iterator>
#include <memory>
#include <mutex>
#include <vector>
#include <boost/asio.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/thread.hpp>
#include <boost/tuple/tuple.hpp>

using http::server3::server_options;
using http::server3::tile_server_options;
using http::server3::tile_handler_factory;
using footprint::spatial_store;

namespace {

struct request_counter : public http::server3::access_logger {
  request_counter() : num_requests(0) {}
  virtual ~request_counter() {}
  virtual void log(const http::server3::request &, const http::server3::reply &) {
    std::unique_lock<std::mutex> lock(mutex);
    ++num_requests;
  }
  std::mutex mutex;
  std::size_t num_requests;
};

/* counts the tile queries, and optionally fails them all. */
struct mock_store : public spatial_store {
  mock_store(std::atomic<int> &queries_, bool fail_) : queries(queries_), fail(fail_) {}
  virtual ~mock_store() {}

  virtual footprint::query_response query_in_bbox(const footprint::box_2d &) {
    ++queries;
    if (fail) {
      footprint::query_error err;
      err.status = footprint::query_status::store_error;
      err.message = "database is locked";
      return footprint::query_response(err);
    }
    return footprint::query_response(std::vector<footprint::building>());
  }

  virtual footprint::aggregate_response aggregate_in_bbox(const footprint::box_2d &) {
    return footprint::aggregate_response(footprint::aggregate_stats());
  }

  std::atomic<int> &queries;
  bool fail;
};

struct server_guard {
  std::shared_ptr<footprint::view_register> views;
  std::shared_ptr<footprint::stats_register> stats;
  server_options srv_opt;
  http::server3::server server;
  std::string port;

  server_guard(tile_handler_factory::store_factory make_store,
               std::shared_ptr<http::server3::access_logger> logger
                 = std::shared_ptr<http::server3::access_logger>())
    : views(std::make_shared<footprint::view_register>())
    , stats(std::make_shared<footprint::stats_register>())
    , srv_opt(default_options(make_store, logger, views, stats))
    , server(srv_opt)
    , port(server.port()) {

    server.run(false);
  }

  ~server_guard() {
    server.stop();
  }

  static server_options default_options(tile_handler_factory::store_factory make_store,
                                        std::shared_ptr<http::server3::access_logger> logger,
                                        std::shared_ptr<footprint::view_register> views,
                                        std::shared_ptr<footprint::stats_register> stats) {
    tile_server_options tile_opts;
    tile_opts.max_age = 60;
    tile_opts.logger = logger;

    server_options options;
    options.address = "127.0.0.1";
    options.port = "0";
    options.thread_hint = 1;
    options.handle_signals = false;
    options.factory.reset(new tile_handler_factory(tile_opts, make_store, views, stats));
    return options;
  }
};

tile_handler_factory::store_factory counting_stores(std::atomic<int> &queries, bool fail = false) {
  return [&queries, fail]() {
    return std::unique_ptr<spatial_store>(new mock_store(queries, fail));
  };
}

tile_handler_factory::store_factory dataset_stores(const std::string &path) {
  return [path]() {
    return std::unique_ptr<spatial_store>(
      new footprint::store::sqlite_store(path, footprint::store::sqlite_store_options()));
  };
}

void read_tile(footprint::tile &t, const test::http_response &response) {
  t.from_string(response.body);
}

void test_health() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_get(guard.port, "/health");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.body, "OK", "body");
  test::assert_equal<std::string>(r.header("Content-Type").get_value_or(""), "text/plain", "content type");
  test::assert_equal<std::string>(r.header("Access-Control-Allow-Origin").get_value_or(""), "*", "CORS");
  test::assert_equal<bool>(bool(r.header("Date")), true, "date header");
}

void test_empty_tile() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_get(guard.port, "/tiles/12/2106/1351.pbf");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.body, "", "empty tile body");
  test::assert_equal<std::string>(r.header("Content-Type").get_value_or(""),
                                  "application/vnd.mapbox-vector-tile", "content type");
  test::assert_equal<std::string>(r.header("Cache-Control").get_value_or(""), "public, max-age=60", "cache control");
  test::assert_equal<std::string>(r.header("Content-Length").get_value_or(""), "0", "content length");
  test::assert_equal<std::string>(r.header("Access-Control-Allow-Origin").get_value_or(""), "*", "CORS");
  test::assert_equal<int>(queries.load(), 1, "store queried once");
}

void test_below_min_zoom() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_get(guard.port, "/tiles/5/16/10.pbf");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.body, "", "empty tile body");
  test::assert_equal<bool>(bool(r.header("Cache-Control")), true, "low zoom tiles can be cached");
  test::assert_equal<int>(queries.load(), 0, "store not queried below min zoom");
}

void test_degraded_tile() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries, true));

  test::http_response r = test::http_get(guard.port, "/tiles/12/2106/1351.pbf");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.body, "", "empty tile body");
  test::assert_equal<bool>(bool(r.header("Cache-Control")), false, "degraded tile isn't cacheable");
  test::assert_equal<int>(queries.load(), 1, "store queried");
}

void test_bad_tile_paths() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  const char *not_found[] = {
    "/tiles/12/2106.pbf",
    "/tiles/12/2106/1351.png",
    "/tiles/a/b/c.pbf",
    "/tiles/12/2106/1351/7.pbf",
    "/tiles/12/0/-1.pbf",
    "/tiles/-1/0/0.pbf",
    "/nothing/here",
  };
  for (const char *path : not_found) {
    test::http_response r = test::http_get(guard.port, path);
    test::assert_equal<int>(r.status, 404, path);
  }

  const char *bad_request[] = {
    "/tiles/12/4096/0.pbf",
    "/tiles/12/0/4096.pbf",
    "/tiles/23/0/0.pbf",
  };
  for (const char *path : bad_request) {
    test::http_response r = test::http_get(guard.port, path);
    test::assert_equal<int>(r.status, 400, path);
  }

  test::assert_equal<int>(queries.load(), 0, "store never queried");
}

void test_tile_from_dataset() {
  std::vector<test::feature> features;
  features.push_back(test::feature("w1", "POLYGON((5.12 52.08, 5.13 52.08, 5.13 52.09, 5.12 52.09, 5.12 52.08))")
                     .name("Dom").building_class("religious"));
  features.push_back(test::feature("w2", "POLYGON((6.0 53.0, 6.01 53.0, 6.01 53.01, 6.0 53.01, 6.0 53.0))"));
  test::dataset data(features);
  server_guard guard(dataset_stores(data.path()));

  test::http_response r = test::http_get(guard.port, "/tiles/12/2106/1351.pbf");
  test::assert_equal<int>(r.status, 200, "status");

  footprint::tile t(12, 2106, 1351);
  read_tile(t, r);
  test::assert_equal<int>(t.mvt().layers_size(), 1, "layers");
  const vector_tile::Tile_Layer &layer = t.mvt().layers(0);
  test::assert_equal<std::string>(layer.name(), "buildings", "layer name");
  test::assert_equal<int>(layer.features_size(), 1, "features");

  std::map<std::string, std::string> tags = test::decode_tags(layer, layer.features(0));
  test::assert_equal<std::string>(tags["id"], "w1", "id");
  test::assert_equal<std::string>(tags["name"], "Dom", "name");
  test::assert_equal<std::string>(tags["class"], "religious", "class");

  // a tile with nothing in it
  r = test::http_get(guard.port, "/tiles/12/0/0.pbf");
  test::assert_equal<int>(r.status, 200, "empty status");
  test::assert_equal<std::string>(r.body, "", "empty tile body");
}

void test_gzip_tile() {
  std::vector<test::feature> features;
  features.push_back(test::feature("w1", "POLYGON((5.12 52.08, 5.13 52.08, 5.13 52.09, 5.12 52.09, 5.12 52.08))"));
  test::dataset data(features);
  server_guard guard(dataset_stores(data.path()));

  std::map<std::string, std::string> headers;
  headers["Accept-Encoding"] = "deflate, gzip";
  test::http_response r = test::http_request(guard.port, "GET", "/tiles/12/2106/1351.pbf", headers);

  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.header("Content-Encoding").get_value_or(""), "gzip", "content encoding");
  test::assert_equal<std::string>(r.header("Vary").get_value_or(""), "Accept-Encoding", "vary");
  test::assert_greater_or_equal<std::size_t>(r.body.size(), 2, "body size");
  test::assert_equal<int>(int((unsigned char)r.body[0]), 0x1f, "gzip magic");

  footprint::tile t(12, 2106, 1351);
  read_tile(t, r);
  test::assert_equal<int>(t.mvt().layers_size(), 1, "layers");
  test::assert_equal<int>(t.mvt().layers(0).features_size(), 1, "features");

  // and without asking for gzip
  r = test::http_get(guard.port, "/tiles/12/2106/1351.pbf");
  test::assert_equal<bool>(bool(r.header("Content-Encoding")), false, "not encoded");
  footprint::tile plain(12, 2106, 1351);
  read_tile(plain, r);
  test::assert_equal<int>(plain.mvt().layers_size(), 1, "plain layers");
}

void test_update_view() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_get(guard.port, "/get-bounds");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.body, "{\"bounds\":null}", "no view yet");
  test::assert_equal<std::string>(r.header("Content-Type").get_value_or(""), "application/json", "content type");

  const std::string view = test::json()
    ("bounds", test::json()("north", 52.1)("south", 52.0)("east", 5.2)("west", 5.0))
    ("zoom", 15.5).str();
  r = test::http_post(guard.port, "/update-view", view);
  test::assert_equal<int>(r.status, 200, "update status");
  test::assert_equal<std::string>(r.body, "{\"status\":\"ok\"}", "update body");

  r = test::http_get(guard.port, "/get-bounds");
  test::assert_equal<std::string>(
    r.body, "{\"bounds\":{\"north\":52.1,\"south\":52,\"east\":5.2,\"west\":5,\"zoom\":15.5}}", "view");

  boost::optional<footprint::viewport> stored = guard.views->get_view();
  test::assert_equal<bool>(bool(stored), true, "register updated");
  test::assert_equal<double>(stored->north, 52.1, "north");
}

void test_update_view_errors() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_post(guard.port, "/update-view", "{}");
  test::assert_equal<int>(r.status, 400, "no bounds");
  test::assert_equal<std::string>(r.body, "{\"status\":\"error\",\"message\":\"No bounds provided\"}", "no bounds body");

  r = test::http_post(guard.port, "/update-view", "{\"bounds\":");
  test::assert_equal<int>(r.status, 400, "invalid JSON");

  r = test::http_post(guard.port, "/update-view",
                      test::json()("bounds", test::json()("north", 52.1)).str());
  test::assert_equal<int>(r.status, 400, "incomplete bounds");

  r = test::http_get(guard.port, "/update-view");
  test::assert_equal<int>(r.status, 405, "GET not allowed");
  test::assert_equal<bool>(bool(r.header("Allow")), true, "Allow header");

  r = test::http_post(guard.port, "/health", "{}");
  test::assert_equal<int>(r.status, 405, "POST not allowed elsewhere");

  // nothing was stored
  r = test::http_get(guard.port, "/get-bounds");
  test::assert_equal<std::string>(r.body, "{\"bounds\":null}", "still no view");
}

void test_body_too_large() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  std::map<std::string, std::string> headers;
  headers["Content-Length"] = "2000000";
  test::http_response r = test::http_request(guard.port, "POST", "/update-view", headers);
  test::assert_equal<int>(r.status, 400, "oversized body");
}

void test_stats() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_get(guard.port, "/stats");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.body, "{\"count\":0,\"area\":0,\"bounds\":null}", "no stats yet");

  footprint::stats_snapshot s;
  s.stats = footprint::aggregate_stats(3, 150.5);
  s.view = footprint::viewport(1.0, 0.0, 1.0, 0.0, 10.0);
  guard.stats->set(s);

  r = test::http_get(guard.port, "/stats");
  test::assert_equal<std::string>(
    r.body, "{\"count\":3,\"area\":150.5,\"bounds\":{\"north\":1,\"south\":0,\"east\":1,\"west\":0,\"zoom\":10}}",
    "published stats");
}

void test_options_preflight() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_request(guard.port, "OPTIONS", "/update-view");
  test::assert_equal<int>(r.status, 204, "status");
  test::assert_equal<std::string>(r.header("Access-Control-Allow-Origin").get_value_or(""), "*", "origin");
  test::assert_equal<bool>(bool(r.header("Access-Control-Allow-Methods")), true, "methods");
  test::assert_equal<std::string>(r.header("Access-Control-Allow-Headers").get_value_or(""), "Content-Type", "headers");
  test::assert_equal<std::string>(r.body, "", "no body");
}

void test_map_page() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  test::http_response r = test::http_get(guard.port, "/?lng=4.9&lat=52.37&zoom=12&color=%23ff0000");
  test::assert_equal<int>(r.status, 200, "status");
  test::assert_equal<std::string>(r.header("Content-Type").get_value_or(""), "text/html; charset=utf-8", "content type");
  test::assert_equal<bool>(r.body.find("center: [4.9, 52.37]") != std::string::npos, true, "centre from query");
  test::assert_equal<bool>(r.body.find("'#ff0000'") != std::string::npos, true, "colour from query");
}

void test_access_log() {
  std::atomic<int> queries(0);
  std::shared_ptr<request_counter> counter = std::make_shared<request_counter>();
  {
    server_guard guard(counting_stores(queries), counter);
    test::http_get(guard.port, "/health");
    test::http_get(guard.port, "/tiles/12/2106/1351.pbf");
    test::http_get(guard.port, "/nothing");
  }
  test::assert_equal<std::size_t>(counter->num_requests, 3, "every request logged");
}

void test_parse_tile_path() {
  using http::server3::parse_tile_path;
  int z = -1, x = -1, y = -1;

  test::assert_equal<bool>(parse_tile_path("/tiles/12/2106/1351.pbf", z, x, y), true, "valid path");
  test::assert_equal<int>(z, 12, "z");
  test::assert_equal<int>(x, 2106, "x");
  test::assert_equal<int>(y, 1351, "y");

  test::assert_equal<bool>(parse_tile_path("/tiles/0/0/0.pbf", z, x, y), true, "zero tile");
  test::assert_equal<bool>(parse_tile_path("/tiles/12/2106/1351.mvt", z, x, y), false, "wrong extension");
  test::assert_equal<bool>(parse_tile_path("/tile/12/2106/1351.pbf", z, x, y), false, "wrong prefix");
  test::assert_equal<bool>(parse_tile_path("/tiles/12/2106.pbf", z, x, y), false, "too few numbers");
  test::assert_equal<bool>(parse_tile_path("/tiles/1.5/2106/1351.pbf", z, x, y), false, "fraction");
  test::assert_equal<bool>(parse_tile_path("/tiles/12/x/1351.pbf", z, x, y), false, "not a number");
  test::assert_equal<bool>(parse_tile_path("/tiles/12/99999999999/1351.pbf", z, x, y), false, "overflow");
  test::assert_equal<bool>(parse_tile_path("/tiles/12/-5/1351.pbf", z, x, y), false, "negative");
  test::assert_equal<bool>(parse_tile_path("/tiles/12/+5/1351.pbf", z, x, y), false, "plus sign");
  test::assert_equal<bool>(parse_tile_path("/tiles/12//1351.pbf", z, x, y), false, "empty number");
  test::assert_equal<bool>(parse_tile_path("/tiles/.pbf", z, x, y), false, "no numbers");

  // failures leave the outputs alone
  test::assert_equal<int>(z, 0, "z untouched");
}

void test_split_uri() {
  using http::server3::request_handler;
  std::string path;
  std::map<std::string, std::string> params;

  test::assert_equal<bool>(request_handler::split_uri("/health", path, params), true, "no query");
  test::assert_equal<std::string>(path, "/health", "path");
  test::assert_equal<std::size_t>(params.size(), 0, "no params");

  test::assert_equal<bool>(request_handler::split_uri("/?lng=4.9&color=%23ff0000&flag&lng=1", path, params), true, "query");
  test::assert_equal<std::string>(path, "/", "path");
  test::assert_equal<std::string>(params["lng"], "4.9", "first value wins");
  test::assert_equal<std::string>(params["color"], "#ff0000", "decoded");
  test::assert_equal<std::size_t>(params.count("flag"), 1, "valueless param");

  test::assert_equal<bool>(request_handler::split_uri("/bad%zz", path, params), false, "bad encoding");
}

void test_url_decode_escapes() {
  using http::server3::request_handler;
  std::string out;

  test::assert_equal<bool>(request_handler::url_decode("a%2Fb%2fc", out), true, "hex escapes");
  test::assert_equal<std::string>(out, "a/b/c", "decoded");

  // both characters after the % must be hex digits
  test::assert_equal<bool>(request_handler::url_decode("%4G", out), false, "half an escape");
  test::assert_equal<bool>(request_handler::url_decode("%G4", out), false, "leading non-hex");
  test::assert_equal<bool>(request_handler::url_decode("%-1", out), false, "sign");
  test::assert_equal<bool>(request_handler::url_decode("%4", out), false, "truncated");
  test::assert_equal<bool>(request_handler::url_decode("%", out), false, "bare percent");
}

boost::tribool parse_request(const std::string &text, http::server3::request &req) {
  http::server3::request_parser parser;
  boost::tribool result;
  boost::tie(result, boost::tuples::ignore) = parser.parse(req, text.begin(), text.end());
  return result;
}

void test_request_version() {
  {
    http::server3::request req;
    boost::tribool result = parse_request("GET /health HTTP/1.1\r\n\r\n", req);
    test::assert_equal<bool>(bool(result), true, "well formed");
    test::assert_equal<int>(req.http_version_major, 1, "major");
    test::assert_equal<int>(req.http_version_minor, 1, "minor");
  }
  {
    http::server3::request req;
    boost::tribool result = parse_request("GET /health HTTP/99999999999999.1\r\n\r\n", req);
    test::assert_equal<bool>(bool(!result), true, "long major version rejected");
    test::assert_less_or_equal<int>(req.http_version_major, 999, "major bounded");
  }
  {
    http::server3::request req;
    boost::tribool result = parse_request("GET /health HTTP/1.99999999999999\r\n\r\n", req);
    test::assert_equal<bool>(bool(!result), true, "long minor version rejected");
    test::assert_less_or_equal<int>(req.http_version_minor, 999, "minor bounded");
  }
}

void test_long_version_over_the_wire() {
  std::atomic<int> queries(0);
  server_guard guard(counting_stores(queries));

  boost::asio::io_service io_service;
  boost::asio::ip::tcp::socket socket(io_service);
  socket.connect(boost::asio::ip::tcp::endpoint(
    boost::asio::ip::address::from_string("127.0.0.1"),
    boost::lexical_cast<unsigned short>(guard.port)));
  boost::asio::write(socket, boost::asio::buffer(
    std::string("GET /health HTTP/99999999999999.1\r\n\r\n")));

  boost::asio::streambuf response;
  boost::system::error_code ec;
  boost::asio::read(socket, response, boost::asio::transfer_all(), ec);
  std::string text((std::istreambuf_iterator<char>(&response)), std::istreambuf_iterator<char>());
  test::assert_equal<std::string>(text.substr(0, 12), "HTTP/1.0 400", "status line");

  // and the worker is still serving
  test::http_response r = test::http_get(guard.port, "/health");
  test::assert_equal<int>(r.status, 200, "health after bad request");
}

void test_http_date() {
  using namespace boost::posix_time;
  using boost::gregorian::date;

  test::assert_equal<std::string>(
    http::server3::http_date(ptime(date(2015, boost::gregorian::Feb, 3), hours(4) + minutes(5) + seconds(6))),
    "Tue, 03 Feb 2015 04:05:06 GMT", "rfc 1123 date");

  // formatting from many threads at once gives the same answer
  const ptime when(date(1999, boost::gregorian::Dec, 31), hours(23) + minutes(59) + seconds(59));
  std::mutex mutex;
  std::vector<std::string> seen;
  std::vector<std::unique_ptr<boost::thread> > threads;
  for (int i = 0; i < 4; ++i) {
    threads.emplace_back(new boost::thread([&]() {
      for (int j = 0; j < 200; ++j) {
        std::string d = http::server3::http_date(when);
        std::lock_guard<std::mutex> lock(mutex);
        seen.push_back(d);
      }
    }));
  }
  for (auto &t : threads) { t->join(); }

  test::assert_equal<std::size_t>(seen.size(), 800, "formatted");
  for (auto const &d : seen) {
    test::assert_equal<std::string>(d, "Fri, 31 Dec 1999 23:59:59 GMT", "threaded date");
  }
}

} // anonymous namespace

int main() {
  int tests_failed = 0;

  std::cout << "== Testing HTTP server ==" << std::endl << std::endl;

  boost::property_tree::ptree conf;
  conf.put("type", "null");
  footprint::logging::log::configure(conf);

#define RUN_TEST(x) { tests_failed += test::run(#x, &(x)); }

  RUN_TEST(test_health);
  RUN_TEST(test_empty_tile);
  RUN_TEST(test_below_min_zoom);
  RUN_TEST(test_degraded_tile);
  RUN_TEST(test_bad_tile_paths);
  RUN_TEST(test_tile_from_dataset);
  RUN_TEST(test_gzip_tile);
  RUN_TEST(test_update_view);
  RUN_TEST(test_update_view_errors);
  RUN_TEST(test_body_too_large);
  RUN_TEST(test_stats);
  RUN_TEST(test_options_preflight);
  RUN_TEST(test_map_page);
  RUN_TEST(test_access_log);
  RUN_TEST(test_parse_tile_path);
  RUN_TEST(test_split_uri);
  RUN_TEST(test_url_decode_escapes);
  RUN_TEST(test_request_version);
  RUN_TEST(test_long_version_over_the_wire);
  RUN_TEST(test_http_date);

  std::cout << " >> Tests failed: " << tests_failed << std::endl << std::endl;

  return (tests_failed > 0) ? 1 : 0;
}
