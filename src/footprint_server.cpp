#include <boost/program_options.hpp>
#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/exceptions.hpp>
#include <boost/format.hpp>

#include <chrono>
#include <iostream>

#include "footprint.hpp"
#include "logging/logger.hpp"
#include "store/sqlite_store.hpp"
#include "view_state.hpp"
#include "view_stats.hpp"
#include "http_server/server.hpp"
#include "http_server/tile_handler_factory.hpp"
#include "config.h"

namespace bpo = boost::program_options;
namespace bpt = boost::property_tree;

namespace {

/* use the value from the config file, unless the option was given
 * explicitly on the command line. */
template <typename T>
void merge_option(const bpo::variables_map &vm, const bpt::ptree &config,
                  const std::string &option, const std::string &config_path,
                  T &value) {
  if (vm.count(option) && !vm[option].defaulted()) {
    return;
  }
  boost::optional<T> v = config.get_optional<T>(config_path);
  if (v) {
    value = *v;
  }
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  http::server3::tile_server_options tile_opts;
  footprint::store::sqlite_store_options store_opts;
  footprint::key_precision precision;
  std::string database, port, address, config_file, log_level;
  unsigned short threads = 4;
  long query_timeout = 5000, poll_interval = 1500;

  bpo::options_description options(
    "footprint " VERSION "\n"
    "\n"
    "  Usage: footprint_server [options] <database> <port>\n"
    "\n"
    "The server will serve building footprints from the SQLite database as "
    "vector tiles on the port which you specify, using the common Google Maps "
    "numbering scheme /tiles/$z/$x/$y.pbf. For example, the tile with coordinates "
    "z=12, x=2108, y=1354 would be available at "
    "http://localhost:8080/tiles/12/2108/1354.pbf if the port parameter is given "
    "as 8080. An interactive map is served at the root URL."
    "\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    ("address,a", bpo::value<std::string>(&address)->default_value("0.0.0.0"),
     "Address to listen on.")
    ("threads", bpo::value<unsigned short>(&threads)->default_value(4),
     "Number of threads serving requests. Each has its own database connection.")
    ("table", bpo::value<std::string>(&store_opts.table)->default_value("buildings"),
     "Table of buildings in the database. There must also be an R*Tree index "
     "on it, named with an \"_rtree\" suffix.")
    ("layer", bpo::value<std::string>(&tile_opts.tile.layer_name)->default_value("buildings"),
     "Name of the layer in the vector tiles.")
    ("min-zoom", bpo::value<int>(&tile_opts.tile.min_zoom)->default_value(10),
     "Tiles below this zoom are always empty, and don't query the database.")
    ("max-zoom", bpo::value<int>(&tile_opts.max_zoom)->default_value(22),
     "Tiles beyond this zoom are rejected.")
    ("extent", bpo::value<unsigned int>(&tile_opts.tile.extent)->default_value(4096),
     "Number of integer units across each tile.")
    ("buffer", bpo::value<unsigned int>(&tile_opts.tile.buffer)->default_value(256),
     "Number of units around the tile to include in clipped geometry.")
    ("max-age", bpo::value<unsigned int>(&tile_opts.max_age)->default_value(3600),
     "Value of the Cache-Control max-age directive on tiles, in seconds.")
    ("query-timeout", bpo::value<long>(&query_timeout)->default_value(5000),
     "Database queries running longer than this many milliseconds are "
     "interrupted. Zero means no limit.")
    ("compression-level", bpo::value<int>(&tile_opts.compression_level)->default_value(-1),
     "Level of gzip compression for clients which accept it, or -1 for the "
     "zlib default.")
    ("poll-interval", bpo::value<long>(&poll_interval)->default_value(1500),
     "Milliseconds between checks of the view for new statistics.")
    ("position-precision", bpo::value<int>(&precision.position)->default_value(4),
     "Decimal places of the view bounds which must change before statistics "
     "are recalculated.")
    ("zoom-precision", bpo::value<int>(&precision.zoom)->default_value(1),
     "Decimal places of the view zoom which must change before statistics "
     "are recalculated.")
    ("log-level", bpo::value<std::string>(&log_level)->default_value("info"),
     "Minimum level of messages to log: debug, info, warning or error.")
    ("config-file,c", bpo::value<std::string>(&config_file),
     "JSON config file with the same settings as the command line, and a "
     "\"logging\" section. Settings given on the command line take priority.")
    // positional arguments
    ("database", bpo::value<std::string>(&database), "SQLite database of buildings.")
    ("port", bpo::value<std::string>(&port), "Port upon which the server will listen.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("database", 1)
    .add("port", 1)
    ;

  bpo::variables_map vm;

  try {
    bpo::store(bpo::command_line_parser(argc,argv)
           .options(options)
           .positional(pos_options)
           .run(),
           vm);
    bpo::notify(vm);

  } catch (const std::exception &e) {
    std::cerr << "Unable to parse command line options because: " << e.what() << "\n"
              << "Run with --help for usage, or report a bug at " PACKAGE_BUGREPORT << "\n";
    return EXIT_FAILURE;
  }

  if (vm.count("help")) {
    std::cout << options << "\n";
    return EXIT_SUCCESS;
  }

  // argument checking and verification
  for (auto arg : {"database", "port"}) {
    if (vm.count(arg) == 0) {
      std::cerr << "The <" << arg << "> argument was not provided, but is mandatory\n\n";
      std::cerr << options << "\n";
      return EXIT_FAILURE;
    }
  }

  bpt::ptree config;
  if (vm.count("config-file")) {
    try {
      bpt::read_json(config_file, config);

      merge_option(vm, config, "address", "address", address);
      merge_option(vm, config, "threads", "threads", threads);
      merge_option(vm, config, "table", "table", store_opts.table);
      merge_option(vm, config, "layer", "layer", tile_opts.tile.layer_name);
      merge_option(vm, config, "min-zoom", "min-zoom", tile_opts.tile.min_zoom);
      merge_option(vm, config, "max-zoom", "max-zoom", tile_opts.max_zoom);
      merge_option(vm, config, "extent", "extent", tile_opts.tile.extent);
      merge_option(vm, config, "buffer", "buffer", tile_opts.tile.buffer);
      merge_option(vm, config, "max-age", "max-age", tile_opts.max_age);
      merge_option(vm, config, "query-timeout", "query-timeout", query_timeout);
      merge_option(vm, config, "compression-level", "compression-level", tile_opts.compression_level);
      merge_option(vm, config, "poll-interval", "stats.poll-interval", poll_interval);
      merge_option(vm, config, "position-precision", "stats.position-precision", precision.position);
      merge_option(vm, config, "zoom-precision", "stats.zoom-precision", precision.zoom);

    } catch (const bpt::ptree_error &e) {
      std::cerr << "Error while parsing config: " << config_file << std::endl;
      std::cerr << e.what() << std::endl;
      return EXIT_FAILURE;
    }
  }

  try {
    bpt::ptree logging = config.get_child("logging", bpt::ptree());
    if (!vm["log-level"].defaulted() || !logging.get_optional<std::string>("level")) {
      logging.put("level", log_level);
    }
    footprint::logging::log::configure(logging);

  } catch (const std::exception &e) {
    std::cerr << "Unable to set up logging: " << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  if ((tile_opts.tile.extent == 0) || (threads == 0) ||
      (tile_opts.tile.layer_name.empty()) || (query_timeout < 0) || (poll_interval <= 0) ||
      (tile_opts.compression_level < -1) || (tile_opts.compression_level > 9)) {
    LOG_ERROR("Invalid configuration: extent, threads and poll-interval must be positive, "
              "the layer must have a name, query-timeout can't be negative and "
              "compression-level must be between -1 and 9.");
    return EXIT_FAILURE;
  }

  store_opts.query_timeout = std::chrono::milliseconds(query_timeout);
  tile_opts.page.min_zoom = tile_opts.tile.min_zoom;
  tile_opts.page.layer_name = tile_opts.tile.layer_name;
  tile_opts.logger.reset(new http::server3::log_access_logger);

  try {
    // opening the statistics store first means that a missing database,
    // table or index is reported before the server starts.
    std::unique_ptr<footprint::spatial_store> stats_store(
      new footprint::store::sqlite_store(database, store_opts));

    std::shared_ptr<footprint::view_register> views(new footprint::view_register);
    std::shared_ptr<footprint::stats_register> stats(new footprint::stats_register);

    footprint::stats_poller poller(std::move(stats_store), *views, *stats, precision,
                                   std::chrono::milliseconds(poll_interval));

    http::server3::tile_handler_factory::store_factory make_store = [database, store_opts]() {
      return std::unique_ptr<footprint::spatial_store>(
        new footprint::store::sqlite_store(database, store_opts));
    };

    http::server3::server_options srv_opts;
    srv_opts.address = address;
    srv_opts.port = port;
    srv_opts.thread_hint = threads;
    srv_opts.factory.reset(new http::server3::tile_handler_factory(tile_opts, make_store, views, stats));

    LOG_INFO(boost::format("Serving table \"%1%\" from database \"%2%\".") % store_opts.table % database);

    poller.start();

    // start the server running
    http::server3::server server(srv_opts);
    server.run(true);
    server.stop();

    poller.stop();

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Exception: %1%") % e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
