#include <boost/program_options.hpp>
#include <boost/format.hpp>

#include <curl/curl.h>

#include <chrono>
#include <iostream>
#include <sstream>
#include <thread>

#include "logging/logger.hpp"
#include "store/sqlite_store.hpp"
#include "view_json.hpp"
#include "view_stats.hpp"
#include "config.h"

namespace bpo = boost::program_options;

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  std::stringstream *stream = static_cast<std::stringstream*>(userdata);
  size_t total_bytes = size * nmemb;
  stream->write(ptr, total_bytes);
  return stream->good() ? total_bytes : 0;
}

#define CURL_SETOPT(curl, opt, arg) { \
  CURLcode res = curl_easy_setopt((curl), (opt), (arg)); \
  if (res != CURLE_OK) { \
    throw std::runtime_error("Unable to set cURL option " #opt); \
  } \
}

struct http_client {
  CURL *m_curl;
  char m_error_buffer[CURL_ERROR_SIZE];

  http_client() : m_curl(curl_easy_init()) {
    if (m_curl == nullptr) {
      throw std::runtime_error("unable to initialise the cURL easy handle");
    }
  }

  ~http_client() {
    if (m_curl != nullptr) {
      curl_easy_cleanup(m_curl);
      m_curl = nullptr;
    }
  }

  long get(const std::string &uri, std::stringstream &stream) {
    m_error_buffer[0] = '\0';
    CURL_SETOPT(m_curl, CURLOPT_URL, uri.c_str());
    CURL_SETOPT(m_curl, CURLOPT_WRITEFUNCTION, write_callback);
    CURL_SETOPT(m_curl, CURLOPT_WRITEDATA, &stream);
    CURL_SETOPT(m_curl, CURLOPT_ERRORBUFFER, &m_error_buffer[0]);
    CURL_SETOPT(m_curl, CURLOPT_TIMEOUT, 10L);

    CURLcode res = curl_easy_perform(m_curl);
    if (res != CURLE_OK) {
      throw std::runtime_error((boost::format("cURL operation failed: %1%") % m_error_buffer).str());
    }

    long status_code = 0;
    curl_easy_getinfo(m_curl, CURLINFO_RESPONSE_CODE, &status_code);
    return status_code;
  }
};

#undef CURL_SETOPT

boost::optional<footprint::viewport> fetch_bounds(http_client &client, const std::string &uri) {
  std::stringstream data;
  long status_code = client.get(uri, data);
  if (status_code != 200) {
    throw std::runtime_error((boost::format("Unable to fetch bounds from \"%1%\": HTTP status %2%.")
                              % uri % status_code).str());
  }
  return footprint::json::parse_bounds_response(data.str());
}

// digits in groups of three, e.g: 1234567 -> "1,234,567"
std::string group_thousands(std::uint64_t n) {
  std::string digits = (boost::format("%1%") % n).str();
  std::string out;
  for (std::size_t i = 0; i < digits.size(); ++i) {
    if ((i > 0) && ((digits.size() - i) % 3 == 0)) {
      out.push_back(',');
    }
    out.push_back(digits[i]);
  }
  return out;
}

void print_stats(const footprint::stats_snapshot &snapshot) {
  std::cout << group_thousands(snapshot.stats.count) << " buildings | "
            << group_thousands(std::uint64_t(snapshot.stats.area + 0.5)) << " m2 total area"
            << std::endl;
}

} // anonymous namespace

int main(int argc, char *argv[]) {
  footprint::store::sqlite_store_options store_opts;
  footprint::key_precision precision;
  std::string database, server;
  long interval = 1500, query_timeout = 5000;

  bpo::options_description options(
    "footprint " VERSION "\n"
    "\n"
    "  Usage: footprint_stats [options] <database> <server-url>\n"
    "\n"
    "Follows the view of the map served by a footprint_server at the given URL "
    "(e.g: http://localhost:8080), and prints the number and total area of the "
    "buildings in view whenever the view changes."
    "\n"
    "\n");

  options.add_options()
    ("help,h", "Print this help message.")
    ("table", bpo::value<std::string>(&store_opts.table)->default_value("buildings"),
     "Table of buildings in the database.")
    ("interval,i", bpo::value<long>(&interval)->default_value(1500),
     "Milliseconds between checks of the view.")
    ("query-timeout", bpo::value<long>(&query_timeout)->default_value(5000),
     "Database queries running longer than this many milliseconds are interrupted.")
    ("position-precision", bpo::value<int>(&precision.position)->default_value(4),
     "Decimal places of the view bounds which must change before statistics "
     "are recalculated.")
    ("zoom-precision", bpo::value<int>(&precision.zoom)->default_value(1),
     "Decimal places of the view zoom which must change before statistics "
     "are recalculated.")
    ("once", "Print the statistics for the current view and exit.")
    // positional arguments
    ("database", bpo::value<std::string>(&database), "SQLite database of buildings.")
    ("server-url", bpo::value<std::string>(&server), "Base URL of the running server.")
    ;

  bpo::positional_options_description pos_options;
  pos_options
    .add("database", 1)
    .add("server-url", 1)
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

  for (auto arg : {"database", "server-url"}) {
    if (vm.count(arg) == 0) {
      std::cerr << "The <" << arg << "> argument was not provided, but is mandatory\n\n";
      std::cerr << options << "\n";
      return EXIT_FAILURE;
    }
  }

  if (interval <= 0 || query_timeout < 0) {
    std::cerr << "The interval must be positive and the query timeout can't be negative.\n";
    return EXIT_FAILURE;
  }
  store_opts.query_timeout = std::chrono::milliseconds(query_timeout);

  curl_global_init(CURL_GLOBAL_DEFAULT);

  int status = EXIT_SUCCESS;
  try {
    footprint::store::sqlite_store store(database, store_opts);
    footprint::stats_tracker tracker(
      [&store](const footprint::box_2d &bbox) { return store.aggregate_in_bbox(bbox); },
      precision);

    http_client client;
    const std::string uri = server + "/get-bounds";
    const bool once = vm.count("once") > 0;

    // the initial state is "no view", which has zero stats.
    if (once) {
      print_stats(tracker.update(fetch_bounds(client, uri)));
    } else {
      print_stats(footprint::stats_snapshot());
    }

    while (!once) {
      std::this_thread::sleep_for(std::chrono::milliseconds(interval));

      try {
        const std::size_t before = tracker.computations();
        footprint::stats_snapshot snapshot = tracker.update(fetch_bounds(client, uri));
        if (tracker.computations() != before) {
          print_stats(snapshot);
        }

      } catch (const std::runtime_error &e) {
        LOG_WARNING(boost::format("Unable to update statistics: %1%") % e.what());
      }
    }

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Exception: %1%") % e.what());
    status = EXIT_FAILURE;
  }

  curl_global_cleanup();
  return status;
}
