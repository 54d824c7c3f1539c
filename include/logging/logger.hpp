#ifndef FOOTPRINT_LOGGING_LOGGER_HPP
#define FOOTPRINT_LOGGING_LOGGER_HPP

#include <string>
#include <boost/format.hpp>
#include <boost/property_tree/ptree.hpp>

namespace footprint { namespace logging {

enum class level : int {
  debug = 0,
  info = 1,
  warning = 2,
  error = 3
};

/* Process-wide logger.
 *
 * The destination and threshold are set once, usually at startup,
 * from a property tree such as:
 *
 *   { "type": "file", "location": "/var/log/footprint.log", "level": "info" }
 *
 * where `type` is one of "stdout", "stderr", "file" or "null". Until
 * `configure` is called, messages at `info` and above go to stderr.
 * Writing is thread-safe.
 */
struct log {
  // (re)configure the logger. throws std::runtime_error if the type or
  // level is not recognised, or the log file cannot be opened.
  static void configure(const boost::property_tree::ptree &conf);

  // true if messages at this level would be written.
  static bool enabled(level lvl);

  static void write(level lvl, const char *msg);
  static void write(level lvl, const std::string &msg);
  static void write(level lvl, const boost::format &fmt);
};

// parse a level name, throwing std::runtime_error if it isn't one.
level parse_level(const std::string &name);

} } // namespace footprint::logging

#define FOOTPRINT_LOG(lvl, msg) do {                                     \
    if (::footprint::logging::log::enabled(lvl)) {                       \
      ::footprint::logging::log::write((lvl), (msg));                    \
    }                                                                    \
  } while (false)

#define LOG_DEBUG(msg)   FOOTPRINT_LOG(::footprint::logging::level::debug, msg)
#define LOG_INFO(msg)    FOOTPRINT_LOG(::footprint::logging::level::info, msg)
#define LOG_WARNING(msg) FOOTPRINT_LOG(::footprint::logging::level::warning, msg)
#define LOG_ERROR(msg)   FOOTPRINT_LOG(::footprint::logging::level::error, msg)

#endif /* FOOTPRINT_LOGGING_LOGGER_HPP */
