#include "logging/logger.hpp"

#include <atomic>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace bpt = boost::property_tree;

namespace footprint { namespace logging {

namespace {

struct sink {
  virtual ~sink() {}
  virtual void write(const std::string &line) = 0;
};

struct stream_sink : public sink {
  explicit stream_sink(std::ostream &out) : m_out(out) {}
  virtual ~stream_sink() {}
  virtual void write(const std::string &line) {
    m_out << line << std::endl;
  }
  std::ostream &m_out;
};

struct file_sink : public sink {
  explicit file_sink(const std::string &location)
    : m_out(location.c_str(), std::ios::out | std::ios::app) {
    if (!m_out.is_open()) {
      throw std::runtime_error((boost::format("Unable to open log file \"%1%\" for writing.")
                                % location).str());
    }
  }
  virtual ~file_sink() {}
  virtual void write(const std::string &line) {
    m_out << line << std::endl;
  }
  std::ofstream m_out;
};

struct null_sink : public sink {
  virtual ~null_sink() {}
  virtual void write(const std::string &) {}
};

struct state {
  state() : threshold(int(level::info)), out(new stream_sink(std::cerr)) {}

  std::atomic<int> threshold;
  std::mutex mutex;
  std::unique_ptr<sink> out;
};

state &global_state() {
  static state s;
  return s;
}

const char *level_name(level lvl) {
  switch (lvl) {
  case level::debug:   return "DEBUG";
  case level::info:    return "INFO";
  case level::warning: return "WARNING";
  case level::error:   return "ERROR";
  }
  return "UNKNOWN";
}

} // anonymous namespace

level parse_level(const std::string &name) {
  if      (name == "debug")   { return level::debug; }
  else if (name == "info")    { return level::info; }
  else if (name == "warning") { return level::warning; }
  else if (name == "error")   { return level::error; }

  throw std::runtime_error((boost::format("Unknown log level \"%1%\".") % name).str());
}

void log::configure(const bpt::ptree &conf) {
  const std::string type = conf.get<std::string>("type", "stderr");
  const level threshold = parse_level(conf.get<std::string>("level", "info"));

  std::unique_ptr<sink> out;
  if (type == "stdout") {
    out.reset(new stream_sink(std::cout));

  } else if (type == "stderr") {
    out.reset(new stream_sink(std::cerr));

  } else if (type == "file") {
    out.reset(new file_sink(conf.get<std::string>("location")));

  } else if (type == "null") {
    out.reset(new null_sink);

  } else {
    throw std::runtime_error((boost::format("Unknown log type \"%1%\".") % type).str());
  }

  state &s = global_state();
  std::unique_lock<std::mutex> lock(s.mutex);
  s.out.swap(out);
  s.threshold.store(int(threshold));
}

bool log::enabled(level lvl) {
  return int(lvl) >= global_state().threshold.load();
}

void log::write(level lvl, const std::string &msg) {
  std::ostringstream line;
  line << boost::posix_time::to_iso_extended_string(
            boost::posix_time::microsec_clock::universal_time())
       << " [" << std::this_thread::get_id() << "] "
       << level_name(lvl) << ": " << msg;

  state &s = global_state();
  std::unique_lock<std::mutex> lock(s.mutex);
  s.out->write(line.str());
}

void log::write(level lvl, const char *msg) {
  write(lvl, std::string(msg));
}

void log::write(level lvl, const boost::format &fmt) {
  write(lvl, fmt.str());
}

} } // namespace footprint::logging
