#ifndef SERVER_OPTIONS_HPP
#define SERVER_OPTIONS_HPP

#include <string>
#include <boost/shared_ptr.hpp>
#include "http_server/handler_factory.hpp"

namespace http {
namespace server3 {

struct server_options {
  server_options() : address("0.0.0.0"), port("0"), thread_hint(1), handle_signals(true) {}

  /// host name or IP address to bind to.
  std::string address;
  /// port to listen on. "0" picks any free port, see `server::port()`.
  std::string port;
  /// number of threads serving requests, each with its own handler.
  unsigned short thread_hint;
  /// stop the server on SIGINT, SIGTERM and SIGQUIT.
  bool handle_signals;
  boost::shared_ptr<handler_factory> factory;
};

} } // namespace http::server3

#endif /* SERVER_OPTIONS_HPP */
