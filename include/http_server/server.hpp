//
// server.hpp
// ~~~~~~~~~~
//
// Copyright (c) 2003-2012 Christopher M. Kohlhoff (chris at kohlhoff dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTP_SERVER3_SERVER_HPP
#define HTTP_SERVER3_SERVER_HPP

#include <boost/asio.hpp>
#include <exception>
#include <memory>
#include <string>
#include <vector>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/thread/thread.hpp>
#include <boost/thread/tss.hpp>
#include "http_server/connection.hpp"
#include "http_server/request_handler.hpp"
#include "http_server/server_options.hpp"

namespace http {
namespace server3 {

/// The top-level class of the HTTP server.
///
/// A single io_service is run by a pool of worker threads. Each worker
/// asks the options' factory for a request handler of its own when it
/// starts, so that handlers can keep per-thread resources.
class server
  : private boost::noncopyable
{
public:
  /// Bind to the address and port in the options and start listening.
  /// Throws if the address can't be resolved or bound.
  explicit server(const server_options &options);

  ~server();

  /// Start the worker threads. If `include_current_thread` is true then
  /// the calling thread becomes one of the workers, and this only
  /// returns once the server has been stopped.
  void run(bool include_current_thread);

  /// Stop accepting and handling requests, join the workers and re-throw
  /// the first error any of them had. Stopping twice is harmless.
  void stop();

  /// Return what port the server is accepting connections on.
  std::string port() const;

private:
  /// Body of each worker thread.
  void run_worker(std::size_t index);

  /// Initiate an asynchronous accept operation.
  void start_accept();

  /// Handle completion of an asynchronous accept operation.
  void handle_accept(const boost::system::error_code& e);

  /// Handle a request to stop the server.
  void handle_stop();

  /// The number of threads that will call io_service::run().
  std::size_t thread_pool_size_;

  /// The io_service used to perform asynchronous operations.
  boost::asio::io_service io_service_;

  /// Termination signals, if the server handles them.
  std::unique_ptr<boost::asio::signal_set> signals_;

  /// Acceptor used to listen for incoming connections.
  boost::asio::ip::tcp::acceptor acceptor_;

  /// The next connection to be accepted.
  connection_ptr new_connection_;

  /// Makes the request handler for each worker.
  boost::shared_ptr<handler_factory> factory_;

  /// The port actually bound.
  std::string port_;

  /// Each worker's own request handler.
  boost::thread_specific_ptr<request_handler> thread_specific_ptr_;

  /// Workers started by `run`, not including the calling thread.
  std::vector<std::unique_ptr<boost::thread> > threads_;

  /// Error which ended each worker, indexed by worker number.
  std::vector<std::exception_ptr> thread_errors_;
};

} // namespace server3
} // namespace http

#endif // HTTP_SERVER3_SERVER_HPP
