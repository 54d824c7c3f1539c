//
// server.cpp
// ~~~~~~~~~~
//
// Copyright (c) 2003-2012 Christopher M. Kohlhoff (chris at kohlhoff dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include "http_server/server.hpp"
#include "logging/logger.hpp"
#include <boost/bind.hpp>
#include <boost/format.hpp>
#include <boost/lexical_cast.hpp>
#include <stdexcept>

namespace http {
namespace server3 {

handler_factory::~handler_factory() {
}

server::server(const server_options &options)
  : thread_pool_size_(options.thread_hint),
    io_service_(),
    signals_(),
    acceptor_(io_service_),
    new_connection_(),
    factory_(options.factory),
    port_()
{
  using boost::asio::ip::tcp;

  if (!factory_) {
    throw std::invalid_argument("Server needs a request handler factory.");
  }
  if (thread_pool_size_ == 0) {
    throw std::invalid_argument("Server needs at least one thread.");
  }

  if (options.handle_signals) {
    // Register to handle the signals that indicate when the server should exit.
    signals_.reset(new boost::asio::signal_set(io_service_));
    signals_->add(SIGINT);
    signals_->add(SIGTERM);
#if defined(SIGQUIT)
    signals_->add(SIGQUIT);
#endif // defined(SIGQUIT)
    signals_->async_wait(boost::bind(&server::handle_stop, this));
  }

  tcp::resolver resolver(io_service_);
  tcp::resolver::query query(options.address, options.port);
  tcp::endpoint endpoint = *resolver.resolve(query);

  // Open the acceptor with the option to reuse the address (i.e. SO_REUSEADDR).
  acceptor_.open(endpoint.protocol());
  acceptor_.set_option(tcp::acceptor::reuse_address(true));
  acceptor_.bind(endpoint);
  acceptor_.listen();

  // with port "0" the system picks one.
  port_ = boost::lexical_cast<std::string>(acceptor_.local_endpoint().port());

  start_accept();
}

server::~server()
{
}

void server::run(bool include_current_thread)
{
  thread_errors_.assign(thread_pool_size_, std::exception_ptr());

  const std::size_t first = include_current_thread ? 1 : 0;
  for (std::size_t i = first; i < thread_pool_size_; ++i)
  {
    threads_.emplace_back(new boost::thread(boost::bind(&server::run_worker, this, i)));
  }

  LOG_INFO(boost::format("Server starting on port %1% with %2% threads. Tiles should be "
                         "available on URLs like http://localhost:%1%/tiles/12/2106/1351.pbf")
           % port_ % thread_pool_size_);

  if (include_current_thread) {
    run_worker(0);
  }
}

void server::stop()
{
  handle_stop();

  // join every worker before reporting any errors, so that none of
  // them is left running.
  for (auto &thread : threads_) {
    try {
      thread->join();

    } catch (const std::exception &e) {
      LOG_ERROR(boost::format("Failed to join worker thread: %1%") % e.what());
    }
  }
  threads_.clear();

  std::vector<std::exception_ptr> errors;
  errors.swap(thread_errors_);
  for (auto &ptr : errors) {
    if (ptr) {
      // later errors were logged by their workers.
      std::rethrow_exception(ptr);
    }
  }
}

std::string server::port() const {
  return port_;
}

void server::run_worker(std::size_t index)
{
  try {
    factory_->thread_setup(thread_specific_ptr_);
    LOG_DEBUG(boost::format("Worker %1% ready.") % index);
    io_service_.run();

  } catch (const std::exception &e) {
    LOG_ERROR(boost::format("Worker %1% terminating due to: %2%") % index % e.what());
    thread_errors_[index] = std::current_exception();
    // a server without all its workers shouldn't carry on.
    io_service_.stop();
  }
}

void server::start_accept()
{
  new_connection_.reset(new connection(io_service_, thread_specific_ptr_));
  acceptor_.async_accept(new_connection_->socket(),
      boost::bind(&server::handle_accept, this,
        boost::asio::placeholders::error));
}

void server::handle_accept(const boost::system::error_code& e)
{
  if (!e)
  {
    new_connection_->start();
  }

  start_accept();
}

void server::handle_stop()
{
  io_service_.stop();
}

} // namespace server3
} // namespace http
