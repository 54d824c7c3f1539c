#ifndef HANDLER_FACTORY_HPP
#define HANDLER_FACTORY_HPP

#include <boost/noncopyable.hpp>
#include <boost/thread/tss.hpp>
#include "http_server/request_handler.hpp"

namespace http {
namespace server3 {

/* Creates `request_handler` objects.
 *
 * The `request_handler` objects do the real work, but the resources
 * they use (e.g: database connections) can't be shared between the
 * server's threads. Instead, each thread calls the factory's
 * `thread_setup` method when it starts, and gets a handler of its own
 * which nothing else touches.
 */
struct handler_factory : public boost::noncopyable {
  virtual ~handler_factory();

  /// create whatever resources the specific `request_handler`
  /// implementation needs, and assign it to the thread-specific
  /// pointer. may throw, which stops the server.
  virtual void thread_setup(boost::thread_specific_ptr<request_handler> &tss) = 0;
};

} } // namespace http::server3

#endif /* HANDLER_FACTORY_HPP */
