#ifndef ACCESS_LOGGER_HPP
#define ACCESS_LOGGER_HPP

namespace http { namespace server3 {

struct reply;
struct request;

/* Called once for every request which gets a reply from the handler. */
struct access_logger {
  virtual ~access_logger();
  virtual void log(const request &, const reply &) = 0;
};

/* Writes a line per request to the process log, at INFO level. */
struct log_access_logger : public access_logger {
  virtual ~log_access_logger();
  virtual void log(const request &, const reply &);
};

} } // namespace http::server3

#endif /* ACCESS_LOGGER_HPP */
