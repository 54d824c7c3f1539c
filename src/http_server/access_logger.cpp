#include "http_server/access_logger.hpp"
#include "http_server/reply.hpp"
#include "http_server/request.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

namespace http { namespace server3 {

access_logger::~access_logger() {
}

log_access_logger::~log_access_logger() {
}

void log_access_logger::log(const request &req, const reply &rep) {
  LOG_INFO(boost::format("\"%1% %2% HTTP/%3%.%4%\" %5% %6%")
           % req.method % req.uri % req.http_version_major % req.http_version_minor
           % int(rep.status) % rep.content.size());
}

} } // namespace http::server3
