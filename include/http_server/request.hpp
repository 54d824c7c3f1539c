//
// request.hpp
// ~~~~~~~~~~~
//
// Copyright (c) 2003-2012 Christopher M. Kohlhoff (chris at kohlhoff dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef HTTP_SERVER3_REQUEST_HPP
#define HTTP_SERVER3_REQUEST_HPP

#include <string>
#include <vector>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/optional.hpp>
#include "http_server/header.hpp"

namespace http {
namespace server3 {

/// A request received from a client.
struct request
{
  std::string method;
  std::string uri;
  int http_version_major;
  int http_version_minor;
  std::vector<header> headers;
  std::string body;

  /// Value of the first header with the given name, ignoring case.
  boost::optional<std::string> find_header(const std::string &name) const
  {
    for (auto const &h : headers) {
      if (boost::algorithm::iequals(h.name, name)) {
        return h.value;
      }
    }
    return boost::none;
  }
};

} // namespace server3
} // namespace http

#endif // HTTP_SERVER3_REQUEST_HPP
