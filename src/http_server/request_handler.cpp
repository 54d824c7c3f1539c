//
// request_handler.cpp
// ~~~~~~~~~~~~~~~~~~~
//
// Copyright (c) 2003-2012 Christopher M. Kohlhoff (chris at kohlhoff dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#include <cctype>
#include <sstream>
#include <string>
#include <vector>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>

#include "http_server/request_handler.hpp"

namespace http {
namespace server3 {

request_handler::~request_handler() {
}

bool request_handler::url_decode(const std::string& in, std::string& out) {
  out.clear();
  out.reserve(in.size());
  for (std::size_t i = 0; i < in.size(); ++i) {
    if (in[i] == '%') {
      if (i + 3 <= in.size() &&
          std::isxdigit(static_cast<unsigned char>(in[i + 1])) &&
          std::isxdigit(static_cast<unsigned char>(in[i + 2]))) {
        int value = 0;
        std::istringstream is(in.substr(i + 1, 2));
        if (is >> std::hex >> value) {
          out += static_cast<char>(value);
          i += 2;

        } else {
          return false;
        }

      } else {
        return false;
      }

    } else if (in[i] == '+') {
      out += ' ';

    } else {
      out += in[i];
    }
  }
  return true;
}

bool request_handler::split_uri(const std::string& uri, std::string& path,
                                std::map<std::string, std::string>& params) {
  const std::string::size_type query_pos = uri.find('?');

  if (!url_decode(uri.substr(0, query_pos), path)) {
    return false;
  }

  params.clear();
  if (query_pos == std::string::npos) {
    return true;
  }

  const std::string query = uri.substr(query_pos + 1);
  std::vector<std::string> pairs;
  boost::algorithm::split(pairs, query, boost::algorithm::is_any_of("&"));

  for (auto const &pair : pairs) {
    if (pair.empty()) {
      continue;
    }

    const std::string::size_type eq_pos = pair.find('=');
    std::string key, value;
    if (!url_decode(pair.substr(0, eq_pos), key)) {
      return false;
    }
    if ((eq_pos != std::string::npos) && !url_decode(pair.substr(eq_pos + 1), value)) {
      return false;
    }

    params.insert(std::make_pair(key, value));
  }

  return true;
}

} // namespace server3
} // namespace http
