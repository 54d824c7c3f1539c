#ifndef HTTP_SERVER3_PARSE_PATH_HPP
#define HTTP_SERVER3_PARSE_PATH_HPP

#include <string>

namespace http {
namespace server3 {

// parse a tile path of the form "/tiles/{z}/{x}/{y}.pbf", where each of
// the numbers is a plain non-negative decimal integer. returns false if
// the path doesn't have that form. the numbers aren't range checked
// against the zoom, see `footprint::util::valid_tile`.
bool parse_tile_path(const std::string &path, int &z, int &x, int &y);

} // namespace server3
} // namespace http

#endif // HTTP_SERVER3_PARSE_PATH_HPP
