#include "http_server/parse_path.hpp"

#include <vector>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/lexical_cast.hpp>

namespace http {
namespace server3 {

namespace {

const std::string tile_prefix = "/tiles/";
const std::string tile_suffix = ".pbf";

// digits only: no sign, no space and no exponent.
bool parse_number(const std::string &s, int &n) {
  if (s.empty() || !boost::algorithm::all(s, boost::algorithm::is_digit())) {
    return false;
  }

  try {
    n = boost::lexical_cast<int>(s);
    return true;

  } catch (const boost::bad_lexical_cast &) {
    // too big for an int
    return false;
  }
}

} // anonymous namespace

bool parse_tile_path(const std::string &path, int &z, int &x, int &y)
{
  if (!boost::algorithm::starts_with(path, tile_prefix) ||
      !boost::algorithm::ends_with(path, tile_suffix) ||
      path.size() < tile_prefix.size() + tile_suffix.size()) {
    return false;
  }

  const std::string coords = path.substr(
    tile_prefix.size(), path.size() - tile_prefix.size() - tile_suffix.size());

  std::vector<std::string> parts;
  boost::algorithm::split(parts, coords, boost::algorithm::is_any_of("/"));
  if (parts.size() != 3) {
    return false;
  }

  int pz = 0, px = 0, py = 0;
  if (!parse_number(parts[0], pz) || !parse_number(parts[1], px) || !parse_number(parts[2], py)) {
    return false;
  }

  z = pz;
  x = px;
  y = py;
  return true;
}

} // namespace server3
} // namespace http
