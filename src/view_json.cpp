#include "view_json.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include <boost/format.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace bpt = boost::property_tree;

namespace footprint { namespace json {

namespace {

// deeper than any web map zooms.
const double max_view_zoom = 30.0;

// the JSON parser keeps every value as a string, so null and numbers
// have to be recognised from their text.
bool is_null(const bpt::ptree &node) {
  return node.empty() && node.data() == "null";
}

boost::optional<double> as_number(const bpt::ptree &node) {
  if (!node.empty()) {
    return boost::none;
  }
  boost::optional<double> d = node.get_value_optional<double>();
  if (d && !std::isfinite(*d)) {
    return boost::none;
  }
  return d;
}

either<viewport, std::string> parse_view_tree(const bpt::ptree &bounds,
                                              boost::optional<const bpt::ptree &> zoom) {
  typedef either<viewport, std::string> result_type;

  viewport v;
  const char *sides[] = {"north", "south", "east", "west"};
  double *values[] = {&v.north, &v.south, &v.east, &v.west};
  const double limits[] = {90.0, 90.0, 180.0, 180.0};

  for (int i = 0; i < 4; ++i) {
    boost::optional<const bpt::ptree &> child = bounds.get_child_optional(sides[i]);
    if (!child) {
      return result_type((boost::format("Bounds missing \"%1%\"") % sides[i]).str());
    }
    boost::optional<double> d = as_number(*child);
    if (!d) {
      return result_type((boost::format("Bounds \"%1%\" is not a number") % sides[i]).str());
    }
    if (std::fabs(*d) > limits[i]) {
      return result_type((boost::format("Bounds \"%1%\" is out of range") % sides[i]).str());
    }
    *values[i] = *d;
  }

  if (zoom && !is_null(*zoom)) {
    v.zoom = as_number(*zoom);
    if (!v.zoom) {
      return result_type(std::string("Zoom is not a number"));
    }
    if (*v.zoom < 0.0 || *v.zoom > max_view_zoom) {
      return result_type(std::string("Zoom is out of range"));
    }
  }

  return result_type(v);
}

} // anonymous namespace

either<viewport, std::string> parse_view_update(const std::string &body) {
  typedef either<viewport, std::string> result_type;

  bpt::ptree root;
  try {
    std::istringstream in(body);
    bpt::read_json(in, root);

  } catch (const bpt::json_parser_error &) {
    return result_type(std::string("Invalid JSON"));
  }

  const bpt::ptree &tree = root;
  boost::optional<const bpt::ptree &> bounds = tree.get_child_optional("bounds");
  if (!bounds || is_null(*bounds) || (bounds->empty() && bounds->data().empty())) {
    return result_type(std::string("No bounds provided"));
  }

  return parse_view_tree(*bounds, tree.get_child_optional("zoom"));
}

std::string quote(const std::string &str) {
  std::ostringstream out;
  out << "\"";
  for (char c : str) {
    switch (c) {
    case '"':  out << "\\\""; break;
    case '\\': out << "\\\\"; break;
    case '\b': out << "\\b"; break;
    case '\f': out << "\\f"; break;
    case '\n': out << "\\n"; break;
    case '\r': out << "\\r"; break;
    case '\t': out << "\\t"; break;
    default:
      if ((unsigned char)(c) < 0x20) {
        out << (boost::format("\\u%04x") % int(c));
      } else {
        out << c;
      }
    }
  }
  out << "\"";
  return out.str();
}

std::string number(double d) {
  if (!std::isfinite(d)) {
    return "null";
  }
  for (int precision = 15; precision <= 17; ++precision) {
    std::ostringstream out;
    out << std::setprecision(precision) << d;
    if (precision == 17 || std::strtod(out.str().c_str(), nullptr) == d) {
      return out.str();
    }
  }
  return "null";
}

std::string view_to_json(const viewport &v) {
  std::ostringstream out;
  out << "{\"north\":" << number(v.north)
      << ",\"south\":" << number(v.south)
      << ",\"east\":" << number(v.east)
      << ",\"west\":" << number(v.west)
      << ",\"zoom\":" << (v.zoom ? number(*v.zoom) : std::string("null"))
      << "}";
  return out.str();
}

std::string bounds_response(const boost::optional<viewport> &v) {
  return "{\"bounds\":" + (v ? view_to_json(*v) : std::string("null")) + "}";
}

std::string stats_to_json(const stats_snapshot &s) {
  std::ostringstream out;
  out << "{\"count\":" << s.stats.count
      << ",\"area\":" << number(s.stats.area)
      << ",\"bounds\":" << (s.view ? view_to_json(*s.view) : std::string("null"))
      << "}";
  return out.str();
}

std::string status_response(const boost::optional<std::string> &error) {
  if (error) {
    return "{\"status\":\"error\",\"message\":" + quote(*error) + "}";
  }
  return "{\"status\":\"ok\"}";
}

boost::optional<viewport> parse_bounds_response(const std::string &body) {
  bpt::ptree root;
  std::istringstream in(body);
  bpt::read_json(in, root);

  const bpt::ptree &tree = root;
  const bpt::ptree &bounds = tree.get_child("bounds");
  if (is_null(bounds)) {
    return boost::none;
  }

  either<viewport, std::string> v = parse_view_tree(bounds, bounds.get_child_optional("zoom"));
  if (v.is_right()) {
    throw std::runtime_error((boost::format("Invalid bounds response: %1%") % v.right()).str());
  }
  return v.left();
}

} } // namespace footprint::json
