#ifndef FOOTPRINT_VIEW_JSON_HPP
#define FOOTPRINT_VIEW_JSON_HPP

#include "either.hpp"
#include "view_state.hpp"

#include <string>
#include <boost/optional.hpp>

namespace footprint { namespace json {

/* Parse the body of a view update, which looks like:
 *
 *   {"bounds": {"north": 52.1, "south": 52.0, "east": 5.2, "west": 5.0},
 *    "zoom": 15.5}
 *
 * The zoom may be missing or null. Returns the viewport, or a short
 * message saying what was wrong with the body.
 */
either<viewport, std::string> parse_view_update(const std::string &body);

// {"north": ..., "south": ..., "east": ..., "west": ..., "zoom": ...|null}
std::string view_to_json(const viewport &v);

// {"bounds": <view>|null}
std::string bounds_response(const boost::optional<viewport> &v);

// {"count": N, "area": A, "bounds": <view>|null}
std::string stats_to_json(const stats_snapshot &s);

// {"status": "ok"}, or {"status": "error", "message": ...} if the
// message is set.
std::string status_response(const boost::optional<std::string> &error);

// parse the output of `bounds_response`. throws std::runtime_error if
// it isn't valid.
boost::optional<viewport> parse_bounds_response(const std::string &body);

// JSON string literal, with quotes and escapes.
std::string quote(const std::string &str);

// shortest decimal form of the number which reads back the same.
std::string number(double d);

} } // namespace footprint::json

#endif /* FOOTPRINT_VIEW_JSON_HPP */
