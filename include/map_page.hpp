#ifndef FOOTPRINT_MAP_PAGE_HPP
#define FOOTPRINT_MAP_PAGE_HPP

#include <map>
#include <string>

namespace footprint {

/* Defaults for the map page, used when a query parameter is missing
 * or invalid. */
struct map_page_options {
  map_page_options();

  double longitude, latitude, zoom;
  double min_zoom;
  // tiles beyond this zoom are overzoomed by the client.
  int source_max_zoom;
  std::string color;
  double opacity;
  std::string layer_name;
};

/* Make the HTML document for an interactive map of the building tiles,
 * which reports its view back to the server as it moves.
 *
 * Recognised query parameters are `lng`, `lat`, `zoom`, `minzoom`,
 * `color` and `opacity`. Each is checked for type and range, and falls
 * back to the default if it isn't valid, so nothing from the query is
 * written into the page unchecked.
 */
std::string make_map_page(const std::map<std::string, std::string> &params,
                          const map_page_options &defaults);

} // namespace footprint

#endif /* FOOTPRINT_MAP_PAGE_HPP */
