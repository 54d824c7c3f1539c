#include "map_page.hpp"
#include "view_json.hpp"

#include <cmath>
#include <sstream>

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>

namespace footprint {

namespace {

double number_param(const std::map<std::string, std::string> &params,
                    const std::string &name, double min, double max, double def) {
  auto itr = params.find(name);
  if (itr == params.end()) {
    return def;
  }

  try {
    const double d = boost::lexical_cast<double>(itr->second);
    if (std::isfinite(d) && (d >= min) && (d <= max)) {
      return d;
    }

  } catch (const boost::bad_lexical_cast &) {
  }

  return def;
}

// CSS hex colours: #rgb, #rgba, #rrggbb or #rrggbbaa.
bool valid_color(const std::string &color) {
  using namespace boost::algorithm;
  const std::size_t digits = color.size() - 1;
  return (color.size() > 1) && (color[0] == '#') &&
    (digits == 3 || digits == 4 || digits == 6 || digits == 8) &&
    all(color.substr(1), is_xdigit());
}

std::string color_param(const std::map<std::string, std::string> &params,
                        const std::string &def) {
  auto itr = params.find("color");
  if ((itr != params.end()) && valid_color(itr->second)) {
    return itr->second;
  }
  return def;
}

} // anonymous namespace

map_page_options::map_page_options()
  : longitude(5.12),
    latitude(52.09),
    zoom(15),
    min_zoom(10),
    source_max_zoom(16),
    color("#3388ff"),
    opacity(0.6),
    layer_name("buildings") {
}

std::string make_map_page(const std::map<std::string, std::string> &params,
                          const map_page_options &defaults) {
  const double lng = number_param(params, "lng", -180.0, 180.0, defaults.longitude);
  const double lat = number_param(params, "lat", -90.0, 90.0, defaults.latitude);
  const double zoom = number_param(params, "zoom", 0.0, 24.0, defaults.zoom);
  const double min_zoom = number_param(params, "minzoom", 0.0, 24.0, defaults.min_zoom);
  const double opacity = number_param(params, "opacity", 0.0, 1.0, defaults.opacity);
  const std::string color = color_param(params, defaults.color);
  const std::string layer = json::quote(defaults.layer_name);

  std::ostringstream out;
  out << "<!DOCTYPE html>\n"
      << "<html>\n"
      << "<head>\n"
      << "  <meta charset=\"utf-8\">\n"
      << "  <title>Buildings</title>\n"
      << "  <script src=\"https://unpkg.com/maplibre-gl@4.7.1/dist/maplibre-gl.js\"></script>\n"
      << "  <link href=\"https://unpkg.com/maplibre-gl@4.7.1/dist/maplibre-gl.css\" rel=\"stylesheet\" />\n"
      << "  <style>\n"
      << "    body { margin: 0; padding: 0; }\n"
      << "    #map { position: absolute; top: 0; bottom: 0; width: 100%; }\n"
      << "  </style>\n"
      << "</head>\n"
      << "<body>\n"
      << "  <div id=\"map\"></div>\n"
      << "  <script>\n"
      << "    const MIN_ZOOM = " << json::number(min_zoom) << ";\n"
      << "    const map = new maplibregl.Map({\n"
      << "      container: 'map',\n"
      << "      style: {\n"
      << "        version: 8,\n"
      << "        sources: {\n"
      << "          'osm': {\n"
      << "            type: 'raster',\n"
      << "            tiles: ['https://tile.openstreetmap.org/{z}/{x}/{y}.png'],\n"
      << "            tileSize: 256\n"
      << "          },\n"
      << "          'buildings': {\n"
      << "            type: 'vector',\n"
      << "            tiles: [window.location.origin + '/tiles/{z}/{x}/{y}.pbf'],\n"
      << "            minzoom: MIN_ZOOM,\n"
      << "            maxzoom: " << defaults.source_max_zoom << "\n"
      << "          }\n"
      << "        },\n"
      << "        layers: [\n"
      << "          { id: 'osm-layer', type: 'raster', source: 'osm' },\n"
      << "          {\n"
      << "            id: 'buildings-fill',\n"
      << "            type: 'fill',\n"
      << "            source: 'buildings',\n"
      << "            'source-layer': " << layer << ",\n"
      << "            minzoom: MIN_ZOOM,\n"
      << "            paint: { 'fill-color': '" << color << "', 'fill-opacity': " << json::number(opacity) << " }\n"
      << "          },\n"
      << "          {\n"
      << "            id: 'buildings-outline',\n"
      << "            type: 'line',\n"
      << "            source: 'buildings',\n"
      << "            'source-layer': " << layer << ",\n"
      << "            minzoom: MIN_ZOOM,\n"
      << "            paint: { 'line-color': '#333', 'line-width': 0.5 }\n"
      << "          }\n"
      << "        ]\n"
      << "      },\n"
      << "      center: [" << json::number(lng) << ", " << json::number(lat) << "],\n"
      << "      zoom: " << json::number(zoom) << "\n"
      << "    });\n"
      << "\n"
      << "    map.addControl(new maplibregl.NavigationControl());\n"
      << "\n"
      << "    function updateView() {\n"
      << "      const bounds = map.getBounds();\n"
      << "      fetch('/update-view', {\n"
      << "        method: 'POST',\n"
      << "        headers: {'Content-Type': 'application/json'},\n"
      << "        body: JSON.stringify({\n"
      << "          bounds: {\n"
      << "            north: bounds.getNorth(),\n"
      << "            south: bounds.getSouth(),\n"
      << "            east: bounds.getEast(),\n"
      << "            west: bounds.getWest()\n"
      << "          },\n"
      << "          zoom: map.getZoom()\n"
      << "        })\n"
      << "      });\n"
      << "    }\n"
      << "\n"
      << "    map.on('load', updateView);\n"
      << "    map.on('moveend', updateView);\n"
      << "\n"
      << "    map.on('click', 'buildings-fill', (e) => {\n"
      << "      const props = e.features[0].properties;\n"
      << "      const popup = document.createElement('div');\n"
      << "      const title = document.createElement('h3');\n"
      << "      title.textContent = 'Building';\n"
      << "      popup.appendChild(title);\n"
      << "      for (const [k, v] of Object.entries(props)) {\n"
      << "        if (v === null || v === undefined || v === '' || v === 'null') continue;\n"
      << "        const p = document.createElement('p');\n"
      << "        const b = document.createElement('b');\n"
      << "        b.textContent = k + ': ';\n"
      << "        p.appendChild(b);\n"
      << "        p.appendChild(document.createTextNode(String(v)));\n"
      << "        popup.appendChild(p);\n"
      << "      }\n"
      << "      new maplibregl.Popup().setLngLat(e.lngLat).setDOMContent(popup).addTo(map);\n"
      << "    });\n"
      << "\n"
      << "    map.on('mouseenter', 'buildings-fill', () => map.getCanvas().style.cursor = 'pointer');\n"
      << "    map.on('mouseleave', 'buildings-fill', () => map.getCanvas().style.cursor = '');\n"
      << "  </script>\n"
      << "</body>\n"
      << "</html>\n";

  return out.str();
}

} // namespace footprint
