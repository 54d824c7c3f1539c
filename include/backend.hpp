#ifndef FOOTPRINT_BACKEND_HPP
#define FOOTPRINT_BACKEND_HPP

#include "building.hpp"
#include "geometry.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace vector_tile {
class Tile;
class Tile_Layer;
class Tile_Feature;
}

namespace footprint {

/* Writes features into the protobuf structure of a vector tile.
 *
 * Usage is: start_tile_layer, then for each feature start_tile_feature,
 * add_path and stop_tile_feature, then finally stop_tile_layer. Keys
 * and values are shared between all the features in a layer, and are
 * assigned indexes in the order they're first seen, so the same input
 * always produces the same output.
 */
class backend {
public:
  backend(vector_tile::Tile &tile, unsigned int extent);

  void start_tile_layer(const std::string &name);

  // finishes the current layer. if it didn't get any features then it
  // is removed from the tile again.
  void stop_tile_layer();

  // writes the attributes of the feature.
  void start_tile_feature(const building &b);

  // finishes the current feature. a feature without any geometry is
  // removed from the layer.
  void stop_tile_feature();

  // encodes polygons, which must already be clipped and oriented, into
  // the current feature. returns the number of rings written.
  unsigned int add_path(const tile_multi_polygon &geom);

  // the number of features in the current layer.
  int feature_count() const;

private:
  std::uint32_t key_index(const std::string &key);
  std::uint32_t value_index(const std::string &value);
  std::uint32_t value_index(double value);
  void add_ring(const tile_ring &ring);

  vector_tile::Tile &m_tile;
  unsigned int m_extent;
  vector_tile::Tile_Layer *m_current_layer;
  vector_tile::Tile_Feature *m_current_feature;
  std::map<std::string, std::uint32_t> m_keys;
  std::map<std::string, std::uint32_t> m_string_values;
  std::map<double, std::uint32_t> m_double_values;
  // position of the cursor, which is carried between rings
  std::int64_t m_x, m_y;
};

} // namespace footprint

#endif // FOOTPRINT_BACKEND_HPP
