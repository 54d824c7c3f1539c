#include "backend.hpp"
#include "vector_tile.pb.h"

#include <stdexcept>

namespace footprint {

namespace {

enum command_type : std::uint32_t {
  cmd_move_to = 1,
  cmd_line_to = 2,
  cmd_close_path = 7
};

const std::uint32_t layer_version = 2;

inline std::uint32_t command(command_type id, std::uint32_t count) {
  return (std::uint32_t(id) & 0x7) | (count << 3);
}

inline std::uint32_t zigzag(std::int64_t delta) {
  const std::int32_t n = std::int32_t(delta);
  return (std::uint32_t(n) << 1) ^ std::uint32_t(n >> 31);
}

} // anonymous namespace

backend::backend(vector_tile::Tile &tile, unsigned int extent)
  : m_tile(tile),
    m_extent(extent),
    m_current_layer(nullptr),
    m_current_feature(nullptr),
    m_x(0), m_y(0) {
}

void backend::start_tile_layer(const std::string &name) {
  m_current_layer = m_tile.add_layers();
  m_current_layer->set_name(name);
  m_current_layer->set_version(layer_version);
  m_current_layer->set_extent(m_extent);

  m_keys.clear();
  m_string_values.clear();
  m_double_values.clear();
}

void backend::stop_tile_layer() {
  if (m_current_layer == nullptr) {
    throw std::runtime_error("stop_tile_layer called without a current layer.");
  }

  if (m_current_layer->features_size() == 0) {
    m_tile.mutable_layers()->RemoveLast();
  }

  m_current_layer = nullptr;
}

void backend::start_tile_feature(const building &b) {
  if (m_current_layer == nullptr) {
    throw std::runtime_error("start_tile_feature called without a current layer.");
  }

  m_current_feature = m_current_layer->add_features();
  m_current_feature->set_type(vector_tile::Tile_GeomType_POLYGON);
  m_x = m_y = 0;

  m_current_feature->add_tags(key_index("id"));
  m_current_feature->add_tags(value_index(b.id));

  if (b.name) {
    m_current_feature->add_tags(key_index("name"));
    m_current_feature->add_tags(value_index(*b.name));
  }
  if (b.height) {
    m_current_feature->add_tags(key_index("height"));
    m_current_feature->add_tags(value_index(*b.height));
  }
  if (b.building_class) {
    m_current_feature->add_tags(key_index("class"));
    m_current_feature->add_tags(value_index(*b.building_class));
  }
}

void backend::stop_tile_feature() {
  if (m_current_feature == nullptr) {
    throw std::runtime_error("stop_tile_feature called without a current feature.");
  }

  if (m_current_feature->geometry_size() == 0) {
    m_current_layer->mutable_features()->RemoveLast();
  }

  m_current_feature = nullptr;
}

unsigned int backend::add_path(const tile_multi_polygon &geom) {
  if (m_current_feature == nullptr) {
    throw std::runtime_error("add_path called without a current feature.");
  }

  unsigned int count = 0;
  for (auto const &poly : geom) {
    add_ring(poly.outer());
    ++count;
    for (auto const &inner : poly.inners()) {
      add_ring(inner);
      ++count;
    }
  }
  return count;
}

int backend::feature_count() const {
  return (m_current_layer == nullptr) ? 0 : m_current_layer->features_size();
}

void backend::add_ring(const tile_ring &ring) {
  // the ring is closed, and the closing point is implied by ClosePath.
  if (ring.size() < 4) {
    return;
  }
  const std::size_t num_points = ring.size() - 1;

  auto *geometry = m_current_feature->mutable_geometry();

  geometry->Add(command(cmd_move_to, 1));
  geometry->Add(zigzag(ring[0].get<0>() - m_x));
  geometry->Add(zigzag(ring[0].get<1>() - m_y));
  m_x = ring[0].get<0>();
  m_y = ring[0].get<1>();

  geometry->Add(command(cmd_line_to, std::uint32_t(num_points - 1)));
  for (std::size_t i = 1; i < num_points; ++i) {
    const tile_point &p = ring[i];
    geometry->Add(zigzag(p.get<0>() - m_x));
    geometry->Add(zigzag(p.get<1>() - m_y));
    m_x = p.get<0>();
    m_y = p.get<1>();
  }

  geometry->Add(command(cmd_close_path, 1));
}

std::uint32_t backend::key_index(const std::string &key) {
  auto itr = m_keys.find(key);
  if (itr != m_keys.end()) {
    return itr->second;
  }

  const std::uint32_t index = std::uint32_t(m_current_layer->keys_size());
  m_current_layer->add_keys(key);
  m_keys.insert(std::make_pair(key, index));
  return index;
}

std::uint32_t backend::value_index(const std::string &value) {
  auto itr = m_string_values.find(value);
  if (itr != m_string_values.end()) {
    return itr->second;
  }

  const std::uint32_t index = std::uint32_t(m_current_layer->values_size());
  m_current_layer->add_values()->set_string_value(value);
  m_string_values.insert(std::make_pair(value, index));
  return index;
}

std::uint32_t backend::value_index(double value) {
  auto itr = m_double_values.find(value);
  if (itr != m_double_values.end()) {
    return itr->second;
  }

  const std::uint32_t index = std::uint32_t(m_current_layer->values_size());
  m_current_layer->add_values()->set_double_value(value);
  m_double_values.insert(std::make_pair(value, index));
  return index;
}

} // namespace footprint
