#ifndef FOOTPRINT_TILE_HPP
#define FOOTPRINT_TILE_HPP

#include <iosfwd>
#include <memory>
#include <string>

/* Forward declaration of vector tile type. This type is opaque
 * to users of footprint, but we expose some methods in the
 * exported vector tile object below. */
namespace vector_tile { class Tile; }

namespace footprint {

/**
 * Wrapper around the vector tile type, exposing some useful
 * methods but not needing the inclusion of the protobuf header.
 */
class tile {
public:
  // Construct an empty vector tile
  tile(unsigned int z_, unsigned int x_, unsigned int y_);

  ~tile();

  // Return the tile contents as PBF
  std::string get_data() const;

  // Return the tile contents as gzipped PBF. A compression level
  // of -1 means zlib's default.
  std::string get_gzip_data(int compression_level = -1) const;

  // parse the string as PBF, or gzipped PBF, to get a tile.
  void from_string(const std::string &str);

  // Return the in-memory structure of the tile.
  vector_tile::Tile const &mvt() const;
  vector_tile::Tile &mvt();

  // coordinates of this tile
  const unsigned int z, x, y;

private:
  std::unique_ptr<vector_tile::Tile> m_mvt;
};

// wrapper object so that information about the gzip compression
// level can be passed into the output function.
struct tile_gzip {
  // set with the default level of compression
  explicit tile_gzip(const tile &t) : tile_(t), compression_level_(-1) {}
  // use an explicit level of compression
  tile_gzip(const tile &t, int compression_level)
    : tile_(t), compression_level_(compression_level) {}

  const tile &tile_;
  int compression_level_;
};

// output functions for zero-copy streams
std::ostream &operator<<(std::ostream &, const tile &);
std::ostream &operator<<(std::ostream &, const tile_gzip &);

} // namespace footprint

#endif // FOOTPRINT_TILE_HPP
