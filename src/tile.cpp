#include "tile.hpp"
#include "vector_tile.pb.h"

#include <sstream>
#include <stdexcept>

#include <google/protobuf/io/zero_copy_stream_impl.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/io/gzip_stream.h>

namespace footprint {

namespace {

inline bool is_gzipped(const std::string &str) {
  return (str.size() >= 2) &&
    (static_cast<unsigned char>(str[0]) == 0x1f) &&
    (static_cast<unsigned char>(str[1]) == 0x8b);
}

} // anonymous namespace

tile::tile(unsigned int z_, unsigned int x_, unsigned int y_)
  : z(z_), x(x_), y(y_), m_mvt(new vector_tile::Tile) {
}

tile::~tile() {
}

std::string tile::get_data() const {
  std::ostringstream buffer;
  buffer << *this;
  return buffer.str();
}

std::string tile::get_gzip_data(int compression_level) const {
  std::ostringstream buffer;
  buffer << tile_gzip(*this, compression_level);
  return buffer.str();
}

void tile::from_string(const std::string &str) {
  std::unique_ptr<vector_tile::Tile> parsed(new vector_tile::Tile);
  bool read_ok = false;

  if (is_gzipped(str)) {
    google::protobuf::io::ArrayInputStream stream(str.data(), int(str.size()));
    google::protobuf::io::GzipInputStream gz_stream(
      &stream, google::protobuf::io::GzipInputStream::GZIP);
    read_ok = parsed->ParseFromZeroCopyStream(&gz_stream);

  } else {
    read_ok = parsed->ParseFromString(str);
  }

  if (!read_ok) {
    throw std::runtime_error("Unable to parse vector tile from string.");
  }

  m_mvt.swap(parsed);
}

vector_tile::Tile const &tile::mvt() const {
  return *m_mvt;
}

vector_tile::Tile &tile::mvt() {
  return *m_mvt;
}

std::ostream &operator<<(std::ostream &out, const tile &t) {
  google::protobuf::io::OstreamOutputStream stream(&out);
  bool write_ok = t.mvt().SerializeToZeroCopyStream(&stream);

  if (!write_ok) {
    throw std::runtime_error("Unable to write tile to output stream.");
  }

  return out;
}

std::ostream &operator<<(std::ostream &out, const tile_gzip &t) {
  google::protobuf::io::OstreamOutputStream stream(&out);

  google::protobuf::io::GzipOutputStream::Options options;
  if (t.compression_level_ >= 0) {
    options.compression_level = t.compression_level_;
  }
  options.format = google::protobuf::io::GzipOutputStream::GZIP;

  {
    google::protobuf::io::GzipOutputStream gz_stream(&stream, options);

    bool write_ok = t.tile_.mvt().SerializeToZeroCopyStream(&gz_stream);
    if (!write_ok || !gz_stream.Close()) {
      throw std::runtime_error("Unable to write tile to output stream.");
    }
  }

  return out;
}

} // namespace footprint
