#include "wkb.hpp"

#include <cstring>
#include <stdexcept>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/format.hpp>
#include <boost/geometry/io/wkt/read.hpp>

namespace footprint { namespace wkb {

namespace {

enum geometry_type : std::uint32_t {
  wkb_polygon = 3,
  wkb_multi_polygon = 6
};

// EWKB flags in the high bits of the type code
const std::uint32_t ewkb_z = 0x80000000u;
const std::uint32_t ewkb_m = 0x40000000u;
const std::uint32_t ewkb_srid = 0x20000000u;

struct reader {
  reader(const std::string &data)
    : m_ptr(reinterpret_cast<const unsigned char *>(data.data())),
      m_end(m_ptr + data.size()),
      m_little(true) {
  }

  void need(std::size_t bytes) const {
    if (std::size_t(m_end - m_ptr) < bytes) {
      throw std::runtime_error((boost::format("Truncated WKB: wanted %1% bytes, but only %2% remain.")
                                % bytes % (m_end - m_ptr)).str());
    }
  }

  std::size_t remaining() const {
    return std::size_t(m_end - m_ptr);
  }

  void byte_order() {
    need(1);
    const unsigned char order = *m_ptr++;
    if (order > 1) {
      throw std::runtime_error((boost::format("Invalid WKB byte order marker %1%.")
                                % int(order)).str());
    }
    m_little = (order == 1);
  }

  std::uint32_t uint32() {
    need(sizeof(std::uint32_t));
    std::uint32_t v = 0;
    std::memcpy(&v, m_ptr, sizeof v);
    m_ptr += sizeof v;
    return m_little ? boost::endian::little_to_native(v) : boost::endian::big_to_native(v);
  }

  double float64() {
    need(sizeof(std::uint64_t));
    std::uint64_t bits = 0;
    std::memcpy(&bits, m_ptr, sizeof bits);
    m_ptr += sizeof bits;
    bits = m_little ? boost::endian::little_to_native(bits) : boost::endian::big_to_native(bits);
    double v = 0.0;
    std::memcpy(&v, &bits, sizeof v);
    return v;
  }

  const unsigned char *m_ptr, *m_end;
  bool m_little;
};

struct header {
  std::uint32_t type;
  unsigned int dimensions;
};

header read_header(reader &r) {
  r.byte_order();
  std::uint32_t code = r.uint32();

  header h;
  h.dimensions = 2;

  if (code & ewkb_srid) {
    r.uint32();
  }
  if (code & ewkb_z) { ++h.dimensions; }
  if (code & ewkb_m) { ++h.dimensions; }
  code &= 0x0fffffffu;

  // ISO flavour: 1000 = Z, 2000 = M, 3000 = ZM
  const std::uint32_t iso_dims = code / 1000;
  if (iso_dims > 3) {
    throw std::runtime_error((boost::format("Unknown WKB geometry type %1%.") % code).str());
  }
  h.dimensions += (iso_dims == 3) ? 2 : ((iso_dims > 0) ? 1 : 0);
  h.type = code % 1000;

  return h;
}

void read_ring(reader &r, unsigned int dimensions, polygon_2d::ring_type &ring) {
  const std::uint32_t num_points = r.uint32();
  r.need(std::size_t(num_points) * dimensions * sizeof(double));

  ring.reserve(num_points);
  for (std::uint32_t i = 0; i < num_points; ++i) {
    const double x = r.float64();
    const double y = r.float64();
    for (unsigned int d = 2; d < dimensions; ++d) {
      r.float64();
    }
    ring.push_back(point_2d(x, y));
  }
}

void read_polygon_body(reader &r, unsigned int dimensions, polygon_2d &poly) {
  const std::uint32_t num_rings = r.uint32();
  // every ring has at least its point count
  r.need(std::size_t(num_rings) * sizeof(std::uint32_t));

  for (std::uint32_t i = 0; i < num_rings; ++i) {
    if (i == 0) {
      read_ring(r, dimensions, poly.outer());

    } else {
      poly.inners().resize(poly.inners().size() + 1);
      read_ring(r, dimensions, poly.inners().back());
    }
  }
}

void put_uint32(std::string &out, std::uint32_t v) {
  v = boost::endian::native_to_little(v);
  out.append(reinterpret_cast<const char *>(&v), sizeof v);
}

void put_float64(std::string &out, double d) {
  std::uint64_t bits = 0;
  std::memcpy(&bits, &d, sizeof bits);
  bits = boost::endian::native_to_little(bits);
  out.append(reinterpret_cast<const char *>(&bits), sizeof bits);
}

void put_ring(std::string &out, const polygon_2d::ring_type &ring) {
  put_uint32(out, std::uint32_t(ring.size()));
  for (auto const &p : ring) {
    put_float64(out, p.get<0>());
    put_float64(out, p.get<1>());
  }
}

void put_polygon(std::string &out, const polygon_2d &poly) {
  out.push_back(char(1));
  put_uint32(out, wkb_polygon);
  put_uint32(out, std::uint32_t(1 + poly.inners().size()));
  put_ring(out, poly.outer());
  for (auto const &ring : poly.inners()) {
    put_ring(out, ring);
  }
}

} // anonymous namespace

bool read_polygons(const std::string &data, multi_polygon_2d &out) {
  reader r(data);
  const header h = read_header(r);

  if (h.type == wkb_polygon) {
    polygon_2d poly;
    read_polygon_body(r, h.dimensions, poly);
    out.push_back(std::move(poly));
    return true;

  } else if (h.type == wkb_multi_polygon) {
    const std::uint32_t num_polygons = r.uint32();
    // each member has at least a header and a ring count
    r.need(std::size_t(num_polygons) * 9);

    multi_polygon_2d polys;
    polys.reserve(num_polygons);
    for (std::uint32_t i = 0; i < num_polygons; ++i) {
      const header member = read_header(r);
      if (member.type != wkb_polygon) {
        throw std::runtime_error((boost::format("Expected a Polygon inside a MultiPolygon, "
                                                "but got WKB type %1%.") % member.type).str());
      }
      polygon_2d poly;
      read_polygon_body(r, member.dimensions, poly);
      polys.push_back(std::move(poly));
    }

    out.insert(out.end(), polys.begin(), polys.end());
    return true;
  }

  return false;
}

bool read_polygons_wkt(const std::string &text, multi_polygon_2d &out) {
  const std::string upper = boost::algorithm::to_upper_copy(boost::algorithm::trim_copy(text));

  try {
    if (boost::algorithm::starts_with(upper, "POLYGON")) {
      polygon_2d poly;
      bg::read_wkt(text, poly);
      out.push_back(std::move(poly));
      return true;

    } else if (boost::algorithm::starts_with(upper, "MULTIPOLYGON")) {
      multi_polygon_2d polys;
      bg::read_wkt(text, polys);
      out.insert(out.end(), polys.begin(), polys.end());
      return true;
    }

  } catch (const bg::read_wkt_exception &e) {
    throw std::runtime_error((boost::format("Malformed WKT: %1%") % e.what()).str());
  }

  return false;
}

std::string write_polygons(const multi_polygon_2d &geom) {
  std::string out;

  if (geom.size() == 1) {
    put_polygon(out, geom.front());

  } else {
    out.push_back(char(1));
    put_uint32(out, wkb_multi_polygon);
    put_uint32(out, std::uint32_t(geom.size()));
    for (auto const &poly : geom) {
      put_polygon(out, poly);
    }
  }

  return out;
}

} } // namespace footprint::wkb
