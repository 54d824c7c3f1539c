#include "common.hpp"
#include "logging/logger.hpp"
#include "sqlite.hpp"
#include "wkb.hpp"
#include "vector_tile.pb.h"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <exception>
#include <stdexcept>
#include <iomanip>
#include <iostream>

using boost::function;
using std::runtime_error;
using std::exception;
using std::cout;
using std::cerr;
using std::endl;
using std::setw;
using std::flush;
using std::string;
using std::vector;
namespace fs = boost::filesystem;
namespace bg = boost::geometry;

#define TEST_NAME_WIDTH (45)

namespace {

void unwind_nested_exception(std::ostream &out, const std::exception &e) {
  out << e.what();
  try {
    std::rethrow_if_nested(e);

  } catch (const std::exception &nested) {
    out << ". Caused by: ";
    unwind_nested_exception(out, nested);
  }
}

inline std::int32_t unzigzag(std::uint32_t n) {
  return std::int32_t(n >> 1) ^ -std::int32_t(n & 1);
}

} // anonymous namespace

namespace test {

int run(const string &name, function<void ()> test) {
  cout << setw(TEST_NAME_WIDTH) << name << flush;
  try {
    test();
    cout << "  [PASS]" << endl;
    return 0;

  } catch (const exception &ex) {
    cout << "  [FAIL: ";
    unwind_nested_exception(cout, ex);
    cout << "]" << endl;
    return 1;
  }
}

json::json() : m_type(json::type_NONE) {}
json::json(const json &j)
   : m_type(j.m_type), m_buf(j.m_buf.str(), std::ios_base::out | std::ios_base::ate) {}

std::string json::str() const {
   std::ostringstream out;
   out << *this;
   return out.str();
}

std::ostream &operator<<(std::ostream &out, const json &j) {
   if (j.m_type == json::type_NONE) {
      out << "null";

   } else {
      out << j.m_buf.str();
      if (j.m_type == json::type_DICT) {
         out << "}";
      } else {
         out << "]";
      }
   }
   return out;
}

void json::quote(const json &j) { m_buf << j; }
void json::quote(const std::string &s) { m_buf << "\"" << s << "\""; }
void json::quote(const char *s) { m_buf << "\"" << s << "\""; }
void json::quote(int i) { m_buf << i; }
void json::quote(double d) { m_buf << std::setprecision(16) << d; }

temp_dir::temp_dir()
   : m_path(fs::temp_directory_path() / fs::unique_path("footprint-test-%%%%-%%%%-%%%%-%%%%")) {
   fs::create_directories(m_path);
}

temp_dir::~temp_dir() {
   boost::system::error_code err;

   // catch all errors - we don't want to throw in the destructor
   try {
      fs::remove_all(m_path, err);

      if (err && (err != boost::system::errc::no_such_file_or_directory)) {
         LOG_WARNING(boost::format("Unable to remove temporary "
                                   "directory %1%: %2%")
                     % m_path % err.message());
      }

   } catch (const std::exception &e) {
      LOG_ERROR(boost::format("Exception caught while trying to remove "
                              "temporary directory %1%: %2%")
                % m_path % e.what());
   }
}

feature::feature(const std::string &id_, const std::string &wkt_)
   : id(id_), wkt(wkt_), as_text(false) {
}

void make_dataset(const fs::path &path, const vector<feature> &features,
                  const std::string &table) {
   using footprint::sqlite::db;
   db conn(path.string(), db::read_write_create);

   conn.exec((boost::format(
      "CREATE TABLE %1% (id TEXT, geometry BLOB, xmin REAL, xmax REAL, "
      "ymin REAL, ymax REAL, name TEXT, height REAL, class TEXT, "
      "subtype TEXT, num_floors INTEGER)") % table).str());

   footprint::sqlite::statement insert = conn.prepare((boost::format(
      "INSERT INTO %1% (id, geometry, xmin, xmax, ymin, ymax, name, height, class) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)") % table).str());

   for (auto const &f : features) {
      footprint::multi_polygon_2d geom;
      if (!footprint::wkb::read_polygons_wkt(f.wkt, geom)) {
         throw runtime_error((boost::format("Test feature %1% is not a polygon: %2%")
                              % f.id % f.wkt).str());
      }
      const footprint::box_2d bbox = bg::return_envelope<footprint::box_2d>(geom);

      insert.reset();
      insert.bind_text(1, f.id);
      if (f.as_text) {
         insert.bind_text(2, f.wkt);
      } else {
         insert.bind_blob(2, footprint::wkb::write_polygons(geom));
      }
      insert.bind_double(3, bbox.min_corner().get<0>());
      insert.bind_double(4, bbox.max_corner().get<0>());
      insert.bind_double(5, bbox.min_corner().get<1>());
      insert.bind_double(6, bbox.max_corner().get<1>());
      if (f.m_name) { insert.bind_text(7, *f.m_name); } else { insert.bind_null(7); }
      if (f.m_height) { insert.bind_double(8, *f.m_height); } else { insert.bind_null(8); }
      if (f.m_class) { insert.bind_text(9, *f.m_class); } else { insert.bind_null(9); }
      insert.step();
   }

   conn.exec((boost::format(
      "CREATE VIRTUAL TABLE %1%_rtree USING rtree(fid, xmin, xmax, ymin, ymax)") % table).str());
   conn.exec((boost::format(
      "INSERT INTO %1%_rtree SELECT rowid, xmin, xmax, ymin, ymax FROM %1%") % table).str());
}

dataset::dataset(const vector<feature> &features) : m_dir() {
   make_dataset(m_dir.path() / "buildings.db", features);
}

std::string dataset::path() const {
   return (m_dir.path() / "buildings.db").string();
}

boost::optional<std::string> http_response::header(const std::string &name) const {
   auto itr = headers.find(boost::algorithm::to_lower_copy(name));
   if (itr == headers.end()) {
      return boost::none;
   }
   return itr->second;
}

http_response http_request(const std::string &port, const std::string &method,
                           const std::string &path,
                           const std::map<std::string, std::string> &headers,
                           const std::string &body) {
   using boost::asio::ip::tcp;

   boost::asio::io_service io_service;
   tcp::resolver resolver(io_service);
   tcp::socket socket(io_service);
   boost::asio::connect(socket, resolver.resolve(tcp::resolver::query("127.0.0.1", port)));

   std::ostringstream req;
   req << method << " " << path << " HTTP/1.0\r\n"
       << "Host: 127.0.0.1:" << port << "\r\n";
   for (auto const &h : headers) {
      req << h.first << ": " << h.second << "\r\n";
   }
   if (!body.empty()) {
      req << "Content-Length: " << body.size() << "\r\n";
   }
   req << "\r\n" << body;
   boost::asio::write(socket, boost::asio::buffer(req.str()));

   // the server closes the connection after the reply.
   boost::asio::streambuf buf;
   boost::system::error_code ec;
   boost::asio::read(socket, buf, boost::asio::transfer_all(), ec);
   if (ec && (ec != boost::asio::error::eof)) {
      throw boost::system::system_error(ec);
   }

   const std::string raw((std::istreambuf_iterator<char>(&buf)), std::istreambuf_iterator<char>());
   const std::string::size_type header_end = raw.find("\r\n\r\n");
   if (header_end == std::string::npos) {
      throw runtime_error((boost::format("Malformed HTTP response: \"%1%\"") % raw).str());
   }

   http_response response;
   response.body = raw.substr(header_end + 4);

   std::istringstream head(raw.substr(0, header_end));
   std::string line;
   std::getline(head, line);
   // "HTTP/1.0 200 OK"
   response.status = boost::lexical_cast<int>(line.substr(9, 3));

   while (std::getline(head, line)) {
      const std::string::size_type colon = line.find(':');
      if (colon == std::string::npos) { continue; }
      response.headers[boost::algorithm::to_lower_copy(line.substr(0, colon))] =
         boost::algorithm::trim_copy(line.substr(colon + 1));
   }

   return response;
}

http_response http_get(const std::string &port, const std::string &path) {
   return http_request(port, "GET", path);
}

http_response http_post(const std::string &port, const std::string &path,
                        const std::string &body) {
   std::map<std::string, std::string> headers;
   headers["Content-Type"] = "application/json";
   return http_request(port, "POST", path, headers, body);
}

vector<vector<footprint::tile_point> >
decode_rings(const vector_tile::Tile_Feature &feature) {
   vector<vector<footprint::tile_point> > rings;
   std::int64_t x = 0, y = 0;

   int i = 0;
   while (i < feature.geometry_size()) {
      const std::uint32_t cmd = feature.geometry(i++);
      const std::uint32_t id = cmd & 0x7;
      const std::uint32_t count = cmd >> 3;

      if (id == 1 || id == 2) {
         if (id == 1) {
            rings.push_back(vector<footprint::tile_point>());
         }
         if (rings.empty()) {
            throw runtime_error("LineTo before MoveTo in feature geometry.");
         }
         for (std::uint32_t j = 0; j < count; ++j) {
            if (i + 1 >= feature.geometry_size()) {
               throw runtime_error("Truncated feature geometry.");
            }
            x += unzigzag(feature.geometry(i++));
            y += unzigzag(feature.geometry(i++));
            rings.back().push_back(footprint::tile_point(x, y));
         }

      } else if (id == 7) {
         if (rings.empty() || count != 1) {
            throw runtime_error("Bad ClosePath in feature geometry.");
         }

      } else {
         throw runtime_error((boost::format("Unknown geometry command %1%.") % id).str());
      }
   }

   return rings;
}

std::map<std::string, std::string>
decode_tags(const vector_tile::Tile_Layer &layer, const vector_tile::Tile_Feature &feature) {
   std::map<std::string, std::string> tags;
   for (int i = 0; i + 1 < feature.tags_size(); i += 2) {
      const std::string &key = layer.keys(feature.tags(i));
      const vector_tile::Tile_Value &value = layer.values(feature.tags(i + 1));

      if (value.has_string_value()) {
         tags[key] = value.string_value();
      } else if (value.has_double_value()) {
         tags[key] = (boost::format("%1%") % value.double_value()).str();
      } else if (value.has_int_value()) {
         tags[key] = (boost::format("%1%") % value.int_value()).str();
      } else {
         tags[key] = "?";
      }
   }
   return tags;
}

double ring_area(const vector<footprint::tile_point> &ring) {
   double area = 0.0;
   for (std::size_t i = 0; i < ring.size(); ++i) {
      const footprint::tile_point &a = ring[i];
      const footprint::tile_point &b = ring[(i + 1) % ring.size()];
      area += double(a.get<0>()) * double(b.get<1>()) - double(b.get<0>()) * double(a.get<1>());
   }
   return area / 2.0;
}

} // namespace test
