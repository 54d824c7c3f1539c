#include <map>
#include <string>
#include <vector>
#include <sstream>
#include <boost/function.hpp>
#include <boost/format.hpp>
#include <boost/noncopyable.hpp>
#include <boost/filesystem.hpp>
#include <boost/optional.hpp>
#include <stdexcept>

#include "geometry.hpp"

namespace vector_tile { class Tile_Layer; class Tile_Feature; }

namespace test{

template <typename T>
void assert_equal(T actual, T expected, std::string message = std::string()) {
   if (actual != expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_not_equal(T actual, T expected, std::string message = std::string()) {
   if (actual == expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_less_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual > expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

template <typename T>
void assert_greater_or_equal(T actual, T expected, std::string message = std::string()) {
   if (actual < expected) {
      throw std::runtime_error((boost::format("%1%: expected=%2%, actual=%3%.")
                                % message % expected % actual).str());
   }
}

/* runs the test function, formats the output nicely and returns 1
 * if the test failed.
 */
int run(const std::string &name, boost::function<void ()> test);

/* a DSL to make JSON documents. this is nicer than simply quoting
 * the JSON because C++ lacks heredoc support and uses the same quote
 * character as JSON, so the quoted strings end up looking really ugly.
 */
struct json {
   enum type { type_NONE, type_DICT, type_LIST };

   json();
   json(const json &j);

   /* use operator() to add dictionary key-value entries.
    */
   template <typename T>
   json &operator()(const std::string &key, const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_DICT; }
      if (m_type != type_DICT) { throw std::runtime_error("Mixed type in JSON: expecting DICT."); }
      if (first) { m_buf << "{"; } else { m_buf << ","; }
      m_buf << "\"" << key << "\":";
      quote(t);
      return *this;
   }

   /* use operator[] to add list entries.
    */
   template <typename T>
   json &operator[](const T &t) {
      bool first = false;
      if (m_type == type_NONE) { first = true; m_type = type_LIST; }
      if (m_type != type_LIST) { throw std::runtime_error("Mixed type in JSON: expecting LIST."); }
      if (first) { m_buf << "["; } else { m_buf << ","; }
      quote(t);
      return *this;
   }

   std::string str() const;

   friend std::ostream &operator<<(std::ostream &, const json &);

private:

   void quote(const json &);
   void quote(const std::string &);
   void quote(const char *);
   void quote(int);
   void quote(double);

   type m_type;
   std::ostringstream m_buf;
};

std::ostream &operator<<(std::ostream &, const json &);

/* an RAII temporary directory.
 *
 * on construction, creates a temporary directory. the path to it
 * is available via the path() accessor. upon destruction, it will
 * recursively delete the whole temporary directory tree.
 */
struct temp_dir : boost::noncopyable {
   temp_dir();
   ~temp_dir();
   inline boost::filesystem::path path() const { return m_path; }
private:
   boost::filesystem::path m_path;
};

/* a row to put in a test dataset. the geometry is WKT, and is stored
 * as WKB unless `as_text` is set.
 */
struct feature {
   feature(const std::string &id_, const std::string &wkt_);

   feature &name(const std::string &n) { m_name = n; return *this; }
   feature &height(double h) { m_height = h; return *this; }
   feature &building_class(const std::string &c) { m_class = c; return *this; }
   feature &text_geometry() { as_text = true; return *this; }

   std::string id, wkt;
   bool as_text;
   boost::optional<std::string> m_name;
   boost::optional<double> m_height;
   boost::optional<std::string> m_class;
};

/* write an SQLite database at `path` with a buildings table, its bbox
 * columns filled from the geometry, and an R*Tree index over them.
 */
void make_dataset(const boost::filesystem::path &path,
                  const std::vector<feature> &features,
                  const std::string &table = "buildings");

/* a dataset in a temporary directory, which goes away afterwards. */
struct dataset : boost::noncopyable {
   explicit dataset(const std::vector<feature> &features);
   std::string path() const;
private:
   temp_dir m_dir;
};

/* just enough of an HTTP client to poke at the server. */
struct http_response {
   int status;
   // header names are lower case
   std::map<std::string, std::string> headers;
   std::string body;

   boost::optional<std::string> header(const std::string &name) const;
};

http_response http_request(const std::string &port, const std::string &method,
                           const std::string &path,
                           const std::map<std::string, std::string> &headers
                             = std::map<std::string, std::string>(),
                           const std::string &body = std::string());

http_response http_get(const std::string &port, const std::string &path);
http_response http_post(const std::string &port, const std::string &path,
                        const std::string &body);

/* vector tile decoding, to check what the encoder wrote. */

// the tile-grid rings of a feature, one per MoveTo ... ClosePath.
std::vector<std::vector<footprint::tile_point> >
decode_rings(const vector_tile::Tile_Feature &feature);

// the attributes of a feature, with all values formatted as strings.
std::map<std::string, std::string>
decode_tags(const vector_tile::Tile_Layer &layer, const vector_tile::Tile_Feature &feature);

// signed area of a ring by the surveyor's formula, in raw coordinates.
double ring_area(const std::vector<footprint::tile_point> &ring);

} // namespace test
