#include "store/sqlite_store.hpp"
#include "logging/logger.hpp"
#include "sqlite.hpp"
#include "util.hpp"
#include "wkb.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/format.hpp>

namespace footprint { namespace store {

namespace {

// the rtree is the outer loop (CROSS JOIN stops SQLite from reordering)
// and only narrows the search: it stores 32-bit floats rounded outward,
// so the exact test is repeated on the feature's own bbox columns.
const char *bbox_predicate =
  "r.xmin <= ?1 AND r.xmax >= ?2 AND r.ymin <= ?3 AND r.ymax >= ?4 "
  "AND b.xmin <= ?1 AND b.xmax >= ?2 AND b.ymin <= ?3 AND b.ymax >= ?4";

enum feature_column {
  col_id = 0,
  col_geometry,
  col_xmin,
  col_xmax,
  col_ymin,
  col_ymax,
  col_name,
  col_height,
  col_class,
  col_subtype,
  col_num_floors
};

std::string feature_sql(const std::string &table) {
  return (boost::format(
    "SELECT b.id, b.geometry, b.xmin, b.xmax, b.ymin, b.ymax, "
    "b.name, b.height, b.class, b.subtype, b.num_floors "
    "FROM %1%_rtree AS r CROSS JOIN %1% AS b ON b.rowid = r.fid "
    "WHERE %2% ORDER BY b.rowid") % table % bbox_predicate).str();
}

std::string aggregate_sql(const std::string &table) {
  return (boost::format(
    "SELECT b.geometry "
    "FROM %1%_rtree AS r CROSS JOIN %1% AS b ON b.rowid = r.fid "
    "WHERE %2%") % table % bbox_predicate).str();
}

void bind_bbox(sqlite::statement &s, const box_2d &bbox) {
  s.bind_double(1, bbox.max_corner().get<0>());
  s.bind_double(2, bbox.min_corner().get<0>());
  s.bind_double(3, bbox.max_corner().get<1>());
  s.bind_double(4, bbox.min_corner().get<1>());
}

// decode the geometry column, which may be WKB or WKT. returns false if
// there's no polygon geometry in it, and throws if it's malformed.
bool read_geometry(sqlite::statement &s, int column, multi_polygon_2d &geom) {
  switch (s.column_type(column)) {
  case SQLITE_BLOB:
    return wkb::read_polygons(s.column_blob(column), geom);

  case SQLITE_TEXT:
    return wkb::read_polygons_wkt(*s.column_text(column), geom);

  default:
    return false;
  }
}

/* sets the deadline on the database for the lifetime of the object,
 * and leaves the statement ready to be run again afterwards. */
struct query_scope {
  query_scope(sqlite::db &db, sqlite::statement &s, std::chrono::milliseconds timeout)
    : m_db(db), m_statement(s) {
    m_statement.reset();
    if (timeout.count() > 0) {
      m_db.set_deadline(std::chrono::steady_clock::now() + timeout);
    }
  }

  ~query_scope() {
    m_statement.reset();
    m_db.clear_deadline();
  }

  sqlite::db &m_db;
  sqlite::statement &m_statement;
};

query_error make_error(const std::exception &e) {
  query_error err;
  err.status = (dynamic_cast<const sqlite::interrupted *>(&e) != nullptr)
    ? query_status::timeout
    : query_status::store_error;
  err.message = e.what();
  return err;
}

} // anonymous namespace

sqlite_store_options::sqlite_store_options()
  : table("buildings"),
    query_timeout(5000) {
}

bool valid_table_name(const std::string &name) {
  using namespace boost::algorithm;
  return !name.empty() &&
    !is_digit()(name[0]) &&
    all(name, is_alnum() || is_any_of("_"));
}

struct sqlite_store::impl {
  impl(const std::string &path, const sqlite_store_options &options);

  void read_feature(std::vector<building> &features);

  sqlite_store_options m_options;
  std::string m_path;
  sqlite::db m_db;
  std::unique_ptr<sqlite::statement> m_features;
  std::unique_ptr<sqlite::statement> m_aggregate;
};

sqlite_store::impl::impl(const std::string &path, const sqlite_store_options &options)
  : m_options(options),
    m_path(path),
    m_db(path, sqlite::db::read_only) {

  if (!valid_table_name(m_options.table)) {
    throw std::runtime_error((boost::format("Invalid table name \"%1%\".") % m_options.table).str());
  }

  if (!m_db.table_exists(m_options.table)) {
    throw std::runtime_error((boost::format("Database \"%1%\" has no table \"%2%\".")
                              % path % m_options.table).str());
  }

  if (!m_db.table_exists(m_options.table + "_rtree")) {
    throw std::runtime_error((boost::format("Database \"%1%\" has no spatial index \"%2%_rtree\".")
                              % path % m_options.table).str());
  }

  m_features.reset(new sqlite::statement(m_db.prepare(feature_sql(m_options.table))));
  m_aggregate.reset(new sqlite::statement(m_db.prepare(aggregate_sql(m_options.table))));
}

void sqlite_store::impl::read_feature(std::vector<building> &features) {
  sqlite::statement &s = *m_features;

  building b;
  b.id = s.column_text(col_id).get_value_or(std::string());

  try {
    if (!read_geometry(s, col_geometry, b.geometry)) {
      LOG_DEBUG(boost::format("Skipping feature \"%1%\": no polygon geometry.") % b.id);
      return;
    }

  } catch (const std::runtime_error &e) {
    LOG_WARNING(boost::format("Skipping feature \"%1%\" with bad geometry: %2%") % b.id % e.what());
    return;
  }

  b.bbox = box_2d(
    point_2d(s.column_double(col_xmin).get_value_or(0.0), s.column_double(col_ymin).get_value_or(0.0)),
    point_2d(s.column_double(col_xmax).get_value_or(0.0), s.column_double(col_ymax).get_value_or(0.0)));

  b.name = s.column_text(col_name);
  b.height = s.column_double(col_height);
  b.building_class = s.column_text(col_class);
  b.subtype = s.column_text(col_subtype);

  boost::optional<sqlite3_int64> floors = s.column_int(col_num_floors);
  if (floors) {
    b.num_floors = int(*floors);
  }

  features.push_back(std::move(b));
}

sqlite_store::sqlite_store(const std::string &path, const sqlite_store_options &options)
  : m_impl(new impl(path, options)) {
}

sqlite_store::~sqlite_store() {
}

query_response sqlite_store::query_in_bbox(const box_2d &bbox) {
  try {
    query_scope scope(m_impl->m_db, *m_impl->m_features, m_impl->m_options.query_timeout);
    bind_bbox(*m_impl->m_features, bbox);

    std::vector<building> features;
    while (m_impl->m_features->step()) {
      m_impl->read_feature(features);
    }

    return query_response(std::move(features));

  } catch (const std::exception &e) {
    return query_response(make_error(e));
  }
}

aggregate_response sqlite_store::aggregate_in_bbox(const box_2d &bbox) {
  try {
    sqlite::statement &s = *m_impl->m_aggregate;
    query_scope scope(m_impl->m_db, s, m_impl->m_options.query_timeout);
    bind_bbox(s, bbox);

    aggregate_stats stats;
    while (s.step()) {
      // every matching row counts, but only readable geometry adds area.
      ++stats.count;

      multi_polygon_2d geom;
      try {
        if (read_geometry(s, 0, geom)) {
          stats.area += util::projected_area(geom);
        }

      } catch (const std::runtime_error &e) {
        LOG_DEBUG(boost::format("Bad geometry ignored in aggregate: %1%") % e.what());
      }
    }

    return aggregate_response(stats);

  } catch (const std::exception &e) {
    return aggregate_response(make_error(e));
  }
}

} } // namespace footprint::store
