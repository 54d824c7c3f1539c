#ifndef FOOTPRINT_STORE_SQLITE_STORE_HPP
#define FOOTPRINT_STORE_SQLITE_STORE_HPP

#include "spatial_store.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <boost/noncopyable.hpp>

namespace footprint { namespace store {

struct sqlite_store_options {
  sqlite_store_options();

  // name of the feature table. the R*Tree index over it must be
  // called "<table>_rtree", with columns (fid, xmin, xmax, ymin, ymax)
  // where fid is the rowid of the feature.
  std::string table;

  // queries running longer than this are interrupted. zero means no
  // limit.
  std::chrono::milliseconds query_timeout;
};

/* Spatial store backed by an indexed SQLite3 database.
 *
 * Each object holds its own read-only connection and prepared
 * statements, so it's cheap to query repeatedly but must stay with
 * the thread which uses it.
 */
class sqlite_store : public spatial_store, private boost::noncopyable {
public:
  // opens the database read-only. throws std::runtime_error if it can't
  // be opened, or if the feature table or its index is missing.
  sqlite_store(const std::string &path, const sqlite_store_options &options);
  virtual ~sqlite_store();

  virtual query_response query_in_bbox(const box_2d &bbox);
  virtual aggregate_response aggregate_in_bbox(const box_2d &bbox);

private:
  struct impl;
  std::unique_ptr<impl> m_impl;
};

// true if `name` is safe to splice into SQL as a table name.
bool valid_table_name(const std::string &name);

} } // namespace footprint::store

#endif /* FOOTPRINT_STORE_SQLITE_STORE_HPP */
