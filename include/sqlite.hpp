#ifndef FOOTPRINT_SQLITE_HPP
#define FOOTPRINT_SQLITE_HPP

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <boost/noncopyable.hpp>
#include <boost/optional.hpp>

#include <sqlite3.h>

namespace footprint { namespace sqlite {

/* Thrown when a statement was stopped because the deadline set on its
 * database passed before it completed. */
struct interrupted : public std::runtime_error {
  explicit interrupted(const std::string &msg) : std::runtime_error(msg) {}
};

struct sqlite_db_deleter {
  void operator()(sqlite3 *ptr) const;
};

struct sqlite_statement_finalizer {
  void operator()(sqlite3_stmt *ptr) const;
};

struct db;

/* A prepared statement. Statements can be re-run by calling `reset`
 * and binding new arguments. */
struct statement {
  // the type of a column, one of the SQLITE_* fundamental types.
  int column_type(int i);

  boost::optional<std::string> column_text(int i);
  boost::optional<double> column_double(int i);
  boost::optional<sqlite3_int64> column_int(int i);
  std::string column_blob(int i);

  // step to the next row. returns false when there are no more rows
  // and throws `interrupted` if the database deadline passed.
  bool step();

  // reset the statement so that it can be run again. bindings are
  // kept unless they're overwritten.
  void reset();

  void bind_double(int i, double d);
  void bind_text(int i, const std::string &str);
  void bind_blob(int i, const std::string &bytes);
  void bind_int(int i, sqlite3_int64 v);
  void bind_null(int i);

private:
  friend struct db;
  statement(sqlite3 *db, const std::string &sql);

  void check_bind(int status);

  std::unique_ptr<sqlite3_stmt, sqlite_statement_finalizer> ptr;
  sqlite3 *db_for_errors; // use for ERRORS only.
};

/* An open connection to an SQLite3 database.
 *
 * A connection must only be used from one thread at a time. For
 * read-only connections that's all the locking there is, as they're
 * opened without SQLite's internal mutex.
 */
struct db : private boost::noncopyable {
  enum open_mode { read_only, read_write_create };

  db(const std::string &loc, open_mode mode);

  statement prepare(const std::string &sql);

  // run SQL which returns no rows, e.g: DDL.
  void exec(const std::string &sql);

  bool table_exists(const std::string &name);

  // statements running after this point in time are interrupted.
  void set_deadline(std::chrono::steady_clock::time_point deadline);
  void clear_deadline();

private:
  static int progress_callback(void *self);

  std::unique_ptr<sqlite3, sqlite_db_deleter> ptr;
  boost::optional<std::chrono::steady_clock::time_point> m_deadline;
};

} } // namespace footprint::sqlite

#endif /* FOOTPRINT_SQLITE_HPP */
