#include "sqlite.hpp"
#include "logging/logger.hpp"

#include <boost/format.hpp>

// number of SQLite virtual machine instructions between checks of the
// deadline.
#define PROGRESS_INTERVAL (1000)

namespace footprint { namespace sqlite {

void sqlite_db_deleter::operator()(sqlite3 *ptr) const {
  if (ptr != nullptr) {
    int status = sqlite3_close(ptr);
    if (status != SQLITE_OK) {
      LOG_ERROR(boost::format("Unable to close SQLite3 database: %1%") % sqlite3_errstr(status));
    }
  }
}

void sqlite_statement_finalizer::operator()(sqlite3_stmt *ptr) const {
  if (ptr != nullptr) {
    // finalize returns the error of the most recent evaluation, which
    // has already been reported by step(), so there's nothing new here.
    sqlite3_finalize(ptr);
  }
}

statement::statement(sqlite3 *db, const std::string &sql)
  : ptr(), db_for_errors(db) {
  const char *tail = nullptr;
  sqlite3_stmt *ptr_ = nullptr;
  int status = sqlite3_prepare_v2(db, sql.c_str(), int(sql.size()), &ptr_, &tail);
  if (status != SQLITE_OK) {
    throw std::runtime_error((boost::format("Unable to prepare SQLite3 statement \"%1%\": %2%") % sql % sqlite3_errmsg(db_for_errors)).str());
  }
  ptr.reset(ptr_);
}

int statement::column_type(int i) {
  return sqlite3_column_type(ptr.get(), i);
}

boost::optional<std::string> statement::column_text(int i) {
  if (sqlite3_column_type(ptr.get(), i) == SQLITE_NULL) {
    return boost::none;
  } else {
    const unsigned char *str = sqlite3_column_text(ptr.get(), i);
    int sz = sqlite3_column_bytes(ptr.get(), i);
    return std::string((const char *)str, sz);
  }
}

boost::optional<double> statement::column_double(int i) {
  if (sqlite3_column_type(ptr.get(), i) == SQLITE_NULL) {
    return boost::none;
  } else {
    return sqlite3_column_double(ptr.get(), i);
  }
}

boost::optional<sqlite3_int64> statement::column_int(int i) {
  if (sqlite3_column_type(ptr.get(), i) == SQLITE_NULL) {
    return boost::none;
  } else {
    return sqlite3_column_int64(ptr.get(), i);
  }
}

std::string statement::column_blob(int i) {
  const char *bytes = static_cast<const char *>(sqlite3_column_blob(ptr.get(), i));
  int sz = sqlite3_column_bytes(ptr.get(), i);
  if (bytes == nullptr) {
    return std::string();
  }
  return std::string(bytes, sz);
}

bool statement::step() {
  int status = sqlite3_step(ptr.get());
  if (status == SQLITE_DONE) { return false; }
  if (status == SQLITE_INTERRUPT) {
    throw interrupted("Query interrupted: deadline exceeded.");
  }
  if (status != SQLITE_ROW) {
    throw std::runtime_error((boost::format("Unable to step row in query result: %1%") % sqlite3_errmsg(db_for_errors)).str());
  }
  return true;
}

void statement::reset() {
  // the return value repeats the error from the last step, if any.
  sqlite3_reset(ptr.get());
}

void statement::check_bind(int status) {
  if (status != SQLITE_OK) {
    throw std::runtime_error((boost::format("Argument bind failed: %1%") % sqlite3_errmsg(db_for_errors)).str());
  }
}

void statement::bind_double(int i, double d) {
  check_bind(sqlite3_bind_double(ptr.get(), i, d));
}

void statement::bind_text(int i, const std::string &str) {
  check_bind(sqlite3_bind_text(ptr.get(), i, str.data(), int(str.size()), SQLITE_TRANSIENT));
}

void statement::bind_blob(int i, const std::string &bytes) {
  check_bind(sqlite3_bind_blob(ptr.get(), i, bytes.data(), int(bytes.size()), SQLITE_TRANSIENT));
}

void statement::bind_int(int i, sqlite3_int64 v) {
  check_bind(sqlite3_bind_int64(ptr.get(), i, v));
}

void statement::bind_null(int i) {
  check_bind(sqlite3_bind_null(ptr.get(), i));
}

db::db(const std::string &loc, open_mode mode) {
  int flags = SQLITE_OPEN_NOMUTEX;
  if (mode == read_only) {
    flags |= SQLITE_OPEN_READONLY;
  } else {
    flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
  }

  sqlite3 *ptr_ = nullptr;
  int status = sqlite3_open_v2(loc.c_str(), &ptr_, flags, nullptr);
  // the handle is allocated even on failure, and must be closed.
  ptr.reset(ptr_);
  if (status != SQLITE_OK) {
    throw std::runtime_error((boost::format("Unable to open SQLite3 database \"%1%\": %2%") % loc % (ptr_ ? sqlite3_errmsg(ptr_) : sqlite3_errstr(status))).str());
  }

  sqlite3_progress_handler(ptr.get(), PROGRESS_INTERVAL, &db::progress_callback, this);
}

statement db::prepare(const std::string &sql) {
  return statement(ptr.get(), sql);
}

void db::exec(const std::string &sql) {
  char *errmsg = nullptr;
  int status = sqlite3_exec(ptr.get(), sql.c_str(), nullptr, nullptr, &errmsg);
  if (status != SQLITE_OK) {
    std::string msg = (errmsg != nullptr) ? errmsg : sqlite3_errstr(status);
    sqlite3_free(errmsg);
    throw std::runtime_error((boost::format("Unable to execute \"%1%\": %2%") % sql % msg).str());
  }
}

bool db::table_exists(const std::string &name) {
  statement s(prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?"));
  s.bind_text(1, name);
  return s.step();
}

void db::set_deadline(std::chrono::steady_clock::time_point deadline) {
  m_deadline = deadline;
}

void db::clear_deadline() {
  m_deadline = boost::none;
}

int db::progress_callback(void *self) {
  const db *d = static_cast<const db *>(self);
  if (d->m_deadline && (std::chrono::steady_clock::now() > *d->m_deadline)) {
    // non-zero interrupts the running statement
    return 1;
  }
  return 0;
}

} } // namespace footprint::sqlite
