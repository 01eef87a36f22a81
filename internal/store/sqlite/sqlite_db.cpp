#include "sqlite_db.hpp"

#include "internal/util/errors.hpp"

namespace buildq::store::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreUnavailable(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreUnavailable("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreUnavailable(msg);
  }
}

void SqliteDB::Configure() {
  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // other processes sharing the file hold the write lock for one primitive at most
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

// ------------------------------------------------------------------
// Statement
// ------------------------------------------------------------------

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  ThrowIf(sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr), db_, "sqlite prepare");
}

Statement::~Statement() {
  sqlite3_finalize(stmt_);
}

Statement& Statement::BindText(int idx, const std::string& value) {
  ThrowIf(sqlite3_bind_text(stmt_, idx, value.c_str(), -1, SQLITE_TRANSIENT), db_, "sqlite bind");
  return *this;
}

Statement& Statement::BindInt64(int idx, int64_t value) {
  ThrowIf(sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(value)), db_, "sqlite bind");
  return *this;
}

Statement& Statement::BindDouble(int idx, double value) {
  ThrowIf(sqlite3_bind_double(stmt_, idx, value), db_, "sqlite bind");
  return *this;
}

bool Statement::Step() {
  const int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw util::StoreUnavailable(std::string("sqlite step: ") + sqlite3_errmsg(db_));
}

int Statement::Exec() {
  while (Step()) {
  }
  return sqlite3_changes(db_);
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t Statement::ColInt64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

double Statement::ColDouble(int col) const {
  return sqlite3_column_double(stmt_, col);
}

bool Statement::ColIsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

} // namespace buildq::store::sqlite
