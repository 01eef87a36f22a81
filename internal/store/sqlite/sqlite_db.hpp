#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace buildq::store::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection per process; Lock() serializes use of it between threads.
  Cross-process exclusion comes from sqlite's own file locking.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

/*
  Prepared statement, finalized on destruction.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& BindText(int idx, const std::string& value);
  Statement& BindInt64(int idx, int64_t value);
  Statement& BindDouble(int idx, double value);

  // true when a row is available, false when done.
  bool Step();

  // Step() to completion; returns sqlite3_changes().
  int Exec();

  std::string ColText(int col) const;
  int64_t     ColInt64(int col) const;
  double      ColDouble(int col) const;
  bool        ColIsNull(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace buildq::store::sqlite
