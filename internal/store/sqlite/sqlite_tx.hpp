#pragma once

#include "sqlite_db.hpp"

namespace buildq::store::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - makes read-then-delete sequences (pop-min, pop-back) atomic across processes

  Destructor rolls back if Commit() was never reached. A connection found
  still inside a transaction (that rollback failed) is rolled back before
  the next BEGIN.
*/
class SqliteTransaction final {
public:
  explicit SqliteTransaction(SqliteDB& db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  sqlite3* Handle() const { return db_.Handle(); }

  void Commit();
  void Rollback();
  bool IsCommitted() const { return committed_; }

private:
  SqliteDB& db_;
  bool      committed_ = false;
  bool      finished_  = false;
};

}
