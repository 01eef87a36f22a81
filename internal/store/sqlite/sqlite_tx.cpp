#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace buildq::store::sqlite {

SqliteTransaction::SqliteTransaction(SqliteDB& db) : db_(db) {
  // a rollback that failed in an earlier destructor leaves the connection
  // inside that transaction, and BEGIN would fail on it forever
  if (sqlite3_get_autocommit(db_.Handle()) == 0) {
    BUILDQ_LOG_WARN("sqlite connection still inside a transaction, rolling it back");
    db_.Exec("ROLLBACK;");
  }
  db_.Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;

  // destructors must not throw; a transaction left open here is rolled back
  // by the next SqliteTransaction on this connection
  char* err = nullptr;
  if (sqlite3_exec(db_.Handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
    const bool still_open = sqlite3_get_autocommit(db_.Handle()) == 0;
    BUILDQ_LOG_ERROR("sqlite rollback failed",
                     {observability::StringField("error", err ? err : "unknown"), observability::StringField("transaction_open", still_open ? "true" : "false")});
  }
  sqlite3_free(err);
}

void SqliteTransaction::Commit() {
  db_.Exec("COMMIT;");
  committed_ = true;
  finished_  = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  db_.Exec("ROLLBACK;");
}

} // namespace buildq::store::sqlite
