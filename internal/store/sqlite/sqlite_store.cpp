#include "sqlite_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "internal/util/errors.hpp"
#include "sqlite_tx.hpp"

namespace buildq::store::sqlite {

namespace {

constexpr const char* kSchema = R"SQL(
CREATE TABLE IF NOT EXISTS store_expiry (
  key           TEXT PRIMARY KEY,
  expires_at_ms INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS store_hash (
  key   TEXT NOT NULL,
  field TEXT NOT NULL,
  value TEXT NOT NULL,
  PRIMARY KEY (key, field)
);

CREATE TABLE IF NOT EXISTS store_zset (
  key    TEXT NOT NULL,
  member TEXT NOT NULL,
  score  REAL NOT NULL,
  PRIMARY KEY (key, member)
);
CREATE INDEX IF NOT EXISTS store_zset_by_score ON store_zset(key, score, member);

CREATE TABLE IF NOT EXISTS store_list (
  key   TEXT NOT NULL,
  seq   INTEGER NOT NULL,
  value TEXT NOT NULL,
  PRIMARY KEY (key, seq)
);

CREATE TABLE IF NOT EXISTS store_stream (
  key      TEXT NOT NULL,
  position INTEGER NOT NULL,
  fields   TEXT NOT NULL,
  PRIMARY KEY (key, position)
);

CREATE TABLE IF NOT EXISTS store_set (
  key    TEXT NOT NULL,
  member TEXT NOT NULL,
  PRIMARY KEY (key, member)
);
)SQL";

std::string SerializeFields(const FieldMap& fields) {
  google::protobuf::Struct as_struct;
  for (const auto& [key, value] : fields) {
    (*as_struct.mutable_fields())[key].set_string_value(value);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(as_struct, &json);
  if (!status.ok()) {
    throw util::SerializationError("stream entry encode: " + std::string(status.message()));
  }
  return json;
}

FieldMap DeserializeFields(const std::string& raw) {
  google::protobuf::Struct as_struct;
  auto                     status = google::protobuf::util::JsonStringToMessage(raw, &as_struct);
  if (!status.ok()) {
    throw util::SerializationError("stream entry decode: " + std::string(status.message()));
  }

  FieldMap fields;
  for (const auto& [key, value] : as_struct.fields()) {
    if (value.kind_case() == google::protobuf::Value::kStringValue) {
      fields[key] = value.string_value();
    }
  }
  return fields;
}

// false once stop is requested
bool SleepUnlessStopped(std::chrono::milliseconds duration, std::stop_token stop) {
  std::mutex                  m;
  std::condition_variable_any cv;
  std::unique_lock            lock(m);
  cv.wait_for(lock, stop, duration, [] { return false; });
  return !stop.stop_requested();
}

} // namespace

SqliteStore::SqliteStore(std::shared_ptr<SqliteDB> db, std::chrono::milliseconds poll_interval, util::ClockFn clock)
    : db_(std::move(db)), poll_interval_(poll_interval), clock_(std::move(clock)) {
  if (!db_) {
    throw std::invalid_argument("SqliteStore: db is null");
  }
  if (poll_interval_.count() <= 0) {
    poll_interval_ = std::chrono::milliseconds(50);
  }
  BootstrapSchema(*db_);
}

void SqliteStore::BootstrapSchema(SqliteDB& db) {
  auto lock = db.Lock();
  db.Exec(kSchema);
}

// ------------------------------------------------------------------
// Key helpers
// ------------------------------------------------------------------

void SqliteStore::PurgeIfExpired(SqliteTransaction& tx, const std::string& key) {
  Statement stmt(tx.Handle(), "SELECT expires_at_ms FROM store_expiry WHERE key = ?;");
  stmt.BindText(1, key);
  if (!stmt.Step()) return;
  if (static_cast<uint64_t>(stmt.ColInt64(0)) > util::ToUnixMillis(clock_())) return;
  EraseKey(tx, key);
}

bool SqliteStore::Exists(SqliteTransaction& tx, const std::string& key) {
  Statement stmt(tx.Handle(),
                 "SELECT 1 FROM store_hash WHERE key = ?1 "
                 "UNION ALL SELECT 1 FROM store_zset WHERE key = ?1 "
                 "UNION ALL SELECT 1 FROM store_list WHERE key = ?1 "
                 "UNION ALL SELECT 1 FROM store_stream WHERE key = ?1 "
                 "UNION ALL SELECT 1 FROM store_set WHERE key = ?1 "
                 "LIMIT 1;");
  stmt.BindText(1, key);
  return stmt.Step();
}

void SqliteStore::EraseKey(SqliteTransaction& tx, const std::string& key) {
  for (const char* sql : {"DELETE FROM store_hash WHERE key = ?;", "DELETE FROM store_zset WHERE key = ?;", "DELETE FROM store_list WHERE key = ?;",
                          "DELETE FROM store_stream WHERE key = ?;", "DELETE FROM store_set WHERE key = ?;",
                          "DELETE FROM store_expiry WHERE key = ?;"}) {
    Statement stmt(tx.Handle(), sql);
    stmt.BindText(1, key);
    stmt.Exec();
  }
}

void SqliteStore::DropExpiryIfEmpty(SqliteTransaction& tx, const std::string& key) {
  if (Exists(tx, key)) return;
  Statement stmt(tx.Handle(), "DELETE FROM store_expiry WHERE key = ?;");
  stmt.BindText(1, key);
  stmt.Exec();
}

void SqliteStore::Ping() {
  auto      lock = db_->Lock();
  Statement stmt(db_->Handle(), "SELECT 1;");
  if (!stmt.Step()) {
    throw util::StoreUnavailable("sqlite ping returned no row");
  }
}

bool SqliteStore::Expire(const std::string& key, std::chrono::milliseconds ttl) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);
  if (!Exists(tx, key)) {
    tx.Commit();
    return false;
  }

  Statement stmt(tx.Handle(),
                 "INSERT INTO store_expiry(key, expires_at_ms) VALUES(?, ?) "
                 "ON CONFLICT(key) DO UPDATE SET expires_at_ms = excluded.expires_at_ms;");
  stmt.BindText(1, key).BindInt64(2, static_cast<int64_t>(util::ToUnixMillis(clock_() + ttl)));
  stmt.Exec();
  tx.Commit();
  return true;
}

void SqliteStore::Delete(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  EraseKey(tx, key);
  tx.Commit();
}

// ------------------------------------------------------------------
// Hashes
// ------------------------------------------------------------------

void SqliteStore::HashSet(const std::string& key, const FieldMap& fields) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);
  for (const auto& [field, value] : fields) {
    Statement stmt(tx.Handle(),
                   "INSERT INTO store_hash(key, field, value) VALUES(?, ?, ?) "
                   "ON CONFLICT(key, field) DO UPDATE SET value = excluded.value;");
    stmt.BindText(1, key).BindText(2, field).BindText(3, value);
    stmt.Exec();
  }
  tx.Commit();
}

bool SqliteStore::HashUpdate(const std::string& key, const FieldMap& fields) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  bool present = false;
  {
    Statement stmt(tx.Handle(), "SELECT 1 FROM store_hash WHERE key = ? LIMIT 1;");
    stmt.BindText(1, key);
    present = stmt.Step();
  }
  if (!present) {
    tx.Commit();
    return false;
  }

  for (const auto& [field, value] : fields) {
    Statement stmt(tx.Handle(),
                   "INSERT INTO store_hash(key, field, value) VALUES(?, ?, ?) "
                   "ON CONFLICT(key, field) DO UPDATE SET value = excluded.value;");
    stmt.BindText(1, key).BindText(2, field).BindText(3, value);
    stmt.Exec();
  }
  tx.Commit();
  return true;
}

std::optional<std::string> SqliteStore::HashGet(const std::string& key, const std::string& field) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::optional<std::string> out;
  {
    Statement stmt(tx.Handle(), "SELECT value FROM store_hash WHERE key = ? AND field = ?;");
    stmt.BindText(1, key).BindText(2, field);
    if (stmt.Step()) out = stmt.ColText(0);
  }
  tx.Commit();
  return out;
}

FieldMap SqliteStore::HashGetAll(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  FieldMap out;
  {
    Statement stmt(tx.Handle(), "SELECT field, value FROM store_hash WHERE key = ?;");
    stmt.BindText(1, key);
    while (stmt.Step()) {
      out[stmt.ColText(0)] = stmt.ColText(1);
    }
  }
  tx.Commit();
  return out;
}

// ------------------------------------------------------------------
// Ordered sets
// ------------------------------------------------------------------

void SqliteStore::SortedSetAdd(const std::string& key, const std::string& member, double score) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);
  {
    Statement stmt(tx.Handle(),
                   "INSERT INTO store_zset(key, member, score) VALUES(?, ?, ?) "
                   "ON CONFLICT(key, member) DO UPDATE SET score = excluded.score;");
    stmt.BindText(1, key).BindText(2, member).BindDouble(3, score);
    stmt.Exec();
  }
  tx.Commit();
}

std::optional<ScoredMember> SqliteStore::SortedSetPopMin(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::optional<ScoredMember> popped;
  {
    Statement stmt(tx.Handle(), "SELECT member, score FROM store_zset WHERE key = ? ORDER BY score ASC, member ASC LIMIT 1;");
    stmt.BindText(1, key);
    if (stmt.Step()) popped = ScoredMember{stmt.ColText(0), stmt.ColDouble(1)};
  }

  if (popped) {
    Statement del(tx.Handle(), "DELETE FROM store_zset WHERE key = ? AND member = ?;");
    del.BindText(1, key).BindText(2, popped->member);
    del.Exec();
    DropExpiryIfEmpty(tx, key);
  }
  tx.Commit();
  return popped;
}

std::vector<ScoredMember> SqliteStore::SortedSetRangeByScore(const std::string& key, double max_score, std::size_t limit) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::vector<ScoredMember> out;
  {
    Statement stmt(tx.Handle(), "SELECT member, score FROM store_zset WHERE key = ? AND score <= ? ORDER BY score ASC, member ASC LIMIT ?;");
    stmt.BindText(1, key).BindDouble(2, max_score).BindInt64(3, static_cast<int64_t>(std::min<std::size_t>(limit, INT64_MAX)));
    while (stmt.Step()) {
      out.push_back({stmt.ColText(0), stmt.ColDouble(1)});
    }
  }
  tx.Commit();
  return out;
}

bool SqliteStore::SortedSetRemove(const std::string& key, const std::string& member) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  bool removed = false;
  {
    Statement stmt(tx.Handle(), "DELETE FROM store_zset WHERE key = ? AND member = ?;");
    stmt.BindText(1, key).BindText(2, member);
    removed = stmt.Exec() > 0;
  }
  if (removed) DropExpiryIfEmpty(tx, key);
  tx.Commit();
  return removed;
}

uint64_t SqliteStore::SortedSetCard(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  uint64_t count = 0;
  {
    Statement stmt(tx.Handle(), "SELECT COUNT(*) FROM store_zset WHERE key = ?;");
    stmt.BindText(1, key);
    if (stmt.Step()) count = static_cast<uint64_t>(stmt.ColInt64(0));
  }
  tx.Commit();
  return count;
}

std::optional<uint64_t> SqliteStore::SortedSetRank(const std::string& key, const std::string& member) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::optional<double> score;
  {
    Statement stmt(tx.Handle(), "SELECT score FROM store_zset WHERE key = ? AND member = ?;");
    stmt.BindText(1, key).BindText(2, member);
    if (stmt.Step()) score = stmt.ColDouble(0);
  }

  std::optional<uint64_t> rank;
  if (score) {
    Statement stmt(tx.Handle(), "SELECT COUNT(*) FROM store_zset WHERE key = ? AND (score < ? OR (score = ? AND member < ?));");
    stmt.BindText(1, key).BindDouble(2, *score).BindDouble(3, *score).BindText(4, member);
    if (stmt.Step()) rank = static_cast<uint64_t>(stmt.ColInt64(0));
  }
  tx.Commit();
  return rank;
}

// ------------------------------------------------------------------
// Lists
//
// seq decreases towards the front; the back is MAX(seq).
// ------------------------------------------------------------------

void SqliteStore::ListPushFront(const std::string& key, const std::string& value) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);
  {
    Statement stmt(tx.Handle(),
                   "INSERT INTO store_list(key, seq, value) "
                   "SELECT ?1, COALESCE(MIN(seq), 0) - 1, ?2 FROM store_list WHERE key = ?1;");
    stmt.BindText(1, key).BindText(2, value);
    stmt.Exec();
  }
  tx.Commit();
}

std::optional<std::string> SqliteStore::TryPopBack(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::optional<std::string> value;
  int64_t                    seq = 0;
  {
    Statement stmt(tx.Handle(), "SELECT seq, value FROM store_list WHERE key = ? ORDER BY seq DESC LIMIT 1;");
    stmt.BindText(1, key);
    if (stmt.Step()) {
      seq   = stmt.ColInt64(0);
      value = stmt.ColText(1);
    }
  }

  if (value) {
    Statement del(tx.Handle(), "DELETE FROM store_list WHERE key = ? AND seq = ?;");
    del.BindText(1, key).BindInt64(2, seq);
    del.Exec();
    DropExpiryIfEmpty(tx, key);
  }
  tx.Commit();
  return value;
}

std::optional<std::string> SqliteStore::ListBlockingPopBack(const std::string& key, std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (;;) {
    if (auto value = TryPopBack(key)) return value;

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) return std::nullopt;
    std::this_thread::sleep_for(std::min(remaining, poll_interval_));
  }
}

uint64_t SqliteStore::ListLength(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  uint64_t count = 0;
  {
    Statement stmt(tx.Handle(), "SELECT COUNT(*) FROM store_list WHERE key = ?;");
    stmt.BindText(1, key);
    if (stmt.Step()) count = static_cast<uint64_t>(stmt.ColInt64(0));
  }
  tx.Commit();
  return count;
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

uint64_t SqliteStore::StreamAppend(const std::string& key, const FieldMap& fields) {
  const std::string encoded = SerializeFields(fields);

  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  uint64_t position = 0;
  {
    Statement next(tx.Handle(), "SELECT COALESCE(MAX(position) + 1, 0) FROM store_stream WHERE key = ?;");
    next.BindText(1, key);
    if (next.Step()) position = static_cast<uint64_t>(next.ColInt64(0));
  }
  {
    Statement stmt(tx.Handle(), "INSERT INTO store_stream(key, position, fields) VALUES(?, ?, ?);");
    stmt.BindText(1, key).BindInt64(2, static_cast<int64_t>(position)).BindText(3, encoded);
    stmt.Exec();
  }
  tx.Commit();
  return position;
}

std::vector<StreamEntry> SqliteStore::TryReadStream(const std::string& key, uint64_t from, std::size_t count) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::vector<StreamEntry> out;
  {
    Statement stmt(tx.Handle(), "SELECT position, fields FROM store_stream WHERE key = ? AND position >= ? ORDER BY position ASC LIMIT ?;");
    stmt.BindText(1, key).BindInt64(2, static_cast<int64_t>(from)).BindInt64(3, static_cast<int64_t>(std::min<std::size_t>(count, INT64_MAX)));
    while (stmt.Step()) {
      out.push_back({static_cast<uint64_t>(stmt.ColInt64(0)), DeserializeFields(stmt.ColText(1))});
    }
  }
  tx.Commit();
  return out;
}

std::vector<StreamEntry> SqliteStore::StreamRead(const std::string& key, uint64_t from, std::size_t count, std::chrono::milliseconds max_wait,
                                                 std::stop_token stop) {
  const auto deadline = std::chrono::steady_clock::now() + max_wait;
  for (;;) {
    if (stop.stop_requested()) return {};

    auto entries = TryReadStream(key, from, count);
    if (!entries.empty()) return entries;

    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) return {};
    if (!SleepUnlessStopped(std::min(remaining, poll_interval_), stop)) return {};
  }
}

// ------------------------------------------------------------------
// Sets
// ------------------------------------------------------------------

bool SqliteStore::SetAdd(const std::string& key, const std::string& member) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  bool added = false;
  {
    Statement stmt(tx.Handle(), "INSERT OR IGNORE INTO store_set(key, member) VALUES(?, ?);");
    stmt.BindText(1, key).BindText(2, member);
    added = stmt.Exec() > 0;
  }
  tx.Commit();
  return added;
}

bool SqliteStore::SetRemove(const std::string& key, const std::string& member) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  bool removed = false;
  {
    Statement stmt(tx.Handle(), "DELETE FROM store_set WHERE key = ? AND member = ?;");
    stmt.BindText(1, key).BindText(2, member);
    removed = stmt.Exec() > 0;
  }
  if (removed) DropExpiryIfEmpty(tx, key);
  tx.Commit();
  return removed;
}

std::vector<std::string> SqliteStore::SetMembers(const std::string& key) {
  auto              lock = db_->Lock();
  SqliteTransaction tx(*db_);
  PurgeIfExpired(tx, key);

  std::vector<std::string> out;
  {
    Statement stmt(tx.Handle(), "SELECT member FROM store_set WHERE key = ? ORDER BY member ASC;");
    stmt.BindText(1, key);
    while (stmt.Step()) {
      out.push_back(stmt.ColText(0));
    }
  }
  tx.Commit();
  return out;
}

} // namespace buildq::store::sqlite
