#pragma once

#include <memory>

#include "internal/store/api/coordination_store.hpp"
#include "internal/util/time.hpp"
#include "sqlite_db.hpp"

namespace buildq::store::sqlite {

class SqliteTransaction;

/*
  File-backed coordination store.

  Every primitive runs inside its own BEGIN IMMEDIATE transaction, so pops and
  read-modify-write sequences stay exclusive across processes opening the
  same database file. Blocking primitives poll at poll_interval with the
  connection released between attempts.

  Expiry is lazy: a key past its deadline is dropped by the first primitive
  that touches it.
*/
class SqliteStore final : public CoordinationStore {
 public:
  SqliteStore(std::shared_ptr<SqliteDB> db, std::chrono::milliseconds poll_interval, util::ClockFn clock = util::Now);

  // Creates tables and indexes when missing.
  static void BootstrapSchema(SqliteDB& db);

  void Ping() override;

  bool Expire(const std::string& key, std::chrono::milliseconds ttl) override;
  void Delete(const std::string& key) override;

  void                       HashSet(const std::string& key, const FieldMap& fields) override;
  bool                       HashUpdate(const std::string& key, const FieldMap& fields) override;
  std::optional<std::string> HashGet(const std::string& key, const std::string& field) override;
  FieldMap                   HashGetAll(const std::string& key) override;

  void                        SortedSetAdd(const std::string& key, const std::string& member, double score) override;
  std::optional<ScoredMember> SortedSetPopMin(const std::string& key) override;
  std::vector<ScoredMember>   SortedSetRangeByScore(const std::string& key, double max_score, std::size_t limit) override;
  bool                        SortedSetRemove(const std::string& key, const std::string& member) override;
  uint64_t                    SortedSetCard(const std::string& key) override;
  std::optional<uint64_t>     SortedSetRank(const std::string& key, const std::string& member) override;

  void                       ListPushFront(const std::string& key, const std::string& value) override;
  std::optional<std::string> ListBlockingPopBack(const std::string& key, std::chrono::milliseconds timeout) override;
  uint64_t                   ListLength(const std::string& key) override;

  uint64_t                 StreamAppend(const std::string& key, const FieldMap& fields) override;
  std::vector<StreamEntry> StreamRead(const std::string& key, uint64_t from, std::size_t count, std::chrono::milliseconds max_wait,
                                      std::stop_token stop) override;

  bool                     SetAdd(const std::string& key, const std::string& member) override;
  bool                     SetRemove(const std::string& key, const std::string& member) override;
  std::vector<std::string> SetMembers(const std::string& key) override;

 private:
  // Caller holds an open transaction.
  void PurgeIfExpired(SqliteTransaction& tx, const std::string& key);
  bool Exists(SqliteTransaction& tx, const std::string& key);
  void EraseKey(SqliteTransaction& tx, const std::string& key);
  void DropExpiryIfEmpty(SqliteTransaction& tx, const std::string& key);

  std::optional<std::string> TryPopBack(const std::string& key);
  std::vector<StreamEntry>   TryReadStream(const std::string& key, uint64_t from, std::size_t count);

  std::shared_ptr<SqliteDB> db_;
  std::chrono::milliseconds poll_interval_;
  util::ClockFn             clock_;
};

} // namespace buildq::store::sqlite
