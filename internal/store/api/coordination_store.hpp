#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace buildq::store {

using FieldMap = std::map<std::string, std::string>;

struct ScoredMember {
  std::string member;
  double      score = 0;
};

struct StreamEntry {
  uint64_t position = 0;
  FieldMap fields;
};

/*
  Coordination store abstraction.

  Five primitive families, nothing more:
    hashes        field-level get/set, per-key expiry
    ordered sets  atomic pop-min, range-by-score
    lists         push, blocking pop
    streams       append-only, blocking tail read from a cursor
    sets          add/remove/members

  CRITICAL GUARANTEES (all backends):

  - Every method is atomic with respect to every other method.
  - SortedSetPopMin and ListBlockingPopBack hand a given member to at most one
    caller, across threads AND processes sharing the backend.
  - SortedSetRemove reports whether *this* call removed the member.
  - Expired keys are invisible to every primitive.
  - Members with equal scores are ordered by member (lexicographic).

  Infrastructure failures surface as util::StoreUnavailable.
*/
class CoordinationStore {
 public:
  virtual ~CoordinationStore() = default;

  virtual void Ping() = 0;

  // ---------------------------------------------------------------------
  // Keys
  // ---------------------------------------------------------------------

  // Applies to any key regardless of primitive. Returns false if key absent.
  virtual bool Expire(const std::string& key, std::chrono::milliseconds ttl) = 0;

  virtual void Delete(const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Hashes
  // ---------------------------------------------------------------------

  virtual void HashSet(const std::string& key, const FieldMap& fields) = 0;

  // Writes fields only into a hash that already exists. Returns false, and
  // writes nothing, when the key is absent or expired. The key's expiry is
  // left as it was.
  virtual bool HashUpdate(const std::string& key, const FieldMap& fields) = 0;

  virtual std::optional<std::string> HashGet(const std::string& key, const std::string& field) = 0;

  // Empty map when the key does not exist.
  virtual FieldMap HashGetAll(const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Ordered sets
  // ---------------------------------------------------------------------

  // Inserts or re-scores.
  virtual void SortedSetAdd(const std::string& key, const std::string& member, double score) = 0;

  // Atomically removes and returns the lowest-scored member.
  virtual std::optional<ScoredMember> SortedSetPopMin(const std::string& key) = 0;

  // Members with score <= max_score, ascending, at most limit entries.
  virtual std::vector<ScoredMember> SortedSetRangeByScore(const std::string& key, double max_score, std::size_t limit) = 0;

  virtual bool SortedSetRemove(const std::string& key, const std::string& member) = 0;

  virtual uint64_t SortedSetCard(const std::string& key) = 0;

  // 0-based position of member in ascending (score, member) order; nullopt
  // when member is absent.
  virtual std::optional<uint64_t> SortedSetRank(const std::string& key, const std::string& member) = 0;

  // ---------------------------------------------------------------------
  // Lists
  // ---------------------------------------------------------------------

  virtual void ListPushFront(const std::string& key, const std::string& value) = 0;

  // Waits up to timeout for an element; nullopt on timeout.
  virtual std::optional<std::string> ListBlockingPopBack(const std::string& key, std::chrono::milliseconds timeout) = 0;

  virtual uint64_t ListLength(const std::string& key) = 0;

  // ---------------------------------------------------------------------
  // Streams
  // ---------------------------------------------------------------------

  // Positions start at 0 and increase by one per append.
  virtual uint64_t StreamAppend(const std::string& key, const FieldMap& fields) = 0;

  // Entries with position >= from, at most count. When none exist, waits up
  // to max_wait for an append; returns early (empty) once stop is requested.
  virtual std::vector<StreamEntry> StreamRead(const std::string& key, uint64_t from, std::size_t count,
                                              std::chrono::milliseconds max_wait, std::stop_token stop) = 0;

  // ---------------------------------------------------------------------
  // Sets
  // ---------------------------------------------------------------------

  virtual bool SetAdd(const std::string& key, const std::string& member) = 0;

  virtual bool SetRemove(const std::string& key, const std::string& member) = 0;

  virtual std::vector<std::string> SetMembers(const std::string& key) = 0;
};

} // namespace buildq::store
