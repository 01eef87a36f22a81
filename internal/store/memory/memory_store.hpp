#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/store/api/coordination_store.hpp"
#include "internal/util/time.hpp"

namespace buildq::store::memory {

/*
  In-process coordination store.

  Single mutex over the whole keyspace; blocking primitives park on one
  condition variable that every append/push notifies. Expiry is evaluated
  lazily against the injected clock on every access, so tests can move time
  forward without sleeping.
*/
class MemoryStore final : public CoordinationStore {
 public:
  explicit MemoryStore(util::ClockFn clock = util::Now);

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
  struct SortedSet {
    std::set<std::pair<double, std::string>>  ordered;
    std::unordered_map<std::string, double> scores;
  };

  struct Stream {
    std::vector<StreamEntry> entries;
    uint64_t                 next_position = 0;
  };

  struct State {
    std::unordered_map<std::string, FieldMap>                hashes;
    std::unordered_map<std::string, SortedSet>               sorted_sets;
    std::unordered_map<std::string, std::deque<std::string>> lists;
    std::unordered_map<std::string, Stream>                  streams;
    std::unordered_map<std::string, std::set<std::string>>   sets;
    std::unordered_map<std::string, util::TimePoint>         expires_at;
  };

  // Caller holds mutex_.
  void PurgeIfExpired(const std::string& key);
  bool Exists(const std::string& key) const;
  void EraseKey(const std::string& key);

  util::ClockFn               clock_;
  std::mutex                  mutex_;
  std::condition_variable_any cv_;
  State                       state_;
};

} // namespace buildq::store::memory
