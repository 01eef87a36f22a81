#include "memory_store.hpp"

#include <algorithm>
#include <iterator>

namespace buildq::store::memory {

MemoryStore::MemoryStore(util::ClockFn clock) : clock_(std::move(clock)) {
}

void MemoryStore::PurgeIfExpired(const std::string& key) {
  const auto it = state_.expires_at.find(key);
  if (it == state_.expires_at.end()) return;
  if (it->second > clock_()) return;
  EraseKey(key);
}

bool MemoryStore::Exists(const std::string& key) const {
  return state_.hashes.contains(key) || state_.sorted_sets.contains(key) || state_.lists.contains(key) || state_.streams.contains(key) ||
         state_.sets.contains(key);
}

void MemoryStore::EraseKey(const std::string& key) {
  state_.hashes.erase(key);
  state_.sorted_sets.erase(key);
  state_.lists.erase(key);
  state_.streams.erase(key);
  state_.sets.erase(key);
  state_.expires_at.erase(key);
}

void MemoryStore::Ping() {
}

bool MemoryStore::Expire(const std::string& key, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  if (!Exists(key)) return false;
  state_.expires_at[key] = clock_() + ttl;
  return true;
}

void MemoryStore::Delete(const std::string& key) {
  std::lock_guard lock(mutex_);
  EraseKey(key);
}

// ------------------------------------------------------------------
// Hashes
// ------------------------------------------------------------------

void MemoryStore::HashSet(const std::string& key, const FieldMap& fields) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  auto& hash = state_.hashes[key];
  for (const auto& [field, value] : fields) {
    hash[field] = value;
  }
}

bool MemoryStore::HashUpdate(const std::string& key, const FieldMap& fields) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.hashes.find(key);
  if (it == state_.hashes.end()) return false;
  for (const auto& [field, value] : fields) {
    it->second[field] = value;
  }
  return true;
}

std::optional<std::string> MemoryStore::HashGet(const std::string& key, const std::string& field) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.hashes.find(key);
  if (it == state_.hashes.end()) return std::nullopt;
  const auto fit = it->second.find(field);
  if (fit == it->second.end()) return std::nullopt;
  return fit->second;
}

FieldMap MemoryStore::HashGetAll(const std::string& key) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.hashes.find(key);
  if (it == state_.hashes.end()) return {};
  return it->second;
}

// ------------------------------------------------------------------
// Ordered sets
// ------------------------------------------------------------------

void MemoryStore::SortedSetAdd(const std::string& key, const std::string& member, double score) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  auto& zset = state_.sorted_sets[key];
  if (auto it = zset.scores.find(member); it != zset.scores.end()) {
    zset.ordered.erase(std::make_pair(it->second, member));
  }
  zset.scores[member] = score;
  zset.ordered.emplace(score, member);
}

std::optional<ScoredMember> MemoryStore::SortedSetPopMin(const std::string& key) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  auto it = state_.sorted_sets.find(key);
  if (it == state_.sorted_sets.end() || it->second.ordered.empty()) return std::nullopt;

  auto&        zset  = it->second;
  const auto   first = zset.ordered.begin();
  ScoredMember popped{first->second, first->first};
  zset.scores.erase(first->second);
  zset.ordered.erase(first);
  if (zset.ordered.empty()) EraseKey(key);
  return popped;
}

std::vector<ScoredMember> MemoryStore::SortedSetRangeByScore(const std::string& key, double max_score, std::size_t limit) {
  std::lock_guard           lock(mutex_);
  std::vector<ScoredMember> out;
  PurgeIfExpired(key);
  const auto it = state_.sorted_sets.find(key);
  if (it == state_.sorted_sets.end()) return out;

  for (const auto& [score, member] : it->second.ordered) {
    if (score > max_score || out.size() >= limit) break;
    out.push_back({member, score});
  }
  return out;
}

bool MemoryStore::SortedSetRemove(const std::string& key, const std::string& member) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  auto it = state_.sorted_sets.find(key);
  if (it == state_.sorted_sets.end()) return false;

  auto& zset = it->second;
  auto  sit  = zset.scores.find(member);
  if (sit == zset.scores.end()) return false;
  zset.ordered.erase(std::make_pair(sit->second, member));
  zset.scores.erase(sit);
  if (zset.ordered.empty()) EraseKey(key);
  return true;
}

uint64_t MemoryStore::SortedSetCard(const std::string& key) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.sorted_sets.find(key);
  return it == state_.sorted_sets.end() ? 0 : it->second.ordered.size();
}

std::optional<uint64_t> MemoryStore::SortedSetRank(const std::string& key, const std::string& member) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.sorted_sets.find(key);
  if (it == state_.sorted_sets.end()) return std::nullopt;

  const auto& zset = it->second;
  const auto  sit  = zset.scores.find(member);
  if (sit == zset.scores.end()) return std::nullopt;
  const auto pos = zset.ordered.find(std::make_pair(sit->second, member));
  return static_cast<uint64_t>(std::distance(zset.ordered.begin(), pos));
}

// ------------------------------------------------------------------
// Lists
// ------------------------------------------------------------------

void MemoryStore::ListPushFront(const std::string& key, const std::string& value) {
  {
    std::lock_guard lock(mutex_);
    PurgeIfExpired(key);
    state_.lists[key].push_front(value);
  }
  cv_.notify_all();
}

std::optional<std::string> MemoryStore::ListBlockingPopBack(const std::string& key, std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);

  const auto ready = [&] {
    PurgeIfExpired(key);
    const auto it = state_.lists.find(key);
    return it != state_.lists.end() && !it->second.empty();
  };
  if (!cv_.wait_for(lock, timeout, ready)) return std::nullopt;

  auto&       list  = state_.lists[key];
  std::string value = std::move(list.back());
  list.pop_back();
  if (list.empty()) EraseKey(key);
  return value;
}

uint64_t MemoryStore::ListLength(const std::string& key) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.lists.find(key);
  return it == state_.lists.end() ? 0 : it->second.size();
}

// ------------------------------------------------------------------
// Streams
// ------------------------------------------------------------------

uint64_t MemoryStore::StreamAppend(const std::string& key, const FieldMap& fields) {
  uint64_t position = 0;
  {
    std::lock_guard lock(mutex_);
    PurgeIfExpired(key);
    auto& stream = state_.streams[key];
    position     = stream.next_position++;
    stream.entries.push_back({position, fields});
  }
  cv_.notify_all();
  return position;
}

std::vector<StreamEntry> MemoryStore::StreamRead(const std::string& key, uint64_t from, std::size_t count, std::chrono::milliseconds max_wait,
                                                 std::stop_token stop) {
  std::unique_lock lock(mutex_);

  const auto available = [&] {
    PurgeIfExpired(key);
    const auto it = state_.streams.find(key);
    return it != state_.streams.end() && it->second.next_position > from;
  };
  if (!cv_.wait_for(lock, stop, max_wait, available)) return {};

  std::vector<StreamEntry> out;
  const auto&              entries = state_.streams[key].entries;
  auto first = std::lower_bound(entries.begin(), entries.end(), from, [](const StreamEntry& e, uint64_t pos) { return e.position < pos; });
  for (; first != entries.end() && out.size() < count; ++first) {
    out.push_back(*first);
  }
  return out;
}

// ------------------------------------------------------------------
// Sets
// ------------------------------------------------------------------

bool MemoryStore::SetAdd(const std::string& key, const std::string& member) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  return state_.sets[key].insert(member).second;
}

bool MemoryStore::SetRemove(const std::string& key, const std::string& member) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  auto it = state_.sets.find(key);
  if (it == state_.sets.end()) return false;
  const bool removed = it->second.erase(member) > 0;
  if (it->second.empty()) EraseKey(key);
  return removed;
}

std::vector<std::string> MemoryStore::SetMembers(const std::string& key) {
  std::lock_guard lock(mutex_);
  PurgeIfExpired(key);
  const auto it = state_.sets.find(key);
  if (it == state_.sets.end()) return {};
  return {it->second.begin(), it->second.end()};
}

} // namespace buildq::store::memory
