#include "internal/queue/callback_retry.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/forwarding_store.hpp"

namespace {

using buildq::queue::CallbackRetry;
using buildq::queue::Keys;
using buildq::queue::QueueOptions;
using buildq::queue::RetryDraft;
using buildq::store::memory::MemoryStore;
using namespace std::chrono_literals;

// Throws StoreUnavailable from the Nth HashGet (1-based) and every one after it.
class HashGetOutage final : public buildq::test::ForwardingStore {
 public:
  HashGetOutage(std::shared_ptr<MemoryStore> inner, int fail_from) : ForwardingStore(std::move(inner)), fail_from_(fail_from) {
  }

  std::optional<std::string> HashGet(const std::string& key, const std::string& field) override {
    if (++calls_ >= fail_from_) throw buildq::util::StoreUnavailable("injected: connection reset");
    return ForwardingStore::HashGet(key, field);
  }

 private:
  int fail_from_;
  int calls_ = 0;
};

struct Fixture {
  std::shared_ptr<buildq::util::TimePoint> now = std::make_shared<buildq::util::TimePoint>(buildq::util::FromUnixMillis(1'700'000'000'000));
  QueueOptions                             options;
  std::shared_ptr<MemoryStore>             store;
  std::unique_ptr<CallbackRetry>           retry;

  Fixture() {
    auto shared   = now;
    options.clock = [shared] { return *shared; };
    store         = std::make_shared<MemoryStore>(options.clock);
    retry         = std::make_unique<CallbackRetry>(store, options);
  }

  RetryDraft Draft(std::chrono::milliseconds due_in, const std::string& job_id = "job-1") const {
    RetryDraft draft;
    draft.job_id       = job_id;
    draft.callback_url = "https://control-plane.example.com/hooks/build";
    draft.result.set_job_id(job_id);
    draft.result.set_success(false);
    draft.result.set_error_message("npm ci exited 1");
    draft.last_error    = "connect: connection refused";
    draft.next_retry_at = *now + due_in;
    return draft;
  }
};

void TestAttemptBecomesClaimableWhenDue() {
  Fixture f;

  const auto id = f.retry->ScheduleRetry(f.Draft(30s));
  assert(!id.empty());
  assert(f.retry->PendingCount() == 1);

  assert(f.retry->ClaimReady(10).empty());
  assert(f.retry->PendingCount() == 1);

  *f.now += 30s;
  const auto due = f.retry->ClaimReady(10);
  assert(due.size() == 1);
  assert(due[0].id() == id);
  assert(due[0].job_id() == "job-1");
  assert(due[0].attempts() == 1);
  assert(due[0].last_error() == "connect: connection refused");
  assert(due[0].result().error_message() == "npm ci exited 1");
  assert(buildq::util::FromProto(due[0].next_retry_at()) == *f.now);

  assert(f.retry->ClaimReady(10).empty());
  assert(f.retry->PendingCount() == 0);
}

void TestClaimReadyReturnsEarliestFirstUpToLimit() {
  Fixture f;

  const auto late  = f.retry->ScheduleRetry(f.Draft(20s, "job-late"));
  const auto early = f.retry->ScheduleRetry(f.Draft(10s, "job-early"));
  f.retry->ScheduleRetry(f.Draft(1h, "job-future"));

  *f.now += 1min;
  auto first = f.retry->ClaimReady(1);
  assert(first.size() == 1);
  assert(first[0].id() == early);

  auto second = f.retry->ClaimReady(5);
  assert(second.size() == 1);
  assert(second[0].id() == late);

  assert(f.retry->ClaimReady(0).empty());
  assert(f.retry->PendingCount() == 1);
}

void TestConcurrentClaimersNeverShareAnAttempt() {
  Fixture f;

  constexpr int kAttempts = 120;
  for (int i = 0; i < kAttempts; ++i) {
    f.retry->ScheduleRetry(f.Draft(std::chrono::milliseconds(i), "job-" + std::to_string(i)));
  }
  *f.now += 1s;

  std::mutex            mutex;
  std::set<std::string> claimed;
  std::atomic<int>      duplicates{0};

  std::vector<std::thread> dispatchers;
  for (int d = 0; d < 6; ++d) {
    dispatchers.emplace_back([&] {
      for (;;) {
        const auto batch = f.retry->ClaimReady(7);
        if (batch.empty() && f.retry->PendingCount() == 0) return;

        std::lock_guard lock(mutex);
        for (const auto& attempt : batch) {
          if (!claimed.insert(attempt.id()).second) ++duplicates;
        }
      }
    });
  }
  for (auto& t : dispatchers) t.join();

  assert(duplicates == 0);
  assert(claimed.size() == kAttempts);
}

void TestRescheduleMustMoveForward() {
  Fixture f;

  f.retry->ScheduleRetry(f.Draft(10s));
  *f.now += 10s;
  auto attempt = f.retry->ClaimReady(1).at(0);

  const auto due = buildq::util::FromProto(attempt.next_retry_at());

  bool rejected = false;
  try {
    f.retry->Reschedule(attempt, due, "still down");
  } catch (const buildq::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);

  rejected = false;
  try {
    f.retry->Reschedule(attempt, due - 1s, "still down");
  } catch (const buildq::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);

  const auto next = f.retry->Reschedule(attempt, due + 20s, "503 Service Unavailable");
  assert(next.attempts() == 2);
  assert(next.last_error() == "503 Service Unavailable");
  assert(f.retry->PendingCount() == 1);

  *f.now += 19s;
  assert(f.retry->ClaimReady(1).empty());
  *f.now += 1s;
  const auto again = f.retry->ClaimReady(1);
  assert(again.size() == 1);
  assert(again[0].attempts() == 2);

  const auto third = f.retry->Reschedule(again[0], due + 60s, "timeout");
  assert(third.attempts() == 3);
}

void TestRetentionIsAnchoredToFirstSchedule() {
  Fixture f;

  const auto id = f.retry->ScheduleRetry(f.Draft(1h));
  *f.now += 1h;
  auto attempt = f.retry->ClaimReady(1).at(0);

  *f.now += 22h;
  attempt = f.retry->Reschedule(attempt, *f.now + 30min, "retrying");

  *f.now += 1h;
  // 24h since first schedule: the record is gone even though it was rescheduled
  assert(f.retry->ClaimReady(10).empty());
  assert(f.retry->PendingCount() == 0);

  bool missing = false;
  try {
    f.retry->Reschedule(attempt, *f.now + 1h, "late");
  } catch (const buildq::util::NotFound&) {
    missing = true;
  }
  assert(missing);
  assert(attempt.id() == id);
}

void TestExpiredRecordIsDroppedOnClaim() {
  Fixture f;

  f.retry->ScheduleRetry(f.Draft(48h));
  *f.now += 48h;

  assert(f.retry->PendingCount() == 1);
  assert(f.retry->ClaimReady(10).empty());
  assert(f.retry->PendingCount() == 0);
}

void TestOutageMidClaimReturnsWhatWasClaimed() {
  Fixture f;

  const auto first  = f.retry->ScheduleRetry(f.Draft(10s, "job-a"));
  const auto second = f.retry->ScheduleRetry(f.Draft(20s, "job-b"));
  const auto third  = f.retry->ScheduleRetry(f.Draft(30s, "job-c"));
  *f.now += 30s;

  CallbackRetry flaky(std::make_shared<HashGetOutage>(f.store, 2), f.options);
  const auto    claimed = flaky.ClaimReady(10);
  assert(claimed.size() == 1);
  assert(claimed[0].id() == first);

  // the attempt in flight went back at its original due time
  assert(f.retry->PendingCount() == 2);
  const auto rest = f.retry->ClaimReady(10);
  assert(rest.size() == 2);
  assert(rest[0].id() == second);
  assert(rest[1].id() == third);
}

void TestOutageBeforeAnyClaimPropagates() {
  Fixture f;

  f.retry->ScheduleRetry(f.Draft(0ms));
  CallbackRetry flaky(std::make_shared<HashGetOutage>(f.store, 1), f.options);

  bool unavailable = false;
  try {
    flaky.ClaimReady(10);
  } catch (const buildq::util::StoreUnavailable&) {
    unavailable = true;
  }
  assert(unavailable);
  assert(f.retry->PendingCount() == 1);
  assert(f.retry->ClaimReady(10).size() == 1);
}

void TestUnreadableAttemptIsDropped() {
  Fixture f;
  Keys    keys(f.options.key_prefix);

  const auto corrupt = f.retry->ScheduleRetry(f.Draft(5s, "job-corrupt"));
  const auto good    = f.retry->ScheduleRetry(f.Draft(6s, "job-good"));
  f.store->HashSet(keys.Callback(corrupt), {{"data", "{not json"}});
  *f.now += 6s;

  const auto claimed = f.retry->ClaimReady(10);
  assert(claimed.size() == 1);
  assert(claimed[0].id() == good);
  assert(f.retry->PendingCount() == 0);
}

void TestRescheduleAfterExpiryDoesNotRecreate() {
  Fixture f;
  Keys    keys(f.options.key_prefix);

  f.retry->ScheduleRetry(f.Draft(1s));
  *f.now += 1s;
  const auto attempt = f.retry->ClaimReady(1).at(0);

  auto store   = std::make_shared<buildq::test::ExpireBeforeUpdate>(f.store, f.now, f.options.callback_retention);
  store->armed = true;
  CallbackRetry retry(store, f.options);

  bool missing = false;
  try {
    retry.Reschedule(attempt, *f.now + 1min, "still down");
  } catch (const buildq::util::NotFound&) {
    missing = true;
  }
  assert(missing);
  assert(f.store->HashGetAll(keys.Callback(attempt.id())).empty());
  assert(f.retry->PendingCount() == 0);
}

void TestAbandonIsIdempotent() {
  Fixture f;

  const auto id = f.retry->ScheduleRetry(f.Draft(0ms));
  f.retry->Abandon(id);
  f.retry->Abandon(id);
  f.retry->Abandon("unknown-attempt");

  assert(f.retry->PendingCount() == 0);
  assert(f.retry->ClaimReady(10).empty());
}

void TestScheduleValidatesInput() {
  Fixture f;

  auto no_job = f.Draft(1s);
  no_job.job_id.clear();
  auto no_url = f.Draft(1s);
  no_url.callback_url.clear();

  for (const auto& draft : {no_job, no_url}) {
    bool rejected = false;
    try {
      f.retry->ScheduleRetry(draft);
    } catch (const buildq::util::ValidationError&) {
      rejected = true;
    }
    assert(rejected);
  }
  assert(f.retry->PendingCount() == 0);
}

} // namespace

int main() {
  TestAttemptBecomesClaimableWhenDue();
  TestClaimReadyReturnsEarliestFirstUpToLimit();
  TestConcurrentClaimersNeverShareAnAttempt();
  TestRescheduleMustMoveForward();
  TestRetentionIsAnchoredToFirstSchedule();
  TestExpiredRecordIsDroppedOnClaim();
  TestOutageMidClaimReturnsWhatWasClaimed();
  TestOutageBeforeAnyClaimPropagates();
  TestUnreadableAttemptIsDropped();
  TestRescheduleAfterExpiryDoesNotRecreate();
  TestAbandonIsIdempotent();
  TestScheduleValidatesInput();

  std::cout << "buildq_unit_callback_retry: pass\n";
  return 0;
}
