#include "internal/queue/dispatcher.hpp"

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

#include "internal/queue/job_admission.hpp"
#include "internal/queue/lifecycle_tracker.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/forwarding_store.hpp"

namespace {

using buildq::core::v1::BuildJob;
using buildq::queue::Dispatcher;
using buildq::queue::JobAdmission;
using buildq::queue::Keys;
using buildq::queue::LifecycleTracker;
using buildq::queue::QueueOptions;
using buildq::store::memory::MemoryStore;
using namespace std::chrono_literals;

BuildJob MakeJob(int priority) {
  BuildJob job;
  job.set_release_id("rel");
  job.set_service_id("svc");
  job.set_project_id("proj");
  job.set_git_repo("https://example.com/app.git");
  job.set_git_sha("abc123");
  job.set_priority(priority);
  return job;
}

struct Fixture {
  std::shared_ptr<buildq::util::TimePoint> now = std::make_shared<buildq::util::TimePoint>(buildq::util::FromUnixMillis(1'700'000'000'000));
  QueueOptions                             options;
  std::shared_ptr<MemoryStore>             store;
  std::unique_ptr<JobAdmission>            admission;
  std::unique_ptr<Dispatcher>              dispatcher;
  std::unique_ptr<LifecycleTracker>        lifecycle;

  Fixture() {
    auto shared   = now;
    options.clock = [shared] { return *shared; };
    store         = std::make_shared<MemoryStore>(options.clock);
    admission     = std::make_unique<JobAdmission>(store, options);
    dispatcher    = std::make_unique<Dispatcher>(store, options);
    lifecycle     = std::make_unique<LifecycleTracker>(store, options);
  }

  std::string Enqueue(int priority) {
    const auto id = admission->Enqueue(MakeJob(priority));
    *now += 1s;
    return id;
  }
};

void TestPriorityThenFifoOrder() {
  Fixture f;

  const auto fifo1 = f.Enqueue(0);
  const auto p5    = f.Enqueue(5);
  const auto fifo3 = f.Enqueue(0);
  const auto p10   = f.Enqueue(10);

  const auto depth = f.dispatcher->Depth();
  assert(depth.priority == 2);
  assert(depth.fifo == 2);

  assert(f.dispatcher->Claim("w", 0ms)->id() == p10);
  assert(f.dispatcher->Claim("w", 0ms)->id() == p5);
  assert(f.dispatcher->Claim("w", 0ms)->id() == fifo1);
  assert(f.dispatcher->Claim("w", 0ms)->id() == fifo3);
  assert(!f.dispatcher->Claim("w", 0ms).has_value());
}

void TestOlderPriorityJobBeatsNewerEqualPriority() {
  Fixture f;

  const auto first  = f.Enqueue(2);
  const auto second = f.Enqueue(2);

  assert(f.dispatcher->Claim("w", 0ms)->id() == first);
  assert(f.dispatcher->Claim("w", 0ms)->id() == second);
}

void TestEqualPriorityInOneMicrosecondKeepsAdmissionOrder() {
  Fixture f;

  // the clock does not move between admissions
  std::vector<std::string> admitted;
  for (int i = 0; i < 20; ++i) {
    admitted.push_back(f.admission->Enqueue(MakeJob(3)));
  }

  for (const auto& id : admitted) {
    assert(f.dispatcher->Claim("w", 0ms)->id() == id);
  }
}

void TestPositionFollowsDispatchOrder() {
  Fixture f;

  const auto low  = f.Enqueue(1);
  const auto high = f.Enqueue(9);
  f.Enqueue(0);

  assert(f.dispatcher->Position(high, true) == 1u);
  assert(f.dispatcher->Position(low, true) == 2u);
  assert(f.dispatcher->Position("", false) == 3u);

  f.dispatcher->Claim("w", 0ms);
  assert(!f.dispatcher->Position(high, true).has_value());
  assert(f.dispatcher->Position(low, true) == 1u);
}

void TestClaimMarksJobBuilding() {
  Fixture f;

  const auto id = f.Enqueue(0);
  *f.now += 5s;

  const auto job = f.dispatcher->Claim("worker-7", 0ms);
  assert(job.has_value());
  assert(job->id() == id);
  assert(job->git_sha() == "abc123");

  const auto record = f.lifecycle->GetJob(id);
  assert(record.state.status() == buildq::core::v1::JOB_STATUS_BUILDING);
  assert(record.state.worker_id() == "worker-7");
  assert(buildq::util::FromProto(record.state.started_at()) == *f.now);
}

void TestClaimTimesOutAndHonoursCap() {
  Fixture f;

  auto started = std::chrono::steady_clock::now();
  assert(!f.dispatcher->Claim("w", 50ms).has_value());
  assert(std::chrono::steady_clock::now() - started >= 40ms);

  f.options.max_claim_wait = 100ms;
  Dispatcher capped(f.store, f.options);

  started = std::chrono::steady_clock::now();
  assert(!capped.Claim("w", 60s).has_value());
  assert(std::chrono::steady_clock::now() - started < 10s);
}

void TestBlockedClaimWakesOnEnqueue() {
  Fixture f;

  std::string enqueued;
  std::thread producer([&] {
    std::this_thread::sleep_for(50ms);
    enqueued = f.admission->Enqueue(MakeJob(0));
  });

  const auto job = f.dispatcher->Claim("w", 10s);
  producer.join();

  assert(job.has_value());
  assert(job->id() == enqueued);
}

void TestConcurrentClaimsAreExclusive() {
  Fixture f;

  constexpr int kJobs = 60;
  for (int i = 0; i < kJobs; ++i) {
    f.admission->Enqueue(MakeJob(i % 3));
  }

  std::mutex            mutex;
  std::set<std::string> claimed;
  std::atomic<int>      duplicates{0};

  std::vector<std::thread> workers;
  for (int w = 0; w < 8; ++w) {
    workers.emplace_back([&, w] {
      const auto worker_id = "worker-" + std::to_string(w);
      while (auto job = f.dispatcher->Claim(worker_id, 20ms)) {
        std::lock_guard lock(mutex);
        if (!claimed.insert(job->id()).second) ++duplicates;
      }
    });
  }
  for (auto& t : workers) t.join();

  assert(duplicates == 0);
  assert(claimed.size() == kJobs);

  const auto depth = f.dispatcher->Depth();
  assert(depth.priority == 0);
  assert(depth.fifo == 0);
}

void TestFifoStarvesWhilePriorityWorkArrives() {
  Fixture f;

  const auto waiting = f.Enqueue(0);

  for (int round = 0; round < 5; ++round) {
    const auto urgent = f.Enqueue(1);
    assert(f.dispatcher->Claim("w", 0ms)->id() == urgent);
  }

  assert(f.dispatcher->Claim("w", 0ms)->id() == waiting);
}

void TestExpiredRecordIsReportedAndConsumed() {
  Fixture f;
  Keys    keys(f.options.key_prefix);

  const auto id = f.Enqueue(0);
  f.store->Delete(keys.Job(id));

  bool missing = false;
  try {
    f.dispatcher->Claim("w", 0ms);
  } catch (const buildq::util::JobRecordMissing& e) {
    missing = true;
    assert(e.job_id() == id);
  }
  assert(missing);

  assert(f.store->ListLength(keys.FifoQueue()) == 0);
  assert(!f.dispatcher->Claim("w", 0ms).has_value());
}

void TestRetentionExpirySurfacesAsMissingRecord() {
  Fixture f;

  const auto id = f.Enqueue(4);
  *f.now += f.options.job_retention;

  bool missing = false;
  try {
    f.dispatcher->Claim("w", 0ms);
  } catch (const buildq::util::JobRecordMissing& e) {
    missing = e.job_id() == id;
  }
  assert(missing);
  assert(f.dispatcher->Depth().priority == 0);
}

void TestRecordExpiringMidClaimIsNotRecreated() {
  Fixture f;
  Keys    keys(f.options.key_prefix);

  auto store   = std::make_shared<buildq::test::ExpireBeforeUpdate>(f.store, f.now, f.options.job_retention);
  store->armed = true;
  Dispatcher dispatcher(store, f.options);

  const auto id = f.Enqueue(2);

  bool missing = false;
  try {
    dispatcher.Claim("w", 0ms);
  } catch (const buildq::util::JobRecordMissing& e) {
    missing = e.job_id() == id;
  }
  assert(missing);

  assert(f.store->HashGetAll(keys.Job(id)).empty());
  assert(f.dispatcher->Depth().priority == 0);
  assert(!f.dispatcher->Claim("w", 0ms).has_value());
}

void TestCancelledWhileQueuedIsSkipped() {
  Fixture f;

  const auto cancelled = f.Enqueue(0);
  const auto next      = f.Enqueue(0);
  f.lifecycle->Cancel(cancelled);

  const auto job = f.dispatcher->Claim("w", 0ms);
  assert(job.has_value());
  assert(job->id() == next);

  assert(f.lifecycle->GetJob(cancelled).state.status() == buildq::core::v1::JOB_STATUS_CANCELLED);
  assert(!f.dispatcher->Claim("w", 0ms).has_value());
}

void TestClaimRequiresWorkerId() {
  Fixture f;
  f.Enqueue(0);

  bool rejected = false;
  try {
    f.dispatcher->Claim("", 0ms);
  } catch (const buildq::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);
  assert(f.dispatcher->Depth().fifo == 1);
}

} // namespace

int main() {
  TestPriorityThenFifoOrder();
  TestOlderPriorityJobBeatsNewerEqualPriority();
  TestEqualPriorityInOneMicrosecondKeepsAdmissionOrder();
  TestPositionFollowsDispatchOrder();
  TestClaimMarksJobBuilding();
  TestClaimTimesOutAndHonoursCap();
  TestBlockedClaimWakesOnEnqueue();
  TestConcurrentClaimsAreExclusive();
  TestFifoStarvesWhilePriorityWorkArrives();
  TestExpiredRecordIsReportedAndConsumed();
  TestRetentionExpirySurfacesAsMissingRecord();
  TestRecordExpiringMidClaimIsNotRecreated();
  TestCancelledWhileQueuedIsSkipped();
  TestClaimRequiresWorkerId();

  std::cout << "buildq_unit_dispatcher: pass\n";
  return 0;
}
