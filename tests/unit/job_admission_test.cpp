#include "internal/queue/job_admission.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/queue/dispatcher.hpp"
#include "internal/queue/job_codec.hpp"
#include "internal/queue/lifecycle_tracker.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/forwarding_store.hpp"

namespace {

using buildq::core::v1::BuildJob;
using buildq::queue::JobAdmission;
using buildq::queue::Keys;
using buildq::queue::QueueOptions;
using buildq::store::memory::MemoryStore;
using namespace std::chrono_literals;

/*
  Forwards to a MemoryStore but can be told to fail queue inserts, the way a
  connection drop between the record write and the push would.
*/
class FlakyQueueStore final : public buildq::test::ForwardingStore {
 public:
  using ForwardingStore::ForwardingStore;

  bool        fail_queue_inserts = false;
  std::string last_hash_key;

  void HashSet(const std::string& key, const buildq::store::FieldMap& fields) override {
    last_hash_key = key;
    ForwardingStore::HashSet(key, fields);
  }
  void SortedSetAdd(const std::string& key, const std::string& member, double score) override {
    if (fail_queue_inserts) throw buildq::util::StoreUnavailable("injected: priority push");
    ForwardingStore::SortedSetAdd(key, member, score);
  }
  void ListPushFront(const std::string& key, const std::string& value) override {
    if (fail_queue_inserts) throw buildq::util::StoreUnavailable("injected: fifo push");
    ForwardingStore::ListPushFront(key, value);
  }
};

BuildJob MakeJob(int priority = 0) {
  BuildJob job;
  job.set_release_id("rel-1");
  job.set_service_id("svc-1");
  job.set_project_id("proj-1");
  job.set_git_repo("https://example.com/app.git");
  job.set_git_sha("0123456789abcdef");
  job.set_git_branch("main");
  job.mutable_build_config()->set_type("dockerfile");
  job.mutable_build_config()->set_dockerfile("Dockerfile");
  (*job.mutable_build_config()->mutable_build_args())["NODE_ENV"] = "production";
  job.set_callback_url("https://control-plane.example.com/hooks/build");
  job.set_priority(priority);
  return job;
}

template <typename Fn>
void ExpectValidationError(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const buildq::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestEnqueueRejectsIncompleteJobsWithoutWriting() {
  auto         store = std::make_shared<FlakyQueueStore>(std::make_shared<MemoryStore>());
  QueueOptions options;
  JobAdmission admission(store, options);
  Keys         keys(options.key_prefix);

  auto no_release = MakeJob();
  no_release.clear_release_id();
  ExpectValidationError([&] { admission.Enqueue(no_release); });

  auto no_service = MakeJob();
  no_service.clear_service_id();
  ExpectValidationError([&] { admission.Enqueue(no_service); });

  auto no_project = MakeJob();
  no_project.clear_project_id();
  ExpectValidationError([&] { admission.Enqueue(no_project); });

  auto no_repo = MakeJob();
  no_repo.clear_git_repo();
  ExpectValidationError([&] { admission.Enqueue(no_repo); });

  auto no_sha = MakeJob();
  no_sha.clear_git_sha();
  ExpectValidationError([&] { admission.Enqueue(no_sha); });

  ExpectValidationError([&] { admission.Enqueue(MakeJob(-1)); });

  assert(store->last_hash_key.empty());
  assert(store->ListLength(keys.FifoQueue()) == 0);
  assert(store->SortedSetCard(keys.PriorityQueue()) == 0);
}

void TestEnqueueAssignsIdentityAndRoutesByPriority() {
  auto         store = std::make_shared<MemoryStore>();
  QueueOptions options;
  JobAdmission admission(store, options);
  Keys         keys(options.key_prefix);

  auto job = MakeJob(0);
  job.set_id("caller-chosen");
  const auto fifo_id = admission.Enqueue(job);
  assert(!fifo_id.empty());
  assert(fifo_id != "caller-chosen");

  const auto priority_id = admission.Enqueue(MakeJob(3));
  assert(priority_id != fifo_id);

  assert(store->ListLength(keys.FifoQueue()) == 1);
  assert(store->SortedSetCard(keys.PriorityQueue()) == 1);

  const auto fields = store->HashGetAll(keys.Job(fifo_id));
  assert(fields.at("status") == "queued");
  assert(fields.contains("created_at"));

  const auto record = buildq::queue::DecodeJobRecord(fields);
  assert(record.job.id() == fifo_id);
  assert(record.job.release_id() == "rel-1");
  assert(record.job.build_config().build_args().at("NODE_ENV") == "production");
  assert(record.job.has_created_at());
  assert(record.state.status() == buildq::core::v1::JOB_STATUS_QUEUED);
  assert(!record.result.has_value());
}

void TestEnqueueSetsRetention() {
  auto now   = std::make_shared<buildq::util::TimePoint>(buildq::util::FromUnixMillis(1'700'000'000'000));
  auto clock = [now] { return *now; };

  auto         store = std::make_shared<MemoryStore>(clock);
  QueueOptions options;
  options.clock = clock;
  JobAdmission admission(store, options);
  Keys         keys(options.key_prefix);

  const auto id = admission.Enqueue(MakeJob());

  *now += options.job_retention - 1ms;
  assert(!store->HashGetAll(keys.Job(id)).empty());

  *now += 1ms;
  assert(store->HashGetAll(keys.Job(id)).empty());
}

void TestEnqueueRollsBackRecordWhenQueueingFails() {
  auto         store = std::make_shared<FlakyQueueStore>(std::make_shared<MemoryStore>());
  QueueOptions options;
  JobAdmission admission(store, options);
  Keys         keys(options.key_prefix);

  store->fail_queue_inserts = true;

  for (int priority : {0, 4}) {
    bool unavailable = false;
    try {
      admission.Enqueue(MakeJob(priority));
    } catch (const buildq::util::StoreUnavailable&) {
      unavailable = true;
    }
    assert(unavailable);
    assert(!store->last_hash_key.empty());
    assert(store->HashGetAll(store->last_hash_key).empty());
  }

  assert(store->ListLength(keys.FifoQueue()) == 0);
  assert(store->SortedSetCard(keys.PriorityQueue()) == 0);

  store->fail_queue_inserts = false;
  const auto id             = admission.Enqueue(MakeJob());
  assert(!store->HashGetAll(keys.Job(id)).empty());
}

void TestResubmitOnlyFromFailedOrCancelled() {
  auto                            store = std::make_shared<MemoryStore>();
  QueueOptions                    options;
  JobAdmission                    admission(store, options);
  buildq::queue::LifecycleTracker lifecycle(store, options);
  buildq::queue::Dispatcher       dispatcher(store, options);

  const auto original = admission.Enqueue(MakeJob(2));

  bool invalid = false;
  try {
    admission.Resubmit(original);
  } catch (const buildq::util::InvalidState&) {
    invalid = true;
  }
  assert(invalid);

  auto claimed = dispatcher.Claim("worker-a", 0ms);
  assert(claimed.has_value());
  assert(claimed->id() == original);
  lifecycle.UpdateStatus(original, buildq::core::v1::JOB_STATUS_FAILED, "worker-a");

  const auto retried = admission.Resubmit(original);
  assert(retried != original);

  const auto copy = lifecycle.GetJob(retried);
  assert(copy.job.priority() == 3);
  assert(copy.job.release_id() == "rel-1");
  assert(copy.job.git_sha() == "0123456789abcdef");
  assert(copy.state.status() == buildq::core::v1::JOB_STATUS_QUEUED);

  // the failed original is untouched
  assert(lifecycle.GetJob(original).state.status() == buildq::core::v1::JOB_STATUS_FAILED);

  const auto fifo = admission.Enqueue(MakeJob(0));
  lifecycle.Cancel(fifo);
  const auto from_cancelled = admission.Resubmit(fifo);
  assert(lifecycle.GetJob(from_cancelled).job.priority() == 1);

  bool missing = false;
  try {
    admission.Resubmit("does-not-exist");
  } catch (const buildq::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

} // namespace

int main() {
  TestEnqueueRejectsIncompleteJobsWithoutWriting();
  TestEnqueueAssignsIdentityAndRoutesByPriority();
  TestEnqueueSetsRetention();
  TestEnqueueRollsBackRecordWhenQueueingFails();
  TestResubmitOnlyFromFailedOrCancelled();

  std::cout << "buildq_unit_job_admission: pass\n";
  return 0;
}
