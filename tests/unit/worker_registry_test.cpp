#include "internal/queue/worker_registry.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>

#include "internal/store/memory/memory_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using buildq::queue::QueueOptions;
using buildq::queue::WorkerRegistry;

void TestRegisterIsIdempotent() {
  auto           store = std::make_shared<buildq::store::memory::MemoryStore>();
  WorkerRegistry registry(store, QueueOptions{});

  assert(registry.ListActive().empty());

  registry.Register("builder-a");
  registry.Register("builder-a");
  registry.Register("builder-b");

  auto active = registry.ListActive();
  std::sort(active.begin(), active.end());
  assert(active.size() == 2);
  assert(active[0] == "builder-a");
  assert(active[1] == "builder-b");

  registry.Unregister("builder-a");
  registry.Unregister("builder-a");
  registry.Unregister("never-registered");
  assert(registry.ListActive() == std::vector<std::string>{"builder-b"});
}

void TestPrefixesIsolateRegistries() {
  auto         store = std::make_shared<buildq::store::memory::MemoryStore>();
  QueueOptions staging;
  staging.key_prefix = "staging";

  WorkerRegistry prod(store, QueueOptions{});
  WorkerRegistry stage(store, staging);

  prod.Register("builder-a");
  assert(stage.ListActive().empty());
}

void TestEmptyIdRejected() {
  WorkerRegistry registry(std::make_shared<buildq::store::memory::MemoryStore>(), QueueOptions{});

  bool rejected = false;
  try {
    registry.Register("");
  } catch (const buildq::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);

  rejected = false;
  try {
    registry.Unregister("");
  } catch (const buildq::util::ValidationError&) {
    rejected = true;
  }
  assert(rejected);
}

} // namespace

int main() {
  TestRegisterIsIdempotent();
  TestPrefixesIsolateRegistries();
  TestEmptyIdRejected();

  std::cout << "buildq_unit_worker_registry: pass\n";
  return 0;
}
