#pragma once

#include <memory>
#include <string>
#include <vector>

#include "internal/queue/keys.hpp"
#include "internal/queue/queue_options.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace buildq::queue {

/*
  Set of worker ids currently announcing themselves. No heartbeat or expiry:
  a worker that dies without unregistering stays listed.
*/
class WorkerRegistry {
 public:
  WorkerRegistry(std::shared_ptr<store::CoordinationStore> store, const QueueOptions& options);

  void Register(const std::string& worker_id);
  void Unregister(const std::string& worker_id);

  std::vector<std::string> ListActive();

 private:
  std::shared_ptr<store::CoordinationStore> store_;
  Keys                                      keys_;
};

} // namespace buildq::queue
