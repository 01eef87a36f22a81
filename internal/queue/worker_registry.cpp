#include "worker_registry.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace buildq::queue {

WorkerRegistry::WorkerRegistry(std::shared_ptr<store::CoordinationStore> store, const QueueOptions& options)
    : store_(std::move(store)), keys_(options.key_prefix) {
  if (!store_) {
    throw std::invalid_argument("WorkerRegistry: store is null");
  }
}

void WorkerRegistry::Register(const std::string& worker_id) {
  if (worker_id.empty()) {
    throw util::ValidationError("register worker: worker_id is required");
  }
  if (store_->SetAdd(keys_.ActiveWorkers(), worker_id)) {
    BUILDQ_LOG_INFO("worker registered", {observability::StringField("worker_id", worker_id)});
  }
}

void WorkerRegistry::Unregister(const std::string& worker_id) {
  if (worker_id.empty()) {
    throw util::ValidationError("unregister worker: worker_id is required");
  }
  if (store_->SetRemove(keys_.ActiveWorkers(), worker_id)) {
    BUILDQ_LOG_INFO("worker unregistered", {observability::StringField("worker_id", worker_id)});
  }
}

std::vector<std::string> WorkerRegistry::ListActive() {
  return store_->SetMembers(keys_.ActiveWorkers());
}

} // namespace buildq::queue
