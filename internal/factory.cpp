#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>

#include "internal/grpc/build_queue_server.hpp"
#include "internal/grpc/callback_retry_server.hpp"
#include "internal/grpc/worker_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/queue/callback_retry.hpp"
#include "internal/queue/dispatcher.hpp"
#include "internal/queue/job_admission.hpp"
#include "internal/queue/lifecycle_tracker.hpp"
#include "internal/queue/log_stream.hpp"
#include "internal/queue/worker_registry.hpp"
#include "internal/service/build_queue_service.hpp"
#include "internal/service/callback_retry_service.hpp"
#include "internal/service/worker_service.hpp"
#include "internal/store/memory/memory_store.hpp"
#include "internal/util/time.hpp"
#if BUILDQ_STORE_SQLITE
#include "internal/store/sqlite/sqlite_db.hpp"
#include "internal/store/sqlite/sqlite_store.hpp"
#endif

namespace buildq::factory {

namespace {

void OverrideIfSet(const google::protobuf::Duration& value, bool present, std::chrono::milliseconds* out) {
  if (present && (value.seconds() > 0 || value.nanos() > 0)) {
    *out = util::ToDuration(value);
  }
}

std::shared_ptr<store::CoordinationStore> BuildStore(const buildq::runtime::config::StoreConfig& config) {
  if (config.has_sqlite()) {
#if BUILDQ_STORE_SQLITE
    const auto& sqlite = config.sqlite();
    if (sqlite.path().empty()) {
      throw std::runtime_error("store.sqlite.path is required");
    }

    auto poll_interval = std::chrono::milliseconds(50);
    OverrideIfSet(sqlite.poll_interval(), sqlite.has_poll_interval(), &poll_interval);

    BUILDQ_LOG_INFO("using sqlite store", {observability::StringField("path", sqlite.path())});
    auto sqlite_db = std::make_shared<store::sqlite::SqliteDB>(sqlite.path());
    return std::make_shared<store::sqlite::SqliteStore>(std::move(sqlite_db), poll_interval);
#else
    throw std::runtime_error("sqlite store requested but not enabled at build time");
#endif
  }

  BUILDQ_LOG_INFO("using in-memory store");
  return std::make_shared<store::memory::MemoryStore>();
}

} // namespace

queue::QueueOptions QueueOptionsFromConfig(const buildq::runtime::config::QueueConfig& config) {
  queue::QueueOptions options;
  if (!config.key_prefix().empty()) {
    options.key_prefix = config.key_prefix();
  }
  OverrideIfSet(config.job_retention(), config.has_job_retention(), &options.job_retention);
  OverrideIfSet(config.callback_retention(), config.has_callback_retention(), &options.callback_retention);
  OverrideIfSet(config.priority_weight(), config.has_priority_weight(), &options.priority_weight);
  OverrideIfSet(config.log_tail_block(), config.has_log_tail_block(), &options.log_tail_block);
  OverrideIfSet(config.max_claim_wait(), config.has_max_claim_wait(), &options.max_claim_wait);
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const buildq::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Coordination store
  // ------------------------------------------------------------------
  app.store = BuildStore(config.store());
  app.store->Ping();

  // ------------------------------------------------------------------
  // Queue components
  // ------------------------------------------------------------------
  const auto options = QueueOptionsFromConfig(config.queue());

  service::ServiceContext& ctx = app.context;
  ctx.store                    = app.store;
  ctx.admission                = std::make_shared<queue::JobAdmission>(app.store, options);
  ctx.dispatcher               = std::make_shared<queue::Dispatcher>(app.store, options);
  ctx.lifecycle                = std::make_shared<queue::LifecycleTracker>(app.store, options);
  ctx.logs                     = std::make_shared<queue::LogStream>(app.store, options);
  ctx.workers                  = std::make_shared<queue::WorkerRegistry>(app.store, options);
  ctx.callbacks                = std::make_shared<queue::CallbackRetry>(app.store, options);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  auto build_queue_service    = std::make_shared<service::BuildQueueService>(ctx);
  auto worker_service         = std::make_shared<service::WorkerService>(ctx);
  auto callback_retry_service = std::make_shared<service::CallbackRetryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::BuildQueueServer>(build_queue_service));
  app.grpc_services.push_back(std::make_unique<grpc::WorkerServer>(worker_service));
  app.grpc_services.push_back(std::make_unique<grpc::CallbackRetryServer>(callback_retry_service));

  return app;
}

} // namespace buildq::factory
