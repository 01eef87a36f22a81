#pragma once

#include <memory>

namespace buildq::store {
class CoordinationStore;
}
namespace buildq::queue {
class JobAdmission;
class Dispatcher;
class LifecycleTracker;
class LogStream;
class WorkerRegistry;
class CallbackRetry;
} // namespace buildq::queue

namespace buildq::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<buildq::store::CoordinationStore> store;
  std::shared_ptr<buildq::queue::JobAdmission>      admission;
  std::shared_ptr<buildq::queue::Dispatcher>        dispatcher;
  std::shared_ptr<buildq::queue::LifecycleTracker>  lifecycle;
  std::shared_ptr<buildq::queue::LogStream>         logs;
  std::shared_ptr<buildq::queue::WorkerRegistry>    workers;
  std::shared_ptr<buildq::queue::CallbackRetry>     callbacks;
};

} // namespace buildq::service
