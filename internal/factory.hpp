#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/queue/queue_options.hpp"
#include "internal/service/service_context.hpp"
#include "internal/store/api/coordination_store.hpp"

namespace buildq::factory {

/*
  Application

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<store::CoordinationStore>     store;
  service::ServiceContext                       context;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

// Config values with unset durations and prefix replaced by defaults.
queue::QueueOptions QueueOptionsFromConfig(const buildq::runtime::config::QueueConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config and pings the store
  once; an unreachable store fails startup with util::StoreUnavailable.

  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const buildq::runtime::config::RuntimeConfig& config);

} // namespace buildq::factory
