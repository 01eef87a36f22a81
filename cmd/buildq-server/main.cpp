#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

namespace {

namespace obs = buildq::observability;

enum ExitCode : int {
  kExitOk               = 0,
  kExitUsage            = 1,
  kExitBadConfig        = 2,
  kExitStoreUnavailable = 3,
  kExitFatal            = 4,
};

volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

struct Args {
  std::string config_path;
  bool        check_config{false};
};

std::optional<Args> ParseArgs(int argc, char** argv) {
  Args args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--check-config") {
      args.check_config = true;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (!arg.empty() && arg[0] != '-' && args.config_path.empty()) {
      args.config_path = arg;
    } else {
      return std::nullopt;
    }
  }
  if (args.config_path.empty()) return std::nullopt;
  return args;
}

// Flushes exporters and the logger on every exit path once logging is up.
struct ObservabilityShutdown {
  ~ObservabilityShutdown() {
    obs::ShutdownMetrics();
    obs::ShutdownTracing();
    obs::ShutdownLogging();
  }
};

void LogQueueOptions(const buildq::runtime::config::RuntimeConfig& config) {
  const auto options = buildq::factory::QueueOptionsFromConfig(config.queue());
  BUILDQ_LOG_INFO("queue options", {obs::StringField("key_prefix", options.key_prefix), obs::DurationField("job_retention", options.job_retention),
                                    obs::DurationField("callback_retention", options.callback_retention),
                                    obs::DurationField("priority_weight", options.priority_weight),
                                    obs::DurationField("max_claim_wait", options.max_claim_wait)});
}

} // namespace

int main(int argc, char** argv) {
  const auto args = ParseArgs(argc, argv);
  if (!args) {
    std::cerr << "Usage: buildq-server [--check-config] <config.yaml>\n"
                 "       buildq-server [--check-config] --config <config.yaml>\n";
    return kExitUsage;
  }

  buildq::runtime::config::RuntimeConfig config;
  try {
    config = buildq::config::ConfigLoader::LoadFromYaml(args->config_path);
    if (args->check_config) {
      std::cout << args->config_path << ": ok\n";
      return kExitOk;
    }
    obs::InitializeLogging(config);
  } catch (const std::exception& e) {
    std::cerr << "buildq-server: " << e.what() << "\n";
    return kExitBadConfig;
  }

  ObservabilityShutdown shutdown_observability;
  try {
    obs::InitializeTracing(config);
    obs::InitializeMetrics(config);
    LogQueueOptions(config);

    auto app = buildq::factory::Build(config);

    buildq::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));

    // handlers go in before Start so an early SIGTERM still shuts down cleanly
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(250));

    BUILDQ_LOG_INFO("shutting down");
    server.Stop();
  } catch (const buildq::util::StoreUnavailable& e) {
    BUILDQ_LOG_ERROR("coordination store unavailable", {obs::StringField("error", e.what())});
    return kExitStoreUnavailable;
  } catch (const std::exception& e) {
    BUILDQ_LOG_ERROR("fatal error", {obs::StringField("error", e.what())});
    return kExitFatal;
  }

  return kExitOk;
}
