#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/job_service.hpp"
#include "internal/util/time.hpp"
#include "internal/worker/worker.hpp"
#if USBFORGE_WITH_GRPC
#include "internal/runtime/server.hpp"
#endif

using usbforge::observability::IntField;
using usbforge::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void RunRetention(usbforge::service::JobService& service, const usbforge::runtime::config::RetentionConfig& retention) {
  usbforge::v1::PurgeRequest req;
  req.set_log_retention_days(retention.log_retention_days());
  req.set_job_retention_days(retention.job_retention_days());
  try {
    service.Purge(req);
  } catch (const std::exception& e) {
    // next interval retries
    USBFORGE_LOG_WARN("retention purge failed", {StringField("error", e.what())});
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: usbforge-worker <config.yaml> OR usbforge-worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = usbforge::config::ConfigLoader::LoadFromYaml(config_path);

    usbforge::observability::InitializeLogging(config);
    usbforge::observability::InitializeTracing(config);
    usbforge::observability::InitializeMetrics(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = usbforge::factory::Build(config);

    // Register signal handlers before starting to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

#if USBFORGE_WITH_GRPC
    std::unique_ptr<usbforge::runtime::Server> server;
    if (!config.server().bind_address().empty()) {
      server = std::make_unique<usbforge::runtime::Server>(config.server().bind_address(), std::move(app.grpc_services));
      server->Start();
    }
#else
    if (!config.server().bind_address().empty()) {
      USBFORGE_LOG_WARN("server.bind_address ignored: built without gRPC");
    }
#endif

    app.worker->Start();
    USBFORGE_LOG_INFO("usbforge worker started", {StringField("worker_id", app.worker->Id()),
                                                  IntField("max_concurrent_jobs", static_cast<int64_t>(config.worker().max_concurrent_jobs()))});

    const bool retention_enabled =
        config.retention().log_retention_days() > 0 || config.retention().job_retention_days() > 0;
    const auto retention_interval = usbforge::util::ToMillis(config.retention().interval());
    auto       next_retention     = std::chrono::steady_clock::now();

    while (g_running) {
      if (retention_enabled && std::chrono::steady_clock::now() >= next_retention) {
        RunRetention(*app.job_service, config.retention());
        next_retention = std::chrono::steady_clock::now() + retention_interval;
      }
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    USBFORGE_LOG_INFO("Shutting down usbforge worker");

    app.worker->Stop();
#if USBFORGE_WITH_GRPC
    if (server) server->Stop();
#endif
    usbforge::observability::ShutdownMetrics();
    usbforge::observability::ShutdownTracing();
    usbforge::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    USBFORGE_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    usbforge::observability::ShutdownMetrics();
    usbforge::observability::ShutdownTracing();
    usbforge::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
