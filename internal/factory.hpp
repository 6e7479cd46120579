#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"

#if USBFORGE_WITH_GRPC
#include <grpcpp/impl/service_type.h>
#endif

#include "internal/execution/job_pipeline.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/worker/worker.hpp"

namespace usbforge::db { class Repository; }
namespace usbforge::joblog { class LogSink; }
namespace usbforge::service { class JobService; }

namespace usbforge::factory {

/*
  Application

  Owns all long-lived objects of the process. Nothing is started here:
  the caller starts the worker and the gRPC server.
*/
struct Application {
  std::shared_ptr<db::Repository>       repository;
  std::shared_ptr<joblog::LogSink>      log_sink;
  std::shared_ptr<lease::LeaseManager>  leases;
  std::shared_ptr<service::JobService>  job_service;
  std::shared_ptr<worker::Worker>       worker;

#if USBFORGE_WITH_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const usbforge::runtime::config::RuntimeConfig& config);

// Opens the configured backend and brings its schema up to date.
std::shared_ptr<db::Repository> BuildRepository(const usbforge::runtime::config::RuntimeConfig& config);

worker::WorkerOptions      WorkerOptionsFrom(const usbforge::runtime::config::RuntimeConfig& config);
lease::LeasePolicy         LeasePolicyFrom(const usbforge::runtime::config::RuntimeConfig& config);
execution::PipelineOptions PipelineOptionsFrom(const usbforge::runtime::config::RuntimeConfig& config);

} // namespace usbforge::factory
