#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/joblog/log_sink.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "usbforge/v1.hpp"

namespace {

using namespace std::chrono_literals;

usbforge::service::ServiceContext BuildServiceContext() {
  usbforge::service::ServiceContext ctx;
  ctx.repository = std::make_shared<usbforge::db::memory::MemoryRepository>();
  ctx.log_sink   = std::make_shared<usbforge::joblog::LogSink>(ctx.repository);
  return ctx;
}

int64_t Submit(usbforge::grpc::JobServer& server, const std::string& order_ref) {
  usbforge::v1::SubmitJobRequest req;
  req.set_order_ref(order_ref);
  req.set_capacity("32GB");
  usbforge::v1::SubmitJobResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  const auto status = server.SubmitJob(&grpc_ctx, &req, &resp);
  assert(status.ok());
  return resp.job_id();
}

void TestMissingJobReturnsNotFound() {
  usbforge::grpc::JobServer server(std::make_shared<usbforge::service::JobService>(BuildServiceContext()));

  usbforge::v1::GetJobStatusRequest req;
  req.set_job_id(424242);
  usbforge::v1::GetJobStatusResponse resp;
  ::grpc::ServerContext              grpc_ctx;

  const auto status = server.GetJobStatus(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestMalformedSubmitReturnsInvalidArgument() {
  usbforge::grpc::JobServer server(std::make_shared<usbforge::service::JobService>(BuildServiceContext()));

  usbforge::v1::SubmitJobRequest req;
  req.set_order_ref("order-1");
  req.set_preferences_json("{not json");
  usbforge::v1::SubmitJobResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  const auto status = server.SubmitJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestCancelLeasedJobReturnsFailedPrecondition() {
  auto ctx    = BuildServiceContext();
  auto leases = std::make_shared<usbforge::lease::LeaseManager>(ctx.repository, ctx.log_sink);
  usbforge::grpc::JobServer server(std::make_shared<usbforge::service::JobService>(ctx));

  const auto id = Submit(server, "order-2");
  assert(leases->Acquire("worker-a", 60s).has_value());

  usbforge::v1::CancelJobRequest req;
  req.set_job_id(id);
  usbforge::v1::CancelJobResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  const auto status = server.CancelJob(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);
}

void TestStorageErrorsMapToRetryableCodes() {
  assert(usbforge::grpc::ToStatus(usbforge::util::TransactionConflict("busy")).error_code() ==
         ::grpc::StatusCode::ABORTED);
  assert(usbforge::grpc::ToStatus(usbforge::util::StorageError("disk gone")).error_code() ==
         ::grpc::StatusCode::UNAVAILABLE);
  assert(usbforge::grpc::ToStatus(usbforge::util::AlreadyExists("dup")).error_code() ==
         ::grpc::StatusCode::ALREADY_EXISTS);
  assert(usbforge::grpc::ToStatus(std::runtime_error("boom")).error_code() == ::grpc::StatusCode::INTERNAL);
}

} // namespace

int main() {
  TestMissingJobReturnsNotFound();
  TestMalformedSubmitReturnsInvalidArgument();
  TestCancelLeasedJobReturnsFailedPrecondition();
  TestStorageErrorsMapToRetryableCodes();

  std::cout << "usbforge_unit_grpc_status: pass\n";
  return 0;
}
