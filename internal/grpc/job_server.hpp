#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "usbforge/v1/job_service.grpc.pb.h"
#include "internal/service/job_service.hpp"

namespace usbforge::grpc {

class JobServer final : public usbforge::v1::JobService::Service {
public:
  explicit JobServer(std::shared_ptr<usbforge::service::JobService> svc);

  ::grpc::Status SubmitJob(::grpc::ServerContext*,
                           const usbforge::v1::SubmitJobRequest*,
                           usbforge::v1::SubmitJobResponse*) override;

  ::grpc::Status GetJobStatus(::grpc::ServerContext*,
                              const usbforge::v1::GetJobStatusRequest*,
                              usbforge::v1::GetJobStatusResponse*) override;

  ::grpc::Status GetJob(::grpc::ServerContext*,
                        const usbforge::v1::GetJobRequest*,
                        usbforge::v1::GetJobResponse*) override;

  ::grpc::Status ListJobs(::grpc::ServerContext*,
                          const usbforge::v1::ListJobsRequest*,
                          usbforge::v1::ListJobsResponse*) override;

  ::grpc::Status UpdateJob(::grpc::ServerContext*,
                           const usbforge::v1::UpdateJobRequest*,
                           usbforge::v1::UpdateJobResponse*) override;

  ::grpc::Status CancelJob(::grpc::ServerContext*,
                           const usbforge::v1::CancelJobRequest*,
                           usbforge::v1::CancelJobResponse*) override;

  ::grpc::Status AppendLog(::grpc::ServerContext*,
                           const usbforge::v1::AppendLogRequest*,
                           usbforge::v1::AppendLogResponse*) override;

  ::grpc::Status AppendLogs(::grpc::ServerContext*,
                            const usbforge::v1::AppendLogsRequest*,
                            usbforge::v1::AppendLogsResponse*) override;

  ::grpc::Status ListJobLogs(::grpc::ServerContext*,
                             const usbforge::v1::ListJobLogsRequest*,
                             usbforge::v1::ListJobLogsResponse*) override;

  ::grpc::Status GetErrorSummary(::grpc::ServerContext*,
                                 const usbforge::v1::GetErrorSummaryRequest*,
                                 usbforge::v1::GetErrorSummaryResponse*) override;

  ::grpc::Status GetStatistics(::grpc::ServerContext*,
                               const usbforge::v1::GetStatisticsRequest*,
                               usbforge::v1::GetStatisticsResponse*) override;

  ::grpc::Status Purge(::grpc::ServerContext*,
                       const usbforge::v1::PurgeRequest*,
                       usbforge::v1::PurgeResponse*) override;

private:
  std::shared_ptr<usbforge::service::JobService> service_;
};

}
