#pragma once

#include "service_context.hpp"
#include "usbforge/v1.hpp"

namespace usbforge::service {

/*
  Collaborator-facing operations on the job store and the job log.

  Workers change job state only through the lease manager; this service
  creates jobs, answers queries and performs the administrative changes
  allowed on jobs that nobody holds.

  Errors: util::InvalidArgument for malformed requests, util::NotFound
  for unknown ids, util::InvalidState when the job's state forbids the
  change, util::StorageError from the store.
*/
class JobService {
public:
  explicit JobService(ServiceContext ctx);

  usbforge::v1::SubmitJobResponse
  SubmitJob(const usbforge::v1::SubmitJobRequest& req);

  usbforge::v1::GetJobStatusResponse
  GetJobStatus(const usbforge::v1::GetJobStatusRequest& req);

  usbforge::v1::GetJobResponse
  GetJob(const usbforge::v1::GetJobRequest& req);

  usbforge::v1::ListJobsResponse
  ListJobs(const usbforge::v1::ListJobsRequest& req);

  usbforge::v1::UpdateJobResponse
  UpdateJob(const usbforge::v1::UpdateJobRequest& req);

  usbforge::v1::CancelJobResponse
  CancelJob(const usbforge::v1::CancelJobRequest& req);

  usbforge::v1::AppendLogResponse
  AppendLog(const usbforge::v1::AppendLogRequest& req);

  usbforge::v1::AppendLogsResponse
  AppendLogs(const usbforge::v1::AppendLogsRequest& req);

  usbforge::v1::ListJobLogsResponse
  ListJobLogs(const usbforge::v1::ListJobLogsRequest& req);

  usbforge::v1::GetErrorSummaryResponse
  GetErrorSummary(const usbforge::v1::GetErrorSummaryRequest& req);

  usbforge::v1::GetStatisticsResponse
  GetStatistics(const usbforge::v1::GetStatisticsRequest& req);

  // Deletes logs and finished jobs older than the given ages (0 = keep).
  usbforge::v1::PurgeResponse
  Purge(const usbforge::v1::PurgeRequest& req);

private:
  uint64_t NowMs() const;

  ServiceContext ctx_;
};

}
