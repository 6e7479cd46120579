#include "job_server.hpp"

#include "grpc_error.hpp"

namespace usbforge::grpc {

JobServer::JobServer(std::shared_ptr<usbforge::service::JobService> svc) : service_(std::move(svc)) {
}

::grpc::Status JobServer::SubmitJob(::grpc::ServerContext*, const usbforge::v1::SubmitJobRequest* req, usbforge::v1::SubmitJobResponse* resp) {
  try {
    *resp = service_->SubmitJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJobStatus(::grpc::ServerContext*, const usbforge::v1::GetJobStatusRequest* req, usbforge::v1::GetJobStatusResponse* resp) {
  try {
    *resp = service_->GetJobStatus(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetJob(::grpc::ServerContext*, const usbforge::v1::GetJobRequest* req, usbforge::v1::GetJobResponse* resp) {
  try {
    *resp = service_->GetJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobs(::grpc::ServerContext*, const usbforge::v1::ListJobsRequest* req, usbforge::v1::ListJobsResponse* resp) {
  try {
    *resp = service_->ListJobs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::UpdateJob(::grpc::ServerContext*, const usbforge::v1::UpdateJobRequest* req, usbforge::v1::UpdateJobResponse* resp) {
  try {
    *resp = service_->UpdateJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::CancelJob(::grpc::ServerContext*, const usbforge::v1::CancelJobRequest* req, usbforge::v1::CancelJobResponse* resp) {
  try {
    *resp = service_->CancelJob(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::AppendLog(::grpc::ServerContext*, const usbforge::v1::AppendLogRequest* req, usbforge::v1::AppendLogResponse* resp) {
  try {
    *resp = service_->AppendLog(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::AppendLogs(::grpc::ServerContext*, const usbforge::v1::AppendLogsRequest* req, usbforge::v1::AppendLogsResponse* resp) {
  try {
    *resp = service_->AppendLogs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::ListJobLogs(::grpc::ServerContext*, const usbforge::v1::ListJobLogsRequest* req, usbforge::v1::ListJobLogsResponse* resp) {
  try {
    *resp = service_->ListJobLogs(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetErrorSummary(::grpc::ServerContext*, const usbforge::v1::GetErrorSummaryRequest* req, usbforge::v1::GetErrorSummaryResponse* resp) {
  try {
    *resp = service_->GetErrorSummary(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::GetStatistics(::grpc::ServerContext*, const usbforge::v1::GetStatisticsRequest* req, usbforge::v1::GetStatisticsResponse* resp) {
  try {
    *resp = service_->GetStatistics(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status JobServer::Purge(::grpc::ServerContext*, const usbforge::v1::PurgeRequest* req, usbforge::v1::PurgeResponse* resp) {
  try {
    *resp = service_->Purge(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace usbforge::grpc
