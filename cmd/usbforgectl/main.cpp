#include <google/protobuf/util/time_util.h>
#include <grpcpp/grpcpp.h>

#include <cctype>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "usbforge/v1/job_service.grpc.pb.h"
#include "usbforge/v1.hpp"

using namespace usbforge::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  usbforgectl <addr> submit <order_ref> <capacity> [content_plan_ref] [volume_label]\n"
            << "  usbforgectl <addr> status <job_id>\n"
            << "  usbforgectl <addr> get <job_id>\n"
            << "  usbforgectl <addr> latest <order_ref>\n"
            << "  usbforgectl <addr> list [status]\n"
            << "  usbforgectl <addr> cancel <job_id> [reason]\n"
            << "  usbforgectl <addr> log <job_id> <level=debug|info|warning|error> <category> <message>\n"
            << "  usbforgectl <addr> logs <job_id> [limit]\n"
            << "  usbforgectl <addr> errors [job_id]\n"
            << "  usbforgectl <addr> stats\n"
            << "  usbforgectl <addr> purge <log_days> <job_days>\n";
}

static std::optional<JobStatus> ParseStatus(std::string value) {
  for (auto& c : value) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  JobStatus status;
  if (value != "UNSPECIFIED" && JobStatus_Parse("JOB_STATUS_" + value, &status)) return status;
  return std::nullopt;
}

static std::optional<LogLevel> ParseLevel(const std::string& value) {
  if (value == "debug") return LOG_LEVEL_DEBUG;
  if (value == "info") return LOG_LEVEL_INFO;
  if (value == "warning" || value == "warn") return LOG_LEVEL_WARNING;
  if (value == "error") return LOG_LEVEL_ERROR;
  return std::nullopt;
}

static std::string Lower(std::string value) {
  for (auto& c : value) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return value;
}

static std::string StatusName(JobStatus status) {
  const auto& name = JobStatus_Name(status);
  return Lower(name.substr(std::string("JOB_STATUS_").size()));
}

static std::string LevelName(LogLevel level) {
  const auto& name = LogLevel_Name(level);
  return Lower(name.substr(std::string("LOG_LEVEL_").size()));
}

static void PrintJob(const Job& job) {
  std::cout << "id=" << job.id() << "\n";
  std::cout << "token=" << job.job_token() << "\n";
  std::cout << "order_ref=" << job.order_ref() << "\n";
  std::cout << "status=" << StatusName(job.status()) << "\n";
  std::cout << "progress=" << job.progress() << "\n";
  std::cout << "attempts=" << job.attempts() << "\n";
  if (job.has_lease()) std::cout << "locked_by=" << job.lease().locked_by() << "\n";
  if (!job.fail_reason().empty()) std::cout << "fail_reason=" << job.fail_reason() << "\n";
  if (!job.last_error().empty()) std::cout << "last_error=" << job.last_error() << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
  auto stub    = JobService::NewStub(channel);

  grpc::ClientContext ctx;

  try {
    // ------------------------------------------------------------

    if (cmd == "submit") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      SubmitJobRequest req;
      req.set_order_ref(argv[3]);
      req.set_capacity(argv[4]);
      if (argc >= 6) req.set_content_plan_ref(argv[5]);
      if (argc >= 7) req.set_volume_label(argv[6]);

      SubmitJobResponse resp;
      auto status = stub->SubmitJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "job_id=" << resp.job_id() << "\n";
      std::cout << "token=" << resp.job_token() << "\n";
      return 0;
    }

    if (cmd == "status") {
      if (argc < 4) return 1;

      GetJobStatusRequest req;
      req.set_job_id(std::stoll(argv[3]));

      GetJobStatusResponse resp;
      auto status = stub->GetJobStatus(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "status=" << StatusName(resp.status()) << "\n";
      std::cout << "progress=" << resp.progress() << "\n";
      if (!resp.fail_reason().empty()) std::cout << "fail_reason=" << resp.fail_reason() << "\n";
      return 0;
    }

    if (cmd == "get" || cmd == "latest") {
      if (argc < 4) return 1;

      GetJobRequest req;
      if (cmd == "get") {
        req.set_job_id(std::stoll(argv[3]));
      } else {
        req.set_latest_for_order_ref(argv[3]);
      }

      GetJobResponse resp;
      auto status = stub->GetJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintJob(resp.job());
      return 0;
    }

    if (cmd == "list") {
      ListJobsRequest req;
      if (argc >= 4) {
        auto parsed = ParseStatus(argv[3]);
        if (!parsed) {
          std::cerr << "unknown status: " << argv[3] << "\n";
          return 1;
        }
        req.add_statuses(*parsed);
      }

      ListJobsResponse resp;
      auto status = stub->ListJobs(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& job : resp.jobs()) {
        std::cout << job.id() << "\t" << job.order_ref() << "\t" << StatusName(job.status()) << "\t" << job.progress()
                  << "%\n";
      }
      return 0;
    }

    if (cmd == "cancel") {
      if (argc < 4) return 1;

      CancelJobRequest req;
      req.set_job_id(std::stoll(argv[3]));
      if (argc >= 5) req.set_reason(argv[4]);

      CancelJobResponse resp;
      auto status = stub->CancelJob(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      PrintJob(resp.job());
      return 0;
    }

    if (cmd == "log") {
      if (argc < 7) {
        Usage();
        return 1;
      }

      auto level = ParseLevel(argv[4]);
      if (!level) {
        std::cerr << "unknown level: " << argv[4] << "\n";
        return 1;
      }

      AppendLogRequest req;
      auto*            entry = req.mutable_entry();
      entry->set_job_id(std::stoll(argv[3]));
      entry->set_level(*level);
      entry->set_category(argv[5]);
      entry->set_message(argv[6]);

      AppendLogResponse resp;
      auto status = stub->AppendLog(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "log_id=" << resp.log_id() << "\n";
      return 0;
    }

    if (cmd == "logs") {
      if (argc < 4) return 1;

      ListJobLogsRequest req;
      req.set_job_id(std::stoll(argv[3]));
      if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

      ListJobLogsResponse resp;
      auto status = stub->ListJobLogs(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      for (const auto& entry : resp.entries()) {
        std::cout << google::protobuf::util::TimeUtil::ToString(entry.created_at()) << " [" << LevelName(entry.level())
                  << "] " << entry.category() << ": " << entry.message() << "\n";
      }
      return 0;
    }

    if (cmd == "errors") {
      GetErrorSummaryRequest req;
      if (argc >= 4) req.set_job_id(std::stoll(argv[3]));

      GetErrorSummaryResponse resp;
      auto status = stub->GetErrorSummary(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "total=" << resp.total_errors() << "\n";
      for (const auto& [category, count] : resp.by_category()) std::cout << "category." << category << "=" << count << "\n";
      for (const auto& [code, count] : resp.by_error_code()) std::cout << "code." << code << "=" << count << "\n";
      return 0;
    }

    if (cmd == "stats") {
      GetStatisticsRequest  req;
      GetStatisticsResponse resp;

      auto status = stub->GetStatistics(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "total=" << resp.total_jobs() << "\n";
      for (const auto& row : resp.by_status()) std::cout << StatusName(row.status()) << "=" << row.count() << "\n";
      std::cout << "active_leases=" << resp.active_leases() << "\n";
      std::cout << "expired_leases=" << resp.expired_leases() << "\n";
      return 0;
    }

    if (cmd == "purge") {
      if (argc < 5) return 1;

      PurgeRequest req;
      req.set_log_retention_days(static_cast<uint32_t>(std::stoul(argv[3])));
      req.set_job_retention_days(static_cast<uint32_t>(std::stoul(argv[4])));

      PurgeResponse resp;
      auto status = stub->Purge(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      std::cout << "logs_deleted=" << resp.logs_deleted() << "\n";
      std::cout << "jobs_deleted=" << resp.jobs_deleted() << "\n";
      return 0;
    }
  } catch (const std::logic_error& e) {
    // std::stoll / std::stoul on a malformed number
    std::cerr << "invalid argument: " << e.what() << "\n";
    return 1;
  }

  Usage();
  return 1;
}
