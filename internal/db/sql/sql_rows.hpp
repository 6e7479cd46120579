#pragma once

#include <string_view>

#include "internal/db/sql/sql_params.hpp"
#include "internal/model/job.hpp"
#include "internal/model/job_log.hpp"

namespace usbforge::db::sql {

/*
  Row <-> parameter mapping shared by the SQL backends.
  Parameter order matches INSERT_JOB / UPDATE_JOB / INSERT_LOG.
*/

Params InsertJobParams(const model::Job& job);
Params UpdateJobParams(const model::Job& job);
Params InsertLogParams(const model::JobLogEntry& entry);

// Fine status wins; rows that only carry the coarse status are mapped.
// Throws util::StorageError when neither column parses.
model::JobStatus DecodeJobStatus(std::string_view job_status, std::string_view storage_status);

// Throws util::StorageError for an unknown level.
model::LogLevel DecodeLogLevel(std::string_view level);

} // namespace usbforge::db::sql
