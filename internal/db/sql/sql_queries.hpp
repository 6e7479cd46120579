#pragma once

namespace usbforge::db::sql {

/*
  Canonical SQL used by all backends.

  IMPORTANT:
  These are written in the SQLite/Postgres common subset with '?'
  placeholders. Postgres callers pass them through ToPostgres().
  Column order of JOB_COLUMNS / LOG_COLUMNS is relied on by the row
  readers in each backend.
*/

#define USBFORGE_JOB_COLUMNS                                                                        \
  "id,job_token,order_ref,capacity,preferences,content_plan_ref,volume_label,assigned_device_id," \
  "status,job_status,progress,fail_reason,created_at_ms,updated_at_ms,started_at_ms,finished_at_ms," \
  "locked_by,locked_until_ms,attempts,last_error"

#define USBFORGE_LOG_COLUMNS \
  "id,job_id,level,category,message,details,file_path,file_size,error_code,correlation_id,created_at_ms"

static constexpr const char* JOB_COLUMNS = USBFORGE_JOB_COLUMNS;
static constexpr const char* LOG_COLUMNS = USBFORGE_LOG_COLUMNS;

// jobs

static constexpr const char* INSERT_JOB =
    "INSERT INTO processing_jobs(job_token,order_ref,capacity,preferences,content_plan_ref,volume_label,"
    "assigned_device_id,status,job_status,progress,fail_reason,created_at_ms,updated_at_ms,started_at_ms,"
    "finished_at_ms,locked_by,locked_until_ms,attempts,last_error)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?)"
    " RETURNING id;";

static constexpr const char* SELECT_JOB =
    "SELECT " USBFORGE_JOB_COLUMNS " FROM processing_jobs WHERE id=?";

static constexpr const char* SELECT_LATEST_JOB_FOR_ORDER =
    "SELECT " USBFORGE_JOB_COLUMNS " FROM processing_jobs WHERE order_ref=?"
    " ORDER BY created_at_ms DESC, id DESC LIMIT 1;";

static constexpr const char* SELECT_JOBS =
    "SELECT " USBFORGE_JOB_COLUMNS " FROM processing_jobs";

static constexpr const char* UPDATE_JOB =
    "UPDATE processing_jobs SET capacity=?,preferences=?,content_plan_ref=?,volume_label=?,assigned_device_id=?,"
    "status=?,job_status=?,progress=?,fail_reason=?,updated_at_ms=?,started_at_ms=?,finished_at_ms=?,"
    "locked_by=?,locked_until_ms=?,attempts=?,last_error=?"
    " WHERE id=?;";

static constexpr const char* DELETE_JOB =
    "DELETE FROM processing_jobs WHERE id=?;";

static constexpr const char* COUNT_JOBS_BY_STATUS =
    "SELECT job_status,status,COUNT(*) FROM processing_jobs GROUP BY job_status,status;";

static constexpr const char* SELECT_FINISHED_JOB_IDS =
    "SELECT id FROM processing_jobs"
    " WHERE job_status IN ('done','failed','canceled')"
    " AND finished_at_ms IS NOT NULL AND finished_at_ms < ?"
    " ORDER BY id ASC;";

// leasing

static constexpr const char* SELECT_NEXT_ACQUIRABLE =
    "SELECT " USBFORGE_JOB_COLUMNS " FROM processing_jobs"
    " WHERE job_status IN ('pending','retry')"
    " AND (locked_until_ms IS NULL OR locked_until_ms <= ?)"
    " AND attempts < ?"
    " ORDER BY created_at_ms ASC, id ASC LIMIT 1";

static constexpr const char* SELECT_EXPIRED_LEASES =
    "SELECT " USBFORGE_JOB_COLUMNS " FROM processing_jobs"
    " WHERE job_status IN ('processing','writing','verifying')"
    " AND locked_until_ms IS NOT NULL AND locked_until_ms <= ?"
    " ORDER BY id ASC";

static constexpr const char* SELECT_ACTIVE_LEASES =
    "SELECT " USBFORGE_JOB_COLUMNS " FROM processing_jobs"
    " WHERE locked_by IS NOT NULL AND locked_until_ms > ?"
    " ORDER BY locked_until_ms ASC;";

// job log

static constexpr const char* INSERT_LOG =
    "INSERT INTO processing_job_logs(job_id,level,category,message,details,file_path,file_size,error_code,"
    "correlation_id,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " RETURNING id;";

static constexpr const char* SELECT_LOGS =
    "SELECT " USBFORGE_LOG_COLUMNS " FROM processing_job_logs";

static constexpr const char* DELETE_LOGS_OLDER_THAN =
    "DELETE FROM processing_job_logs WHERE created_at_ms < ?;";

}
