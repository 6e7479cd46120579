#pragma once

#include <cstdint>
#include <optional>

#include <google/protobuf/timestamp.pb.h>

#include "internal/model/job.hpp"
#include "internal/model/job_log.hpp"
#include "usbforge/v1/job.pb.h"

namespace usbforge::service {

/*
  model <-> wire conversions. Zero epoch ms means "unset" and maps to an
  absent Timestamp.
*/

usbforge::v1::JobStatus ToProto(model::JobStatus status);
std::optional<model::JobStatus> FromProto(usbforge::v1::JobStatus status);

usbforge::v1::LogLevel ToProto(model::LogLevel level);
std::optional<model::LogLevel> FromProto(usbforge::v1::LogLevel level);

void ToProto(const model::Job& job, usbforge::v1::Job* out);
void ToProto(const model::JobLogEntry& entry, usbforge::v1::JobLogEntry* out);

// Level UNSPECIFIED becomes info; empty strings become absent optionals.
model::JobLogEntry FromProto(const usbforge::v1::JobLogEntry& entry);

uint64_t ToMillis(const google::protobuf::Timestamp& ts);

} // namespace usbforge::service
