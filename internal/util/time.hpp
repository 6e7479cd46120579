#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

#include "google/protobuf/duration.pb.h"

namespace usbforge::util {

/*
  Time utilities. Single place to control the clock source.

  Persistent timestamps are stored as unix epoch milliseconds,
  0 meaning "unset".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using ClockFn   = std::function<TimePoint()>;

TimePoint Now();

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);
uint64_t  NowMs();

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d);

// RFC3339 UTC, millisecond precision. Empty for 0.
std::string FormatMillis(uint64_t ms);

} // namespace usbforge::util
