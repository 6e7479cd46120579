#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace usbforge::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

uint64_t NowMs() {
  return ToUnixMillis(Now());
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

std::string FormatMillis(uint64_t ms) {
  if (ms == 0) return {};

  const std::time_t secs = static_cast<std::time_t>(ms / 1000);
  std::tm           utc{};
  gmtime_r(&secs, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (ms % 1000) << 'Z';
  return out.str();
}

} // namespace usbforge::util
