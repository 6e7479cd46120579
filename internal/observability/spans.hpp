#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace usbforge::runtime::config {
class RuntimeConfig;
}

namespace usbforge::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"usbforge"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

// Both return false when the build or the config leaves them off.
bool InitializeTracing(const usbforge::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const usbforge::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments:
  - usbforge.request.count / usbforge.request.latency_ms  (JobService routes)
  - usbforge.lease.events                                 (acquired, released, reclaimed, lost)
  - usbforge.job.duration_ms                              (by outcome)
  - usbforge.copy.bytes
  - usbforge.worker.active_jobs                           (gauge, by worker)
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void RecordLeaseEvent(std::string_view event);
  void ObserveJobDurationMs(std::string_view outcome, double duration_ms);
  void AddCopiedBytes(std::uint64_t bytes);
  void SetActiveJobs(std::string_view worker_id, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const usbforge::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const usbforge::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}

inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}

inline void Metrics::RecordLeaseEvent(std::string_view) {
}

inline void Metrics::ObserveJobDurationMs(std::string_view, double) {
}

inline void Metrics::AddCopiedBytes(std::uint64_t) {
}

inline void Metrics::SetActiveJobs(std::string_view, std::uint64_t) {
}
#endif

} // namespace usbforge::observability
