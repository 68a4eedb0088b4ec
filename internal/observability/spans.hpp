#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace shipyard::runtime::config {
class RuntimeConfig;
}

namespace shipyard::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

// Exporter settings shared by the trace and metric pipelines.
struct OtlpConfig {
  std::string   service_name{"shipyard"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

#ifdef ENABLE_OTEL
OtlpConfig OtlpConfigFrom(const shipyard::runtime::config::RuntimeConfig& config);

// signal is "traces" or "metrics"; consults OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT
// and OTEL_EXPORTER_OTLP_ENDPOINT before the transport default.
std::string ResolveOtlpEndpoint(const OtlpConfig& config, std::string_view signal);
#endif

bool InitializeTracing(const shipyard::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const shipyard::runtime::config::RuntimeConfig& config);
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
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveGatewayLatencyMs(double latency_ms, bool success);
  void RecordDeployOutcome(std::string_view status);
  void RecordGuardDenial(std::string_view kind);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const shipyard::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const shipyard::runtime::config::RuntimeConfig&) {
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

inline void Metrics::ObserveGatewayLatencyMs(double, bool) {
}

inline void Metrics::RecordDeployOutcome(std::string_view) {
}

inline void Metrics::RecordGuardDenial(std::string_view) {
}
#endif

} // namespace shipyard::observability
