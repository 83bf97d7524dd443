#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace workledger::runtime::config {
class RuntimeConfig;
}

namespace workledger::observability {

/*
  Tracing + metrics facade.

  Built with ENABLE_OTEL the calls export over OTLP; without it every
  call below is an inline no-op.
*/

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"workledger"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

OtlpConfig ToOtlpConfig(const workledger::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const workledger::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const workledger::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
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

  // status the job moved into (claimed jobs count as "processing")
  void RecordJobTransition(std::string_view status);

  // direction is "debit" or "credit"; amount is the magnitude
  void RecordLedgerAmount(std::string_view direction, std::int64_t amount);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline OtlpConfig ToOtlpConfig(const workledger::runtime::config::RuntimeConfig&) {
  return {};
}

inline bool InitializeTracing(const workledger::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const workledger::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
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

inline void Metrics::RecordJobTransition(std::string_view) {
}

inline void Metrics::RecordLedgerAmount(std::string_view, std::int64_t) {
}
#endif

} // namespace workledger::observability
