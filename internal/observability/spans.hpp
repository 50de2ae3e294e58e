#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace fieldwake::runtime::config {
class RuntimeConfig;
}

namespace fieldwake::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"fieldwake"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t export_interval_ms{1000};
};

OtlpConfig ToOtlpConfig(const fieldwake::runtime::config::RuntimeConfig& config);

bool InitializeTracing(const fieldwake::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const fieldwake::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. Without FIELDWAKE_ENABLE_OTEL every member is an inline no-op.
*/
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
#ifdef FIELDWAKE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

/*
  Process-wide instruments for the wake engine.
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);

  // newly_stored=false counts redelivered fragments absorbed by the store.
  void RecordFragment(bool newly_stored);
  void RecordFinalize(std::string_view outcome);
  void RecordCommand(std::string_view kind);
  void RecordExpiredTransfers(std::uint64_t count);

  // Indices named in one missing-fragment request.
  void RecordMissingIndices(std::uint64_t count);
  void ObserveUploadDurationMs(std::string_view store_kind, double duration_ms);

 private:
  Metrics();
#ifdef FIELDWAKE_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef FIELDWAKE_ENABLE_OTEL
inline bool InitializeTracing(const fieldwake::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const fieldwake::runtime::config::RuntimeConfig&) {
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

inline void Metrics::RecordFragment(bool) {
}

inline void Metrics::RecordFinalize(std::string_view) {
}

inline void Metrics::RecordCommand(std::string_view) {
}

inline void Metrics::RecordExpiredTransfers(std::uint64_t) {
}

inline void Metrics::RecordMissingIndices(std::uint64_t) {
}

inline void Metrics::ObserveUploadDurationMs(std::string_view, double) {
}
#endif

} // namespace fieldwake::observability
