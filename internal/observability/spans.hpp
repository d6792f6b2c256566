#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace vesting::runtime::config {
class RuntimeConfig;
}

namespace vesting::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"vesting-ledger"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
};

bool InitializeTracing(const OtlpConfig& config = {});
bool InitializeMetrics(const OtlpConfig& config = {});
bool InitializeTracing(const vesting::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const vesting::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

// What a ledger RPC span is about. Empty fields are left off the span.
struct LedgerSpanTags {
  std::string_view ledger;     // "allocation", "vesting" or "admin"
  std::string_view caller;
  std::string_view record;     // "allocation" or "schedule"
  std::uint64_t    record_id = 0;
};

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
  void Tag(const LedgerSpanTags& tags);
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
  void RecordLedgerEvent(std::string_view ledger, std::string_view kind);
  void RecordAllocationSyncFailure(std::string_view op);
  void RecordUnrecordedEffect(std::string_view op);
  void SetRecordCount(std::string_view table, std::uint64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const OtlpConfig&) {
  return false;
}

inline bool InitializeMetrics(const OtlpConfig&) {
  return false;
}

inline bool InitializeTracing(const vesting::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const vesting::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::Tag(const LedgerSpanTags&) {
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

inline void Metrics::RecordLedgerEvent(std::string_view, std::string_view) {
}

inline void Metrics::RecordAllocationSyncFailure(std::string_view) {
}

inline void Metrics::RecordUnrecordedEffect(std::string_view) {
}

inline void Metrics::SetRecordCount(std::string_view, std::uint64_t) {
}
#endif

} // namespace vesting::observability
