#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

namespace macrelay::runtime::config {
class RuntimeConfig;
}

namespace macrelay::observability {

/*
  Gateway metrics exported over OTLP when built with ENABLE_OTEL.
  Without it every call below compiles to nothing.

  Instruments:
    macrelay.request.count / .latency_ms   per RPC route
    macrelay.probe.duration_ms             one MAC selection round
    macrelay.stream.outcome                how each stream request ended
    macrelay.job.count                     refresh jobs by type
    macrelay.sessions.active               gauge, kind "occupied" or "hls"
*/

// Returns false when metrics are disabled in config or not compiled in.
bool InitializeMetrics(const macrelay::runtime::config::RuntimeConfig& config);
void ShutdownMetrics();

class Metrics {
 public:
  static Metrics& Instance();

  void RecordRequest(std::string_view route, bool success);
  void ObserveRequestLatencyMs(std::string_view route, double latency_ms);
  void ObserveProbeDurationMs(std::string_view outcome, double duration_ms);
  void RecordStreamOutcome(std::string_view outcome);
  void RecordJob(std::string_view type, bool success);
  void SetActiveSessions(std::string_view kind, std::int64_t count);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Instruments;
  std::unique_ptr<Instruments> instruments_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeMetrics(const macrelay::runtime::config::RuntimeConfig&) {
  return false;
}
inline void ShutdownMetrics() {
}
inline Metrics::Metrics() = default;
inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}
inline void Metrics::RecordRequest(std::string_view, bool) {
}
inline void Metrics::ObserveRequestLatencyMs(std::string_view, double) {
}
inline void Metrics::ObserveProbeDurationMs(std::string_view, double) {
}
inline void Metrics::RecordStreamOutcome(std::string_view) {
}
inline void Metrics::RecordJob(std::string_view, bool) {
}
inline void Metrics::SetActiveSessions(std::string_view, std::int64_t) {
}
#endif

} // namespace macrelay::observability
