#include "internal/observability/metrics.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace macrelay::observability {

namespace otel     = opentelemetry;
namespace otlp     = opentelemetry::exporter::otlp;
namespace api      = opentelemetry::metrics;
namespace sdk      = opentelemetry::sdk::metrics;
namespace resource = opentelemetry::sdk::resource;

namespace {

using Attribute  = std::pair<otel::nostd::string_view, otel::common::AttributeValue>;
using Attributes = std::initializer_list<Attribute>;

constexpr std::uint32_t kDefaultCollectionIntervalMs = 1000;

// Per-family switches from observability.metrics; read on every record call.
struct Switches {
  std::atomic<bool> requests{true};
  std::atomic<bool> probes{true};
  std::atomic<bool> jobs{true};
  std::atomic<bool> sessions{true};
  std::atomic<bool> route_labels{true};
};

Switches                             g_switches;
std::shared_ptr<sdk::MeterProvider> g_provider;

bool UsesHttp(const macrelay::runtime::config::ObservabilityConfig& config) {
  return config.transport() == macrelay::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string Endpoint(const macrelay::runtime::config::ObservabilityConfig& config) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name); value != nullptr && *value != '\0') {
      return value;
    }
  }
  return UsesHttp(config) ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdk::PushMetricExporter> MakeExporter(const macrelay::runtime::config::ObservabilityConfig& config) {
  if (UsesHttp(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = Endpoint(config);
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = Endpoint(config);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

sdk::PeriodicExportingMetricReaderOptions MakeReaderOptions(const macrelay::runtime::config::MetricsConfig& config) {
  const auto interval_ms = config.collection_interval_ms() > 0 ? config.collection_interval_ms() : kDefaultCollectionIntervalMs;

  sdk::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis = std::chrono::milliseconds(std::max(config.min_collection_interval_ms(), interval_ms));
  if (config.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(config.export_timeout_ms());
  }
  return options;
}

// The SDK changed AddMetricReader and the instrument signatures between
// releases; these pick whichever overload the installed version has.
template <typename Provider>
void AttachReader(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdk::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdk::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value>
void Add(const otel::nostd::shared_ptr<Instrument>& counter, Value value, Attributes attributes) {
  if constexpr (requires { counter->Add(value, attributes, otel::context::Context{}); }) {
    counter->Add(value, attributes, otel::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

template <typename Instrument, typename Value>
void Record(const otel::nostd::shared_ptr<Instrument>& histogram, Value value, Attributes attributes) {
  if constexpr (requires { histogram->Record(value, attributes, otel::context::Context{}); }) {
    histogram->Record(value, attributes, otel::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

} // namespace

struct Metrics::Instruments {
  otel::nostd::shared_ptr<api::Meter> meter;

  otel::nostd::shared_ptr<api::Counter<std::uint64_t>> requests;
  otel::nostd::shared_ptr<api::Histogram<double>>      request_latency_ms;
  otel::nostd::shared_ptr<api::Histogram<double>>      probe_duration_ms;
  otel::nostd::shared_ptr<api::Counter<std::uint64_t>> stream_outcomes;
  otel::nostd::shared_ptr<api::Counter<std::uint64_t>> jobs;
  otel::nostd::shared_ptr<api::ObservableInstrument>   sessions;

  std::mutex                          sessions_mutex;
  std::map<std::string, std::int64_t> session_counts;
};

bool InitializeMetrics(const macrelay::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto& families = observability.metrics();
  g_switches.requests     = families.request_metrics_enabled();
  g_switches.probes       = families.probe_metrics_enabled();
  g_switches.jobs         = families.job_metrics_enabled();
  g_switches.sessions     = families.session_gauges_enabled();
  g_switches.route_labels = families.route_labels_enabled();

  auto reader = sdk::PeriodicExportingMetricReaderFactory::Create(MakeExporter(observability), MakeReaderOptions(families));

  resource::ResourceAttributes attributes = {{"service.name", std::string("macrelay")}};
  g_provider = std::make_shared<sdk::MeterProvider>(std::make_unique<sdk::ViewRegistry>(), resource::Resource::Create(attributes));
  AttachReader(g_provider, std::move(reader));

  api::Provider::SetMeterProvider(otel::nostd::shared_ptr<api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (!g_provider) {
    return;
  }
  g_provider->ForceFlush();
  g_provider->Shutdown();
  g_provider.reset();
}

Metrics::Metrics() : instruments_(std::make_unique<Instruments>()) {
  auto& in = *instruments_;
  in.meter = api::Provider::GetMeterProvider()->GetMeter("macrelay", "0.1.0");

  in.requests           = in.meter->CreateUInt64Counter("macrelay.request.count", "RPC requests by route", "1");
  in.request_latency_ms = in.meter->CreateDoubleHistogram("macrelay.request.latency_ms", "RPC latency", "ms");
  in.probe_duration_ms  = in.meter->CreateDoubleHistogram("macrelay.probe.duration_ms", "MAC selection round duration", "ms");
  in.stream_outcomes    = in.meter->CreateUInt64Counter("macrelay.stream.outcome", "Stream requests by final outcome", "1");
  in.jobs               = in.meter->CreateUInt64Counter("macrelay.job.count", "Refresh job executions", "1");
  in.sessions           = in.meter->CreateInt64ObservableGauge("macrelay.sessions.active", "Live stream sessions", "1");

  in.sessions->AddCallback(
      [](api::ObserverResult result, void* state) {
        auto& self     = *static_cast<Instruments*>(state);
        auto  observer = otel::nostd::get<otel::nostd::shared_ptr<api::ObserverResultT<std::int64_t>>>(result);

        std::lock_guard lock(self.sessions_mutex);
        for (const auto& [kind, count] : self.session_counts) {
          observer->Observe(count, Attributes{{"kind", kind}});
        }
      },
      instruments_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!g_switches.requests) return;

  const std::string label(route);
  if (g_switches.route_labels) {
    Add(instruments_->requests, std::uint64_t{1}, {{"route", label}, {"success", success}});
  } else {
    Add(instruments_->requests, std::uint64_t{1}, {{"success", success}});
  }
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!g_switches.requests) return;

  const std::string label(route);
  if (g_switches.route_labels) {
    Record(instruments_->request_latency_ms, latency_ms, {{"route", label}});
  } else {
    Record(instruments_->request_latency_ms, latency_ms, {});
  }
}

void Metrics::ObserveProbeDurationMs(std::string_view outcome, double duration_ms) {
  if (!g_switches.probes) return;

  const std::string label(outcome);
  Record(instruments_->probe_duration_ms, duration_ms, {{"outcome", label}});
}

void Metrics::RecordStreamOutcome(std::string_view outcome) {
  if (!g_switches.probes) return;

  const std::string label(outcome);
  Add(instruments_->stream_outcomes, std::uint64_t{1}, {{"outcome", label}});
}

void Metrics::RecordJob(std::string_view type, bool success) {
  if (!g_switches.jobs) return;

  const std::string label(type);
  Add(instruments_->jobs, std::uint64_t{1}, {{"type", label}, {"success", success}});
}

void Metrics::SetActiveSessions(std::string_view kind, std::int64_t count) {
  if (!g_switches.sessions) return;

  std::lock_guard lock(instruments_->sessions_mutex);
  instruments_->session_counts[std::string(kind)] = count;
}

} // namespace macrelay::observability

#endif
