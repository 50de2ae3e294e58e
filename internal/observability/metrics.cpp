#include "internal/observability/spans.hpp"

#ifdef FIELDWAKE_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>
#include <opentelemetry/sdk/resource/resource.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace fieldwake::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::string ResolveEndpoint(const OtlpConfig& config) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? "http://localhost:4318/v1/metrics" : "localhost:4317";
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const OtlpConfig& config) {
  const auto endpoint = ResolveEndpoint(config);
  if (config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = !config.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> fragments;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> finalizations;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> commands;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> expired_transfers;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> missing_indices;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      upload_duration_ms;
};

bool InitializeMetrics(const fieldwake::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto otlp_config = ToOtlpConfig(config);

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.export_interval_ms);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(otlp_config), reader_options);

  auto resource_attrs = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource_attrs);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("fieldwake", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("fieldwake.request.count", "Total number of service requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("fieldwake.request.latency_ms", "End-to-end request latency in milliseconds", "ms");
  impl_->fragments          = impl_->meter->CreateUInt64Counter("fieldwake.fragments", "Fragments delivered, split by newly stored vs duplicate", "1");
  impl_->finalizations      = impl_->meter->CreateUInt64Counter("fieldwake.finalize.count", "Finalizer outcomes", "1");
  impl_->commands           = impl_->meter->CreateUInt64Counter("fieldwake.commands.count", "Directives published to devices", "1");
  impl_->expired_transfers  = impl_->meter->CreateUInt64Counter("fieldwake.transfers.expired", "Transfers failed by TTL sweep", "1");
  impl_->missing_indices    = impl_->meter->CreateUInt64Counter("fieldwake.fragments.rerequested", "Fragment indices named in missing requests", "1");
  impl_->upload_duration_ms = impl_->meter->CreateDoubleHistogram("fieldwake.artifact.upload_ms", "Artifact store write latency", "ms");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}, {"success", success}};
  AddWithAttributes(impl_->request_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"route", std::string(route)}};
  RecordWithAttributes(impl_->request_latency_ms, latency_ms, attributes);
}

void Metrics::RecordFragment(bool newly_stored) {
  if (!impl_ || !impl_->fragments) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"result", newly_stored ? "stored" : "duplicate"}};
  AddWithAttributes(impl_->fragments, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordFinalize(std::string_view outcome) {
  if (!impl_ || !impl_->finalizations) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"outcome", std::string(outcome)}};
  AddWithAttributes(impl_->finalizations, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordCommand(std::string_view kind) {
  if (!impl_ || !impl_->commands) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"kind", std::string(kind)}};
  AddWithAttributes(impl_->commands, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordExpiredTransfers(std::uint64_t count) {
  if (!impl_ || !impl_->expired_transfers || count == 0) {
    return;
  }
  AddWithAttributes(impl_->expired_transfers, count, std::initializer_list<AttributePair>{});
}

void Metrics::RecordMissingIndices(std::uint64_t count) {
  if (!impl_ || !impl_->missing_indices || count == 0) {
    return;
  }
  AddWithAttributes(impl_->missing_indices, count, std::initializer_list<AttributePair>{});
}

void Metrics::ObserveUploadDurationMs(std::string_view store_kind, double duration_ms) {
  if (!impl_ || !impl_->upload_duration_ms) {
    return;
  }
  const std::initializer_list<AttributePair> attributes = {{"store", std::string(store_kind)}};
  RecordWithAttributes(impl_->upload_duration_ms, duration_ms, attributes);
}

} // namespace fieldwake::observability

#endif
