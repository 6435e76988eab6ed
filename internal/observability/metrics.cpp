#include "internal/observability/spans.hpp"

#ifdef HOSTING_ENABLE_OTEL

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

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <initializer_list>
#include <memory>
#include <utility>

#include "config/config.pb.h"

namespace hosting::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

struct MetricsOptions {
  bool request_metrics_enabled{true};
  bool request_latency_histograms_enabled{true};
  bool route_labels_enabled{true};
  bool proxy_metrics_enabled{true};
};

MetricsOptions g_metrics_options;

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

resource::Resource BuildResource(const OtlpConfig& config) {
  resource::ResourceAttributes attrs = {{"service.name", config.service_name}};
  return resource::Resource::Create(attrs);
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> request_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      request_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> proxy_operations;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   redirect_entries_gauge;

  std::atomic<std::int64_t> redirect_entries{0};
};

bool InitializeMetrics(const hosting::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  OtlpConfig otlp_config;
  otlp_config.endpoint  = observability.otlp_endpoint();
  otlp_config.transport = observability.transport() == hosting::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf
                                                                                                     : OtlpTransport::kGrpc;

  auto endpoint = ResolveEndpoint(otlp_config);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  const auto&                                      metric_config = observability.metrics();
  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(std::max<std::uint32_t>(metric_config.collection_interval_ms(), 1000));
  if (metric_config.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(metric_config.export_timeout_ms());
  }
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           BuildResource(otlp_config));
  g_provider->AddMetricReader(std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_metrics_options.request_metrics_enabled            = metric_config.request_metrics_enabled();
  g_metrics_options.request_latency_histograms_enabled = metric_config.request_latency_histograms_enabled();
  g_metrics_options.route_labels_enabled               = metric_config.route_labels_enabled();
  g_metrics_options.proxy_metrics_enabled              = metric_config.proxy_metrics_enabled();

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
  impl_->meter  = provider->GetMeter("hosting-controller", "0.1.0");

  impl_->request_count      = impl_->meter->CreateUInt64Counter("hosting.request.count", "Total number of API requests", "1");
  impl_->request_latency_ms = impl_->meter->CreateDoubleHistogram("hosting.request.latency_ms", "API request latency in milliseconds", "ms");
  impl_->proxy_operations =
      impl_->meter->CreateUInt64Counter("hosting.proxy.operations", "Proxy start, reload, rollback and restart attempts", "1");
  impl_->redirect_entries_gauge =
      impl_->meter->CreateInt64ObservableGauge("hosting.redirect.entries", "Live entries in the redirect table", "1");
  impl_->redirect_entries_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->redirect_entries.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  if (!impl_ || !impl_->request_count || !g_metrics_options.request_metrics_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    impl_->request_count->Add(1, std::initializer_list<AttributePair>{{"route", std::string(route)}, {"success", success}},
                              opentelemetry::context::Context{});
    return;
  }
  impl_->request_count->Add(1, std::initializer_list<AttributePair>{{"success", success}}, opentelemetry::context::Context{});
}

void Metrics::ObserveRequestLatencyMs(std::string_view route, double latency_ms) {
  if (!impl_ || !impl_->request_latency_ms || !g_metrics_options.request_metrics_enabled ||
      !g_metrics_options.request_latency_histograms_enabled) {
    return;
  }

  if (g_metrics_options.route_labels_enabled) {
    impl_->request_latency_ms->Record(latency_ms, std::initializer_list<AttributePair>{{"route", std::string(route)}},
                                      opentelemetry::context::Context{});
    return;
  }
  impl_->request_latency_ms->Record(latency_ms, std::initializer_list<AttributePair>{}, opentelemetry::context::Context{});
}

void Metrics::RecordProxyOperation(std::string_view operation, bool success) {
  if (!impl_ || !impl_->proxy_operations || !g_metrics_options.proxy_metrics_enabled) {
    return;
  }

  impl_->proxy_operations->Add(1, std::initializer_list<AttributePair>{{"operation", std::string(operation)}, {"success", success}},
                               opentelemetry::context::Context{});
}

void Metrics::SetRedirectEntries(std::uint64_t entries) {
  if (!impl_ || !g_metrics_options.proxy_metrics_enabled) {
    return;
  }
  impl_->redirect_entries = static_cast<std::int64_t>(entries);
}

} // namespace hosting::observability

#endif
