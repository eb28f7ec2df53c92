#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <cstdlib>
#include <mutex>
#include <string>
#include <utility>

#include "config/config.pb.h"

namespace workbundle::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using workbundle::runtime::config::ObservabilityConfig;

namespace {

constexpr const char* kInstrumentationName    = "workbundle.work";
constexpr const char* kInstrumentationVersion = "0.1.0";

struct TracerState {
  std::mutex                                          mutex;
  std::shared_ptr<sdktrace::TracerProvider>           provider;
  opentelemetry::nostd::shared_ptr<trace_api::Tracer> tracer;
};

TracerState& State() {
  static TracerState state;
  return state;
}

opentelemetry::nostd::shared_ptr<trace_api::Tracer> CurrentTracer() {
  auto& state = State();
  std::scoped_lock lock(state.mutex);
  return state.tracer;
}

// The config endpoint wins over the standard OTLP environment variables.
std::string Endpoint(const ObservabilityConfig& config, bool http) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }
  for (const char* name : {"OTEL_EXPORTER_OTLP_TRACES_ENDPOINT", "OTEL_EXPORTER_OTLP_ENDPOINT"}) {
    if (const char* value = std::getenv(name)) {
      return value;
    }
  }
  return http ? "http://localhost:4318/v1/traces" : "localhost:4317";
}

std::unique_ptr<sdktrace::SpanExporter> MakeExporter(const ObservabilityConfig& config) {
  const bool http = config.transport() == workbundle::runtime::config::OTLP_TRANSPORT_HTTP;
  if (http) {
    otlp::OtlpHttpExporterOptions options;
    options.url = Endpoint(config, true);
    return otlp::OtlpHttpExporterFactory::Create(options);
  }
  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = Endpoint(config, false);
  options.use_ssl_credentials = false;
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

resource::Resource ServiceResource(const ObservabilityConfig& config) {
  const std::string service_name = config.service_name().empty() ? "workbundle" : config.service_name();
  return resource::Resource::Create(resource::ResourceAttributes{{"service.name", service_name}});
}

} // namespace

bool InitializeTracing(const ObservabilityConfig& config) {
  ShutdownTracing();
  if (!config.tracing_enabled()) {
    return false;
  }

  auto processor = sdktrace::BatchSpanProcessorFactory::Create(MakeExporter(config), sdktrace::BatchSpanProcessorOptions{});
  std::shared_ptr<sdktrace::TracerProvider> provider =
      sdktrace::TracerProviderFactory::Create(std::move(processor), ServiceResource(config));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(provider));

  auto& state = State();
  std::scoped_lock lock(state.mutex);
  state.provider = std::move(provider);
  state.tracer   = state.provider->GetTracer(kInstrumentationName, kInstrumentationVersion);
  return static_cast<bool>(state.tracer);
}

void ShutdownTracing() {
  std::shared_ptr<sdktrace::TracerProvider> provider;
  {
    auto& state = State();
    std::scoped_lock lock(state.mutex);
    provider = std::move(state.provider);
    state.tracer = nullptr;
  }
  if (provider) {
    provider->ForceFlush();
    provider->Shutdown();
  }
}

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view operation, std::string_view bundle, std::string_view location) {
  auto tracer = CurrentTracer();
  if (!tracer) {
    return;
  }

  impl_        = std::make_unique<Impl>();
  impl_->span  = tracer->StartSpan(std::string(operation));
  impl_->span->SetAttribute("bundle.name", std::string(bundle));
  impl_->span->SetAttribute("bundle.location", std::string(location));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_) {
    impl_->span->End();
  }
}

void SpanScope::SetOutcome(std::string_view outcome) {
  if (impl_) {
    impl_->span->SetAttribute("bundle.outcome", std::string(outcome));
  }
}

void SpanScope::RecordException(std::string_view description) {
  if (impl_) {
    impl_->span->AddEvent("exception", {{"exception.message", std::string(description)}});
    impl_->span->SetStatus(trace_api::StatusCode::kError, std::string(description));
  }
}

} // namespace workbundle::observability

#endif
