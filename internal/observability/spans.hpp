#pragma once

#include <memory>
#include <string_view>

namespace workbundle::runtime::config {
class ObservabilityConfig;
}

namespace workbundle::observability {

/*
  One span per bundle operation, tagged with the bundle name and target
  location. Spans are exported over OTLP when built with ENABLE_OTEL and
  InitializeTracing() succeeded; every call below is a no-op otherwise.
*/

bool InitializeTracing(const workbundle::runtime::config::ObservabilityConfig& config);
void ShutdownTracing();

class SpanScope {
 public:
  SpanScope(std::string_view operation, std::string_view bundle, std::string_view location);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  void SetOutcome(std::string_view outcome);
  // Marks the span failed.
  void RecordException(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const workbundle::runtime::config::ObservabilityConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline SpanScope::SpanScope(std::string_view, std::string_view, std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline void SpanScope::SetOutcome(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}
#endif

} // namespace workbundle::observability
