#include "internal/observability/metric_value.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace workbundle::observability {

using namespace workbundle::v1;

namespace {

MetricFamily FindFamily(const MetricsGatherer& gatherer, std::string_view name) {
  auto families = gatherer.Gather();
  if (families.empty()) {
    throw util::NotFound("metrics registry snapshot is empty");
  }

  // linear scan; snapshots are small
  for (auto& family : families) {
    if (family.name() == name) {
      return std::move(family);
    }
  }
  throw util::NotFound("no metric family named " + std::string(name));
}

double ValueByType(const MetricFamily& family, MetricType type) {
  if (family.type() != type) {
    throw util::InvalidArgument("metric " + family.name() + " has type " + MetricType_Name(family.type()) + ", wanted " +
                                MetricType_Name(type));
  }
  if (family.metric_size() != 1) {
    throw util::InvalidArgument("metric " + family.name() + " holds " + std::to_string(family.metric_size()) +
                                " series; only single-series families are supported");
  }

  const auto& metric = family.metric(0);
  switch (type) {
    case METRIC_TYPE_COUNTER:
      return metric.counter().value();
    case METRIC_TYPE_GAUGE:
      return metric.gauge().value();
    case METRIC_TYPE_HISTOGRAM:
      return static_cast<double>(metric.histogram().sample_count());
    case METRIC_TYPE_SUMMARY:
    case METRIC_TYPE_UNTYPED:
    default:
      throw util::Unimplemented("metric type " + MetricType_Name(type) + " is not supported yet");
  }
}

} // namespace

double GetMetricValueSingle(const MetricsGatherer& gatherer, std::string_view name, MetricType type) {
  return ValueByType(FindFamily(gatherer, name), type);
}

} // namespace workbundle::observability
