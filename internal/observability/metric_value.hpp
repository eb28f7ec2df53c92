#pragma once

#include <string_view>

#include "internal/observability/metrics_registry.hpp"
#include "workbundle/v1.hpp"

namespace workbundle::observability {

/*
  Reads the single value of a metric family from a registry snapshot.

  COUNTER and GAUGE yield the value, HISTOGRAM the sample count.

  Throws:
    util::NotFound         - empty snapshot or no family with that name
    util::InvalidArgument  - family type differs or family has != 1 metric
    util::Unimplemented    - SUMMARY and UNTYPED
*/
double GetMetricValueSingle(const MetricsGatherer& gatherer, std::string_view name, workbundle::v1::MetricType type);

} // namespace workbundle::observability
