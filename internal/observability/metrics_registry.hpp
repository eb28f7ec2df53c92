#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "workbundle/v1.hpp"

namespace workbundle::observability {

/*
  Source of a metrics snapshot. Handed to lookups explicitly instead of
  reaching for a process-wide registry.
*/
class MetricsGatherer {
 public:
  virtual ~MetricsGatherer() = default;

  virtual std::vector<workbundle::v1::MetricFamily> Gather() const = 0;
};

/*
  Unlabeled counters, gauges and histograms recorded through an OpenTelemetry
  MeterProvider owned by this registry. Gather() collects the provider with
  cumulative temporality and converts the result to MetricFamily snapshots.

  A name is bound to one type on first use; using it as another type throws
  util::InvalidArgument. Instruments that never recorded a value are absent
  from the snapshot.
*/
class MetricsRegistry final : public MetricsGatherer {
 public:
  MetricsRegistry();
  ~MetricsRegistry() override;

  MetricsRegistry(const MetricsRegistry&)            = delete;
  MetricsRegistry& operator=(const MetricsRegistry&) = delete;

  void IncrementCounter(std::string_view name, double delta = 1.0);
  void SetGauge(std::string_view name, double value);
  void ObserveHistogram(std::string_view name, double value);

  // Families sorted by name, one metric each.
  std::vector<workbundle::v1::MetricFamily> Gather() const override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace workbundle::observability
