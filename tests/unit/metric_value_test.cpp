#include <cassert>
#include <cstdint>
#include <iostream>
#include <utility>
#include <vector>

#include "internal/observability/metric_value.hpp"
#include "internal/observability/metrics_registry.hpp"
#include "internal/util/errors.hpp"

namespace {

using workbundle::observability::GetMetricValueSingle;
using workbundle::observability::MetricsGatherer;
using workbundle::observability::MetricsRegistry;

class StaticGatherer final : public MetricsGatherer {
 public:
  explicit StaticGatherer(std::vector<workbundle::v1::MetricFamily> families) : families_(std::move(families)) {
  }

  std::vector<workbundle::v1::MetricFamily> Gather() const override {
    return families_;
  }

 private:
  std::vector<workbundle::v1::MetricFamily> families_;
};

template <typename Exception, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Exception&) {
    return true;
  }
  return false;
}

void TestCounterValue() {
  MetricsRegistry registry;
  registry.IncrementCounter("converge_total");
  registry.IncrementCounter("converge_total", 2.0);
  assert(GetMetricValueSingle(registry, "converge_total", workbundle::v1::METRIC_TYPE_COUNTER) == 3.0);
}

void TestGaugeValue() {
  MetricsRegistry registry;
  registry.SetGauge("bundles", 4.0);
  registry.SetGauge("bundles", 2.5);
  assert(GetMetricValueSingle(registry, "bundles", workbundle::v1::METRIC_TYPE_GAUGE) == 2.5);
}

void TestHistogramYieldsSampleCount() {
  MetricsRegistry registry;
  registry.ObserveHistogram("latency_ms", 3.0);
  registry.ObserveHistogram("latency_ms", 300.0);
  assert(GetMetricValueSingle(registry, "latency_ms", workbundle::v1::METRIC_TYPE_HISTOGRAM) == 2.0);

  const auto families = registry.Gather();
  assert(families.size() == 1);
  assert(families[0].metric(0).histogram().sample_sum() == 303.0);
}

void TestHistogramBucketsAreCumulative() {
  MetricsRegistry registry;
  registry.ObserveHistogram("latency_ms", 3.0);
  registry.ObserveHistogram("latency_ms", 300.0);

  const auto families = registry.Gather();
  assert(families.size() == 1);
  const auto& histogram = families[0].metric(0).histogram();
  assert(histogram.buckets_size() > 0);
  for (const auto& bucket : histogram.buckets()) {
    const std::uint64_t expected = (3.0 <= bucket.upper_bound() ? 1 : 0) + (300.0 <= bucket.upper_bound() ? 1 : 0);
    assert(bucket.cumulative_count() == expected);
  }
}

void TestGaugeFollowsLatestValueBetweenGathers() {
  MetricsRegistry registry;
  registry.SetGauge("bundles", 4.0);
  assert(GetMetricValueSingle(registry, "bundles", workbundle::v1::METRIC_TYPE_GAUGE) == 4.0);
  registry.SetGauge("bundles", 1.0);
  assert(GetMetricValueSingle(registry, "bundles", workbundle::v1::METRIC_TYPE_GAUGE) == 1.0);
}

void TestEmptySnapshotIsNotFound() {
  MetricsRegistry registry;
  assert(Throws<workbundle::util::NotFound>(
      [&] { (void)GetMetricValueSingle(registry, "anything", workbundle::v1::METRIC_TYPE_COUNTER); }));
}

void TestMissingNameIsNotFound() {
  MetricsRegistry registry;
  registry.IncrementCounter("present");
  assert(Throws<workbundle::util::NotFound>(
      [&] { (void)GetMetricValueSingle(registry, "absent", workbundle::v1::METRIC_TYPE_COUNTER); }));
}

void TestTypeMismatchIsInvalidArgument() {
  MetricsRegistry registry;
  registry.SetGauge("bundles", 1.0);
  assert(Throws<workbundle::util::InvalidArgument>(
      [&] { (void)GetMetricValueSingle(registry, "bundles", workbundle::v1::METRIC_TYPE_COUNTER); }));
}

void TestMultiSeriesFamilyIsInvalidArgument() {
  workbundle::v1::MetricFamily family;
  family.set_name("requests");
  family.set_type(workbundle::v1::METRIC_TYPE_COUNTER);
  family.add_metric()->mutable_counter()->set_value(1.0);
  family.add_metric()->mutable_counter()->set_value(2.0);

  StaticGatherer gatherer({family});
  assert(Throws<workbundle::util::InvalidArgument>(
      [&] { (void)GetMetricValueSingle(gatherer, "requests", workbundle::v1::METRIC_TYPE_COUNTER); }));
}

void TestSummaryAndUntypedAreUnimplemented() {
  workbundle::v1::MetricFamily summary;
  summary.set_name("rpc_summary");
  summary.set_type(workbundle::v1::METRIC_TYPE_SUMMARY);
  summary.add_metric()->mutable_summary()->set_sample_count(1);

  workbundle::v1::MetricFamily untyped;
  untyped.set_name("raw");
  untyped.set_type(workbundle::v1::METRIC_TYPE_UNTYPED);
  untyped.add_metric()->mutable_untyped()->set_value(1.0);

  StaticGatherer gatherer({summary, untyped});
  assert(Throws<workbundle::util::Unimplemented>(
      [&] { (void)GetMetricValueSingle(gatherer, "rpc_summary", workbundle::v1::METRIC_TYPE_SUMMARY); }));
  assert(Throws<workbundle::util::Unimplemented>(
      [&] { (void)GetMetricValueSingle(gatherer, "raw", workbundle::v1::METRIC_TYPE_UNTYPED); }));
}

void TestRegistryRejectsTypeReuseAndNegativeCounters() {
  MetricsRegistry registry;
  registry.IncrementCounter("x");
  assert(Throws<workbundle::util::InvalidArgument>([&] { registry.SetGauge("x", 1.0); }));
  assert(Throws<workbundle::util::InvalidArgument>([&] { registry.IncrementCounter("x", -1.0); }));
}

void TestGatherIsSortedByName() {
  MetricsRegistry registry;
  registry.IncrementCounter("b_total");
  registry.IncrementCounter("a_total");
  const auto families = registry.Gather();
  assert(families.size() == 2);
  assert(families[0].name() == "a_total");
  assert(families[1].name() == "b_total");
}

} // namespace

int main() {
  TestCounterValue();
  TestGaugeValue();
  TestHistogramYieldsSampleCount();
  TestHistogramBucketsAreCumulative();
  TestGaugeFollowsLatestValueBetweenGathers();
  TestEmptySnapshotIsNotFound();
  TestMissingNameIsNotFound();
  TestTypeMismatchIsInvalidArgument();
  TestMultiSeriesFamilyIsInvalidArgument();
  TestSummaryAndUntypedAreUnimplemented();
  TestRegistryRejectsTypeReuseAndNegativeCounters();
  TestGatherIsSortedByName();

  std::cout << "workbundle_unit_metric_value: pass\n";
  return 0;
}
