#include "internal/observability/metrics_registry.hpp"

#include <opentelemetry/context/context.h>
#include <opentelemetry/metrics/async_instruments.h>
#include <opentelemetry/metrics/meter.h>
#include <opentelemetry/metrics/observer_result.h>
#include <opentelemetry/metrics/sync_instruments.h>
#include <opentelemetry/sdk/metrics/data/metric_data.h>
#include <opentelemetry/sdk/metrics/data/point_data.h>
#include <opentelemetry/sdk/metrics/export/metric_producer.h>
#include <opentelemetry/sdk/metrics/instruments.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>
#include <opentelemetry/sdk/metrics/metric_reader.h>
#include <opentelemetry/sdk/metrics/view/view_registry.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace workbundle::observability {

namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

using namespace workbundle::v1;

namespace {

constexpr const char* kMeterName    = "workbundle";
constexpr const char* kMeterVersion = "0.1.0";

// Pull-only reader; Gather() drives collection.
class CollectingReader final : public sdkmetrics::MetricReader {
 public:
  sdkmetrics::AggregationTemporality GetAggregationTemporality(sdkmetrics::InstrumentType) const noexcept override {
    return sdkmetrics::AggregationTemporality::kCumulative;
  }

 private:
  bool OnForceFlush(std::chrono::microseconds) noexcept override {
    return true;
  }

  bool OnShutDown(std::chrono::microseconds) noexcept override {
    return true;
  }
};

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

double ToDouble(const sdkmetrics::ValueType& value) {
  if (opentelemetry::nostd::holds_alternative<double>(value)) {
    return opentelemetry::nostd::get<double>(value);
  }
  return static_cast<double>(opentelemetry::nostd::get<std::int64_t>(value));
}

bool IsMonotonic(sdkmetrics::InstrumentType type) {
  return type == sdkmetrics::InstrumentType::kCounter || type == sdkmetrics::InstrumentType::kObservableCounter;
}

void FillHistogram(const sdkmetrics::HistogramPointData& point, HistogramValue* out) {
  out->set_sample_count(point.count_);
  out->set_sample_sum(ToDouble(point.sum_));

  std::uint64_t cumulative = 0;
  for (std::size_t i = 0; i < point.boundaries_.size() && i < point.counts_.size(); ++i) {
    cumulative += point.counts_[i];
    auto* bucket = out->add_buckets();
    bucket->set_upper_bound(point.boundaries_[i]);
    bucket->set_cumulative_count(cumulative);
  }
}

// Returns false for data with no recorded points.
bool ToFamily(const sdkmetrics::MetricData& data, MetricFamily* family) {
  if (data.point_data_attr_.empty()) {
    return false;
  }

  family->set_name(data.instrument_descriptor.name_);
  family->set_help(data.instrument_descriptor.description_);

  for (const auto& point : data.point_data_attr_) {
    auto* metric = family->add_metric();

    if (opentelemetry::nostd::holds_alternative<sdkmetrics::SumPointData>(point.point_data)) {
      const auto value = ToDouble(opentelemetry::nostd::get<sdkmetrics::SumPointData>(point.point_data).value_);
      if (IsMonotonic(data.instrument_descriptor.type_)) {
        family->set_type(METRIC_TYPE_COUNTER);
        metric->mutable_counter()->set_value(value);
      } else {
        family->set_type(METRIC_TYPE_GAUGE);
        metric->mutable_gauge()->set_value(value);
      }
    } else if (opentelemetry::nostd::holds_alternative<sdkmetrics::LastValuePointData>(point.point_data)) {
      family->set_type(METRIC_TYPE_GAUGE);
      metric->mutable_gauge()->set_value(
          ToDouble(opentelemetry::nostd::get<sdkmetrics::LastValuePointData>(point.point_data).value_));
    } else if (opentelemetry::nostd::holds_alternative<sdkmetrics::HistogramPointData>(point.point_data)) {
      family->set_type(METRIC_TYPE_HISTOGRAM);
      FillHistogram(opentelemetry::nostd::get<sdkmetrics::HistogramPointData>(point.point_data), metric->mutable_histogram());
    } else {
      family->set_type(METRIC_TYPE_UNTYPED);
      metric->mutable_untyped();
    }
  }
  return true;
}

} // namespace

struct MetricsRegistry::Impl {
  struct Instrument {
    MetricType type{METRIC_TYPE_UNTYPED};

    opentelemetry::nostd::shared_ptr<metrics_api::Counter<double>>    counter;
    opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>  histogram;
    opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument> gauge;

    // Read by the gauge callback during collection.
    std::unique_ptr<std::atomic<double>> gauge_value;
  };

  std::mutex mutex;

  std::shared_ptr<sdkmetrics::MeterProvider>           provider;
  CollectingReader*                                    reader{nullptr};
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  std::map<std::string, Instrument, std::less<>> instruments;

  Instrument& InstrumentFor(std::string_view name, MetricType type) {
    auto it = instruments.find(name);
    if (it != instruments.end()) {
      if (it->second.type != type) {
        throw util::InvalidArgument("metric " + std::string(name) + " is registered as " + MetricType_Name(it->second.type) +
                                    ", not " + MetricType_Name(type));
      }
      return it->second;
    }

    Instrument instrument;
    instrument.type = type;
    switch (type) {
      case METRIC_TYPE_COUNTER:
        instrument.counter = meter->CreateDoubleCounter(std::string(name));
        break;
      case METRIC_TYPE_HISTOGRAM:
        instrument.histogram = meter->CreateDoubleHistogram(std::string(name));
        break;
      case METRIC_TYPE_GAUGE:
        instrument.gauge_value = std::make_unique<std::atomic<double>>(0.0);
        instrument.gauge       = meter->CreateDoubleObservableGauge(std::string(name));
        instrument.gauge->AddCallback(
            [](metrics_api::ObserverResult result, void* state) {
              const auto* value = static_cast<const std::atomic<double>*>(state);
              auto observer =
                  opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<double>>>(result);
              observer->Observe(value->load());
            },
            instrument.gauge_value.get());
        break;
      default:
        throw util::InvalidArgument("unsupported instrument type " + MetricType_Name(type));
    }
    return instruments.emplace(std::string(name), std::move(instrument)).first->second;
  }
};

MetricsRegistry::MetricsRegistry() : impl_(std::make_unique<Impl>()) {
  impl_->provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()));

  auto reader    = std::make_unique<CollectingReader>();
  impl_->reader  = reader.get();
  AddMetricReaderCompat(impl_->provider, std::move(reader));

  impl_->meter = impl_->provider->GetMeter(kMeterName, kMeterVersion);
}

MetricsRegistry::~MetricsRegistry() {
  // instruments go before the provider that owns their storage
  impl_->instruments.clear();
  impl_->meter = nullptr;
}

void MetricsRegistry::IncrementCounter(std::string_view name, double delta) {
  if (delta < 0) {
    throw util::InvalidArgument("counter " + std::string(name) + " cannot decrease");
  }
  std::scoped_lock lock(impl_->mutex);
  impl_->InstrumentFor(name, METRIC_TYPE_COUNTER).counter->Add(delta);
}

void MetricsRegistry::SetGauge(std::string_view name, double value) {
  std::scoped_lock lock(impl_->mutex);
  impl_->InstrumentFor(name, METRIC_TYPE_GAUGE).gauge_value->store(value);
}

void MetricsRegistry::ObserveHistogram(std::string_view name, double value) {
  std::scoped_lock lock(impl_->mutex);
  impl_->InstrumentFor(name, METRIC_TYPE_HISTOGRAM).histogram->Record(value, opentelemetry::context::Context{});
}

std::vector<MetricFamily> MetricsRegistry::Gather() const {
  std::vector<MetricFamily> families;

  // not under the mutex: collection runs the gauge callbacks
  impl_->reader->Collect([&families](sdkmetrics::ResourceMetrics& resource_metrics) {
    for (const auto& scope : resource_metrics.scope_metric_data_) {
      for (const auto& data : scope.metric_data_) {
        MetricFamily family;
        if (ToFamily(data, &family)) {
          families.push_back(std::move(family));
        }
      }
    }
    return true;
  });

  std::sort(families.begin(), families.end(), [](const MetricFamily& lhs, const MetricFamily& rhs) { return lhs.name() < rhs.name(); });
  return families;
}

} // namespace workbundle::observability
