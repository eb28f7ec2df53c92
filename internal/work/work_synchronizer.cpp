#include "internal/work/work_synchronizer.hpp"

#include <chrono>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics_registry.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/work/store_errors.hpp"
#include "internal/work/work_metrics.hpp"

namespace workbundle::work {

namespace {

std::string_view CounterFor(ConvergeOutcome outcome) {
  switch (outcome) {
    case ConvergeOutcome::kCreated:
      return kMetricConvergeCreated;
    case ConvergeOutcome::kUpdated:
      return kMetricConvergeUpdated;
    case ConvergeOutcome::kUnchanged:
      return kMetricConvergeUnchanged;
  }
  return kMetricConvergeUnchanged;
}

} // namespace

const char* ToString(ConvergeOutcome outcome) {
  switch (outcome) {
    case ConvergeOutcome::kCreated:
      return "created";
    case ConvergeOutcome::kUnchanged:
      return "unchanged";
    case ConvergeOutcome::kUpdated:
      return "updated";
  }
  return "unknown";
}

bool ManifestsEqual(const google::protobuf::RepeatedPtrField<workbundle::v1::Manifest>& lhs,
                    const google::protobuf::RepeatedPtrField<workbundle::v1::Manifest>& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  for (int i = 0; i < lhs.size(); ++i) {
    if (lhs.Get(i).kind() != rhs.Get(i).kind() || lhs.Get(i).raw() != rhs.Get(i).raw()) {
      return false;
    }
  }
  return true;
}

WorkSynchronizer::WorkSynchronizer(std::shared_ptr<store::BundleStore>             store,
                                   std::shared_ptr<observability::MetricsRegistry> metrics)
    : store_(std::move(store)), metrics_(std::move(metrics)) {
  if (!store_) {
    throw util::InvalidArgument("work synchronizer requires a bundle store");
  }
  if (!store_->EnforcesVersionedUpdates()) {
    throw util::InvalidState("bundle store does not enforce versioned updates; refusing to converge over it");
  }
}

ConvergeOutcome WorkSynchronizer::Converge(const store::CallContext& ctx, const workbundle::v1::WorkBundle& desired) {
  if (desired.target_location().empty()) {
    throw util::InvalidTarget("bundle " + desired.name() + " has no target location");
  }

  observability::SpanScope span("work.converge", desired.name(), desired.target_location());

  const auto started_at = std::chrono::steady_clock::now();
  try {
    const auto outcome = Reconcile(ctx, desired);
    span.SetOutcome(ToString(outcome));

    if (metrics_) {
      metrics_->IncrementCounter(CounterFor(outcome));
      metrics_->ObserveHistogram(kMetricConvergeDurationMs,
                                 std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
    }

    if (outcome == ConvergeOutcome::kUnchanged) {
      WORKBUNDLE_LOG_DEBUG("Bundle up to date", {observability::BundleField(desired.name()),
                                                 observability::LocationField(desired.target_location())});
    } else {
      WORKBUNDLE_LOG_INFO("Bundle converged", {observability::BundleField(desired.name()),
                                               observability::LocationField(desired.target_location()),
                                               observability::StringField("outcome", ToString(outcome))});
    }
    return outcome;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    if (metrics_) {
      metrics_->IncrementCounter(kMetricConvergeErrors);
    }
    WORKBUNDLE_LOG_ERROR("Bundle converge failed", {observability::BundleField(desired.name()),
                                                    observability::LocationField(desired.target_location()),
                                                    observability::StringField("error", ex.what())});
    throw;
  }
}

ConvergeOutcome WorkSynchronizer::Reconcile(const store::CallContext& ctx, const workbundle::v1::WorkBundle& desired) {
  const auto& name     = desired.name();
  const auto& location = desired.target_location();

  workbundle::v1::WorkBundle current;
  ThrowIfStoreError(ctx.Check(), kOpGet, name, location);
  auto fetched = store_->Get(ctx, name, location, &current);

  if (fetched.code == store::ErrorCode::NotFound) {
    workbundle::v1::WorkBundle fresh = desired;
    fresh.set_resource_version(0);
    fresh.clear_status();

    ThrowIfStoreError(ctx.Check(), kOpCreate, name, location);
    auto created = store_->Create(ctx, fresh);
    if (created) {
      return ConvergeOutcome::kCreated;
    }
    if (created.code != store::ErrorCode::AlreadyExists) {
      ThrowIfStoreError(created, kOpCreate, name, location);
    }

    // lost the create race; compare against the winner's copy
    WORKBUNDLE_LOG_INFO("Bundle created concurrently, re-reading",
                        {observability::BundleField(name), observability::LocationField(location)});
    current.Clear();
    ThrowIfStoreError(ctx.Check(), kOpGet, name, location);
    fetched = store_->Get(ctx, name, location, &current);
  }
  ThrowIfStoreError(fetched, kOpGet, name, location);

  if (ManifestsEqual(current.manifests(), desired.manifests())) {
    return ConvergeOutcome::kUnchanged;
  }

  if (current.resource_version() == 0) {
    throw util::InvalidState("fetched bundle " + name + " on " + location + " carries no resource version");
  }

  *current.mutable_manifests() = desired.manifests();

  ThrowIfStoreError(ctx.Check(), kOpUpdate, name, location);
  ThrowIfStoreError(store_->Update(ctx, current), kOpUpdate, name, location);
  return ConvergeOutcome::kUpdated;
}

} // namespace workbundle::work
