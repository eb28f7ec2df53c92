#include "internal/work/work_deleter.hpp"

#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics_registry.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/work/name_formatter.hpp"
#include "internal/work/store_errors.hpp"
#include "internal/work/work_metrics.hpp"

namespace workbundle::work {

const char* ToString(DeleteOutcome outcome) {
  switch (outcome) {
    case DeleteOutcome::kDeleted:
      return "deleted";
    case DeleteOutcome::kAlreadyAbsent:
      return "already_absent";
  }
  return "unknown";
}

WorkDeleter::WorkDeleter(std::shared_ptr<store::BundleStore> store, std::shared_ptr<observability::MetricsRegistry> metrics)
    : store_(std::move(store)), metrics_(std::move(metrics)) {
  if (!store_) {
    throw util::InvalidArgument("work deleter requires a bundle store");
  }
}

DeleteOutcome WorkDeleter::Delete(const store::CallContext& ctx, const std::string& name, const std::string& target_location) {
  if (target_location.empty()) {
    throw util::InvalidTarget("bundle " + name + " has no target location");
  }

  observability::SpanScope span("work.delete", name, target_location);

  try {
    const auto outcome = Remove(ctx, name, target_location);
    span.SetOutcome(ToString(outcome));
    Count(outcome == DeleteOutcome::kDeleted ? kMetricDeleted : kMetricDeleteAbsent);
    WORKBUNDLE_LOG_INFO("Bundle delete", {observability::BundleField(name), observability::LocationField(target_location),
                                          observability::StringField("outcome", ToString(outcome))});
    return outcome;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    Count(kMetricDeleteErrors);
    WORKBUNDLE_LOG_ERROR("Bundle delete failed", {observability::BundleField(name), observability::LocationField(target_location),
                                                  observability::StringField("error", ex.what())});
    throw;
  }
}

DeleteOutcome WorkDeleter::DeleteWorkloadBundle(const store::CallContext& ctx, const std::string& owner_name,
                                                const std::string& owner_namespace, const std::string& target_location) {
  return Delete(ctx, BundleName(owner_name, owner_namespace, kKindWorkload), target_location);
}

DeleteOutcome WorkDeleter::Remove(const store::CallContext& ctx, const std::string& name, const std::string& target_location) {
  workbundle::v1::WorkBundle current;
  ThrowIfStoreError(ctx.Check(), kOpGet, name, target_location);
  auto fetched = store_->Get(ctx, name, target_location, &current);
  if (fetched.code == store::ErrorCode::NotFound) {
    return DeleteOutcome::kAlreadyAbsent;
  }
  ThrowIfStoreError(fetched, kOpGet, name, target_location);

  ThrowIfStoreError(ctx.Check(), kOpDelete, name, target_location);
  auto removed = store_->Delete(ctx, name, target_location);
  if (removed.code == store::ErrorCode::NotFound) {
    // another deleter won
    return DeleteOutcome::kAlreadyAbsent;
  }
  ThrowIfStoreError(removed, kOpDelete, name, target_location);
  return DeleteOutcome::kDeleted;
}

void WorkDeleter::Count(std::string_view metric) const {
  if (metrics_) {
    metrics_->IncrementCounter(metric);
  }
}

} // namespace workbundle::work
