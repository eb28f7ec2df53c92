#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/observability/metric_value.hpp"
#include "internal/observability/metrics_registry.hpp"
#include "internal/store/memory/memory_bundle_store.hpp"
#include "internal/work/bundle_manager.hpp"
#include "internal/work/manifest_encoder.hpp"
#include "internal/work/name_formatter.hpp"
#include "internal/work/status_interpreter.hpp"
#include "internal/work/work_metrics.hpp"
#include "workbundle/v1.hpp"

using namespace workbundle;

int main() {
  auto store   = std::make_shared<store::memory::MemoryBundleStore>();
  auto metrics = std::make_shared<observability::MetricsRegistry>();

  work::BundleManager manager(store, "app1", "ns1", metrics);

  auto vrg = work::NewObject<v1::VolumeReplicationGroup>();
  vrg.mutable_metadata()->set_name("app1");
  vrg.mutable_metadata()->set_namespace_("ns1");
  vrg.mutable_spec()->set_replication_state("primary");
  vrg.mutable_spec()->add_s3_profiles("s3-east");

  const auto ctx = store::CallContext::WithTimeout(std::chrono::seconds(5));

  // First pass creates, second finds nothing to do.
  std::cout << "first converge: " << work::ToString(manager.ConvergeVrgBundle(ctx, "app1", "ns1", "cluster-a", vrg)) << '\n';
  std::cout << "second converge: " << work::ToString(manager.ConvergeVrgBundle(ctx, "app1", "ns1", "cluster-a", vrg)) << '\n';

  vrg.mutable_spec()->set_replication_state("secondary");
  std::cout << "after spec change: " << work::ToString(manager.ConvergeVrgBundle(ctx, "app1", "ns1", "cluster-a", vrg)) << '\n';

  // Play the remote agent reporting back.
  auto bundle = manager.FindBundle(ctx, manager.BundleName(work::kKindWorkload), "cluster-a");
  for (const auto type : {work::kConditionApplied, work::kConditionAvailable}) {
    auto* condition = bundle.mutable_status()->add_conditions();
    condition->set_type(std::string(type));
    condition->set_status(std::string(work::kConditionTrue));
  }
  if (auto result = store->UpdateStatus(ctx, bundle); !result) {
    std::cerr << "status update failed: " << result.message << '\n';
    return 1;
  }

  bundle = manager.FindBundle(ctx, bundle.name(), "cluster-a");
  std::cout << bundle.name() << " applied=" << (work::IsApplied(bundle) ? "true" : "false") << '\n';
  std::cout << "creates recorded: "
            << observability::GetMetricValueSingle(*metrics, work::kMetricConvergeCreated, v1::METRIC_TYPE_COUNTER) << '\n';

  std::cout << "teardown: " << work::ToString(manager.DeleteBundlesForCluster(ctx, "cluster-a")) << '\n';
  std::cout << "teardown again: " << work::ToString(manager.DeleteBundlesForCluster(ctx, "cluster-a")) << '\n';
  return 0;
}
