#include "internal/work/bundle_manager.hpp"

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/work/dr_cluster_objects.hpp"
#include "internal/work/name_formatter.hpp"
#include "internal/work/store_errors.hpp"

namespace workbundle::work {

BundleManager::BundleManager(std::shared_ptr<store::BundleStore> store, std::string owner_name, std::string owner_namespace,
                             std::shared_ptr<observability::MetricsRegistry> metrics)
    : store_(store),
      owner_name_(std::move(owner_name)),
      owner_namespace_(std::move(owner_namespace)),
      synchronizer_(store, metrics),
      deleter_(store, metrics) {
}

std::string BundleManager::BundleName(std::string_view kind) const {
  return work::BundleName(owner_name_, owner_namespace_, kind);
}

ConvergeOutcome BundleManager::ConvergeVrgBundle(const store::CallContext& ctx, const std::string& name,
                                                 const std::string& namespace_name, const std::string& home_cluster,
                                                 const workbundle::v1::VolumeReplicationGroup& vrg) {
  WORKBUNDLE_LOG_INFO("Converging VRG bundle", {observability::StringField("owner", name),
                                                observability::StringField("namespace", namespace_name),
                                                observability::LocationField(home_cluster),
                                                observability::StringField("vrg", vrg.metadata().name())});

  return ConvergeObjects(ctx, work::BundleName(name, namespace_name, kKindWorkload), home_cluster, {{"app", "VRG"}}, {vrg});
}

ConvergeOutcome BundleManager::ConvergeNamespaceBundle(const store::CallContext& ctx, const std::string& name,
                                                       const std::string& namespace_name, const std::string& cluster) {
  return ConvergeObjects(ctx, work::BundleName(name, namespace_name, kKindNamespace), cluster, {},
                         {NamespaceObject(namespace_name)});
}

ConvergeOutcome BundleManager::ConvergeDrClusterBundle(const store::CallContext& ctx, const std::string& cluster,
                                                       const workbundle::runtime::config::RamenConfig&             ramen_config,
                                                       const workbundle::runtime::config::DrClusterOperatorConfig& operator_config) {
  return ConvergeObjects(ctx, std::string(kDrClusterBundleName), cluster, {}, DrClusterObjects(ramen_config, operator_config));
}

workbundle::v1::WorkBundle BundleManager::FindBundle(const store::CallContext& ctx, const std::string& name,
                                                     const std::string& cluster) {
  if (cluster.empty()) {
    throw util::InvalidTarget("bundle " + name + " has no target location");
  }

  workbundle::v1::WorkBundle bundle;
  ThrowIfStoreError(ctx.Check(), kOpGet, name, cluster);
  auto result = store_->Get(ctx, name, cluster, &bundle);
  if (result.code == store::ErrorCode::NotFound) {
    throw util::NotFound("bundle " + name + " not found on " + cluster);
  }
  ThrowIfStoreError(result, kOpGet, name, cluster);
  return bundle;
}

DeleteOutcome BundleManager::DeleteBundlesForCluster(const store::CallContext& ctx, const std::string& cluster) {
  return deleter_.DeleteWorkloadBundle(ctx, owner_name_, owner_namespace_, cluster);
}

DeleteOutcome BundleManager::DeleteBundle(const store::CallContext& ctx, const std::string& name, const std::string& location) {
  return deleter_.Delete(ctx, name, location);
}

ConvergeOutcome BundleManager::ConvergeObjects(const store::CallContext& ctx, const std::string& name,
                                               const std::string& location, const Labels& labels,
                                               const std::vector<Object>& objects) {
  auto bundle = Build(name, location, labels, EncodeAll(objects), owner_name_, owner_namespace_);
  return synchronizer_.Converge(ctx, bundle);
}

} // namespace workbundle::work
