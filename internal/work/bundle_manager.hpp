#pragma once

#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/store/api/bundle_store.hpp"
#include "internal/work/bundle_builder.hpp"
#include "internal/work/manifest_encoder.hpp"
#include "internal/work/work_deleter.hpp"
#include "internal/work/work_synchronizer.hpp"
#include "workbundle/v1.hpp"

namespace workbundle::runtime::config {
class RamenConfig;
class DrClusterOperatorConfig;
}

namespace workbundle::work {

/*
  Bundle operations on behalf of one owner (a placement object identified by
  name and namespace). Every bundle it writes carries the owner provenance
  annotations.
*/
class BundleManager {
 public:
  BundleManager(std::shared_ptr<store::BundleStore> store, std::string owner_name, std::string owner_namespace,
                std::shared_ptr<observability::MetricsRegistry> metrics = nullptr);

  std::string BundleName(std::string_view kind) const;

  // "{name}-{namespace}-vrg-mw", labeled app=VRG, holding `vrg`.
  ConvergeOutcome ConvergeVrgBundle(const store::CallContext& ctx, const std::string& name, const std::string& namespace_name,
                                    const std::string& home_cluster, const workbundle::v1::VolumeReplicationGroup& vrg);

  // "{name}-{namespace_name}-ns-mw" holding a single Namespace object.
  ConvergeOutcome ConvergeNamespaceBundle(const store::CallContext& ctx, const std::string& name,
                                          const std::string& namespace_name, const std::string& cluster);

  ConvergeOutcome ConvergeDrClusterBundle(const store::CallContext& ctx, const std::string& cluster,
                                          const workbundle::runtime::config::RamenConfig&             ramen_config,
                                          const workbundle::runtime::config::DrClusterOperatorConfig& operator_config);

  // Throws util::NotFound when the bundle does not exist.
  workbundle::v1::WorkBundle FindBundle(const store::CallContext& ctx, const std::string& name, const std::string& cluster);

  // Removes this owner's VRG bundle from `cluster`. The namespace bundle stays.
  DeleteOutcome DeleteBundlesForCluster(const store::CallContext& ctx, const std::string& cluster);

  DeleteOutcome DeleteBundle(const store::CallContext& ctx, const std::string& name, const std::string& location);

 private:
  ConvergeOutcome ConvergeObjects(const store::CallContext& ctx, const std::string& name, const std::string& location,
                                  const Labels& labels, const std::vector<Object>& objects);

  std::shared_ptr<store::BundleStore> store_;
  std::string                         owner_name_;
  std::string                         owner_namespace_;
  WorkSynchronizer                    synchronizer_;
  WorkDeleter                         deleter_;
};

} // namespace workbundle::work
