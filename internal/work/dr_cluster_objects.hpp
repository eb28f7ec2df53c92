#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/work/manifest_encoder.hpp"

namespace workbundle::runtime::config {
class RamenConfig;
class DrClusterOperatorConfig;
}

namespace workbundle::work {

inline constexpr std::string_view kVrgEditRoleName         = "open-cluster-management:klusterlet-work-sa:agent:volrepgroup-edit";
inline constexpr std::string_view kOlmEditRoleName         = "open-cluster-management:klusterlet-work-sa:agent:olm-edit";
inline constexpr std::string_view kWorkAgentServiceAccount = "klusterlet-work-sa";
inline constexpr std::string_view kWorkAgentNamespace      = "open-cluster-management-agent";
inline constexpr std::string_view kOperatorGroupName       = "ramen-operator-group";
inline constexpr std::string_view kSubscriptionName        = "ramen-dr-cluster-subscription";
inline constexpr std::string_view kOperatorConfigMapName   = "ramen-dr-cluster-operator-config";
inline constexpr std::string_view kOperatorConfigKey       = "ramen_manager_config.yaml";

// Values the DR-cluster copy of the ramen config is rewritten with.
inline constexpr std::string_view kDrClusterLeaseName      = "dr-cluster.ramendr.openshift.io";
inline constexpr std::string_view kDrClusterControllerType = "dr-cluster";

workbundle::v1::Namespace          NamespaceObject(const std::string& name);
workbundle::v1::ClusterRole        VrgClusterRole();
workbundle::v1::ClusterRoleBinding VrgClusterRoleBinding();
workbundle::v1::ClusterRole        OlmClusterRole();
workbundle::v1::RoleBinding        OlmRoleBinding(const std::string& namespace_name);
workbundle::v1::OperatorGroup      OperatorGroupObject(const std::string& namespace_name);
workbundle::v1::Subscription       OperatorSubscription(const workbundle::runtime::config::DrClusterOperatorConfig& op);

/*
  Config map carrying the hub ramen config, rewritten for a DR cluster
  (lease name and controller type) and rendered as block YAML.
*/
workbundle::v1::ConfigMap OperatorConfigMap(const std::string&                             namespace_name,
                                            const workbundle::runtime::config::RamenConfig& hub_config);

// The DR-cluster rendering of `hub_config`, as it is stored in the config map.
std::string RenderDrClusterConfig(const workbundle::runtime::config::RamenConfig& hub_config);

/*
  Contents of the DR-cluster bootstrap bundle, in order.

  Always the VRG cluster role and its binding. With deployment automation
  enabled in `hub_config` the operator namespace, OLM role and binding,
  operator group, subscription and config map follow.
*/
std::vector<Object> DrClusterObjects(const workbundle::runtime::config::RamenConfig&             hub_config,
                                     const workbundle::runtime::config::DrClusterOperatorConfig& op);

} // namespace workbundle::work
