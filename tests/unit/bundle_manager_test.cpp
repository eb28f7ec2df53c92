#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <variant>

#include <yaml-cpp/yaml.h>

#include "config/config.pb.h"
#include "internal/store/memory/memory_bundle_store.hpp"
#include "internal/util/errors.hpp"
#include "internal/work/bundle_manager.hpp"
#include "internal/work/dr_cluster_objects.hpp"
#include "internal/work/manifest_encoder.hpp"

namespace {

using workbundle::runtime::config::RamenConfig;
using workbundle::store::CallContext;
using workbundle::store::memory::MemoryBundleStore;
using workbundle::work::BundleManager;
using workbundle::work::ConvergeOutcome;
using workbundle::work::DeleteOutcome;

RamenConfig HubConfig(bool automation) {
  RamenConfig config;
  config.set_ramen_controller_type("dr-hub");
  config.mutable_leader_election()->set_leader_elect(true);
  config.mutable_leader_election()->set_resource_name("hub.ramendr.openshift.io");

  auto* op = config.mutable_dr_cluster_operator();
  op->set_deployment_automation_enabled(automation);
  op->set_channel_name("alpha");
  op->set_package_name("ramen-dr-cluster-operator");
  op->set_namespace_name("ramen-system");
  op->set_catalog_source_name("ramen-catalog");
  op->set_catalog_source_namespace_name("openshift-marketplace");
  op->set_cluster_service_version_name("ramen-dr-cluster-operator.v0.0.1");
  return config;
}

workbundle::v1::VolumeReplicationGroup Vrg(const std::string& state) {
  auto vrg = workbundle::work::NewObject<workbundle::v1::VolumeReplicationGroup>();
  vrg.mutable_metadata()->set_name("app1");
  vrg.mutable_metadata()->set_namespace_("ns1");
  vrg.mutable_spec()->set_replication_state(state);
  return vrg;
}

void TestVrgBundleEndToEnd() {
  auto          store = std::make_shared<MemoryBundleStore>();
  BundleManager manager(store, "app1", "ns1");

  assert(manager.ConvergeVrgBundle(CallContext(), "app1", "ns1", "cluster-a", Vrg("primary")) == ConvergeOutcome::kCreated);
  assert(manager.ConvergeVrgBundle(CallContext(), "app1", "ns1", "cluster-a", Vrg("primary")) == ConvergeOutcome::kUnchanged);

  const auto bundle = manager.FindBundle(CallContext(), "app1-ns1-vrg-mw", "cluster-a");
  assert(bundle.labels().at("app") == "VRG");
  assert(bundle.annotations().at("drplacementcontrol.ramendr.openshift.io/drpc-name") == "app1");
  assert(bundle.annotations().at("drplacementcontrol.ramendr.openshift.io/drpc-namespace") == "ns1");
  assert(bundle.manifests_size() == 1);
  assert(bundle.manifests(0).kind() == "VolumeReplicationGroup");

  const auto decoded = workbundle::work::Decode(bundle.manifests(0));
  assert(std::get<workbundle::v1::VolumeReplicationGroup>(decoded).spec().replication_state() == "primary");

  assert(manager.ConvergeVrgBundle(CallContext(), "app1", "ns1", "cluster-a", Vrg("secondary")) == ConvergeOutcome::kUpdated);
}

void TestNamespaceBundleHoldsOneNamespace() {
  auto          store = std::make_shared<MemoryBundleStore>();
  BundleManager manager(store, "app1", "ns1");

  assert(manager.ConvergeNamespaceBundle(CallContext(), "app1", "ns1", "cluster-a") == ConvergeOutcome::kCreated);

  const auto bundle = manager.FindBundle(CallContext(), "app1-ns1-ns-mw", "cluster-a");
  assert(bundle.labels().empty());
  assert(bundle.manifests_size() == 1);

  const auto ns = std::get<workbundle::v1::Namespace>(workbundle::work::Decode(bundle.manifests(0)));
  assert(ns.metadata().name() == "ns1");
  assert(ns.api_version() == "v1");
}

void TestDrClusterBundleWithoutAutomation() {
  auto          store = std::make_shared<MemoryBundleStore>();
  BundleManager manager(store, "cluster-a", "");

  const auto hub = HubConfig(false);
  assert(manager.ConvergeDrClusterBundle(CallContext(), "cluster-a", hub, hub.dr_cluster_operator()) == ConvergeOutcome::kCreated);

  const auto bundle = manager.FindBundle(CallContext(), "ramen-dr-cluster", "cluster-a");
  assert(bundle.labels().empty());
  assert(bundle.manifests_size() == 2);
  assert(bundle.manifests(0).kind() == "ClusterRole");
  assert(bundle.manifests(1).kind() == "ClusterRoleBinding");

  const auto role = std::get<workbundle::v1::ClusterRole>(workbundle::work::Decode(bundle.manifests(0)));
  assert(role.metadata().name() == "open-cluster-management:klusterlet-work-sa:agent:volrepgroup-edit");
  assert(role.rules(0).api_groups(0) == "ramendr.openshift.io");
  assert(role.rules(0).resources(0) == "volumereplicationgroups");
  assert(role.rules(0).verbs_size() == 5);

  const auto binding = std::get<workbundle::v1::ClusterRoleBinding>(workbundle::work::Decode(bundle.manifests(1)));
  assert(binding.subjects(0).kind() == "ServiceAccount");
  assert(binding.subjects(0).name() == "klusterlet-work-sa");
  assert(binding.subjects(0).namespace_() == "open-cluster-management-agent");
  assert(binding.role_ref().api_group() == "rbac.authorization.k8s.io");
  assert(binding.role_ref().name() == role.metadata().name());
}

void TestDrClusterBundleWithAutomation() {
  auto          store = std::make_shared<MemoryBundleStore>();
  BundleManager manager(store, "cluster-a", "");

  const auto hub = HubConfig(true);
  assert(manager.ConvergeDrClusterBundle(CallContext(), "cluster-a", hub, hub.dr_cluster_operator()) == ConvergeOutcome::kCreated);
  assert(manager.ConvergeDrClusterBundle(CallContext(), "cluster-a", hub, hub.dr_cluster_operator()) == ConvergeOutcome::kUnchanged);

  const auto bundle = manager.FindBundle(CallContext(), "ramen-dr-cluster", "cluster-a");
  assert(bundle.manifests_size() == 8);

  const char* expected_kinds[] = {"ClusterRole",   "ClusterRoleBinding", "Namespace", "ClusterRole",
                                  "RoleBinding",   "OperatorGroup",      "Subscription", "ConfigMap"};
  for (int i = 0; i < 8; ++i) {
    assert(bundle.manifests(i).kind() == expected_kinds[i]);
  }

  const auto subscription = std::get<workbundle::v1::Subscription>(workbundle::work::Decode(bundle.manifests(6)));
  assert(subscription.metadata().name() == "ramen-dr-cluster-subscription");
  assert(subscription.metadata().namespace_() == "ramen-system");
  assert(subscription.spec().install_plan_approval() == "Automatic");
  assert(subscription.spec().starting_csv() == "ramen-dr-cluster-operator.v0.0.1");
  assert(subscription.spec().catalog_source_namespace() == "openshift-marketplace");

  const auto role_binding = std::get<workbundle::v1::RoleBinding>(workbundle::work::Decode(bundle.manifests(4)));
  assert(role_binding.metadata().namespace_() == "ramen-system");
  assert(role_binding.role_ref().name() == "open-cluster-management:klusterlet-work-sa:agent:olm-edit");

  const auto config_map = std::get<workbundle::v1::ConfigMap>(workbundle::work::Decode(bundle.manifests(7)));
  assert(config_map.metadata().name() == "ramen-dr-cluster-operator-config");
  assert(config_map.data_size() == 1);
  assert(config_map.data(0).key() == "ramen_manager_config.yaml");

  const auto& yaml_text = config_map.data(0).value();
  assert(yaml_text.find('{') == std::string::npos);

  const auto rendered = YAML::Load(yaml_text);
  assert(rendered["ramenControllerType"].as<std::string>() == "dr-cluster");
  assert(rendered["leaderElection"]["resourceName"].as<std::string>() == "dr-cluster.ramendr.openshift.io");
  assert(rendered["leaderElection"]["leaderElect"].as<bool>());
  assert(rendered["drClusterOperator"]["namespaceName"].as<std::string>() == "ramen-system");
  assert(!rendered["ramen_controller_type"]);
  assert(!rendered["leader_election"]);

  // the caller's hub config is left as it was
  assert(hub.ramen_controller_type() == "dr-hub");
  assert(hub.leader_election().resource_name() == "hub.ramendr.openshift.io");
}

void TestFindMissingBundleIsNotFound() {
  auto          store = std::make_shared<MemoryBundleStore>();
  BundleManager manager(store, "app1", "ns1");

  bool threw = false;
  try {
    (void)manager.FindBundle(CallContext(), "app1-ns1-vrg-mw", "cluster-a");
  } catch (const workbundle::util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)manager.FindBundle(CallContext(), "app1-ns1-vrg-mw", "");
  } catch (const workbundle::util::InvalidTarget&) {
    threw = true;
  }
  assert(threw);
}

void TestClusterTeardownLeavesNamespaceBundle() {
  auto          store = std::make_shared<MemoryBundleStore>();
  BundleManager manager(store, "app1", "ns1");

  (void)manager.ConvergeNamespaceBundle(CallContext(), "app1", "ns1", "cluster-a");
  (void)manager.ConvergeVrgBundle(CallContext(), "app1", "ns1", "cluster-a", Vrg("primary"));
  assert(store->Size() == 2);

  assert(manager.DeleteBundlesForCluster(CallContext(), "cluster-a") == DeleteOutcome::kDeleted);
  assert(manager.DeleteBundlesForCluster(CallContext(), "cluster-a") == DeleteOutcome::kAlreadyAbsent);
  assert(store->Size() == 1);
  assert(manager.FindBundle(CallContext(), manager.BundleName("ns"), "cluster-a").manifests_size() == 1);

  assert(manager.DeleteBundle(CallContext(), "app1-ns1-ns-mw", "cluster-a") == DeleteOutcome::kDeleted);
  assert(store->Size() == 0);
}

} // namespace

int main() {
  TestVrgBundleEndToEnd();
  TestNamespaceBundleHoldsOneNamespace();
  TestDrClusterBundleWithoutAutomation();
  TestDrClusterBundleWithAutomation();
  TestFindMissingBundleIsNotFound();
  TestClusterTeardownLeavesNamespaceBundle();

  std::cout << "workbundle_unit_bundle_manager: pass\n";
  return 0;
}
