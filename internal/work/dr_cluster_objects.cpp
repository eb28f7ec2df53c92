#include "internal/work/dr_cluster_objects.hpp"

#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace workbundle::work {

namespace {

constexpr std::string_view kRbacApiGroup = "rbac.authorization.k8s.io";

template <typename T>
T NamedObject(std::string_view name, std::string_view namespace_name = {}) {
  auto object = NewObject<T>();
  object.mutable_metadata()->set_name(std::string(name));
  if (!namespace_name.empty()) {
    object.mutable_metadata()->set_namespace_(std::string(namespace_name));
  }
  return object;
}

void AddEditRule(workbundle::v1::ClusterRole& role, std::string_view api_group, std::string_view resource) {
  auto* rule = role.add_rules();
  rule->add_api_groups(std::string(api_group));
  rule->add_resources(std::string(resource));
  for (const char* verb : {"create", "get", "list", "update", "delete"}) {
    rule->add_verbs(verb);
  }
}

template <typename Binding>
void BindWorkAgent(Binding& binding, std::string_view role_name) {
  auto* subject = binding.add_subjects();
  subject->set_kind("ServiceAccount");
  subject->set_name(std::string(kWorkAgentServiceAccount));
  subject->set_namespace_(std::string(kWorkAgentNamespace));

  auto* role_ref = binding.mutable_role_ref();
  role_ref->set_api_group(std::string(kRbacApiGroup));
  role_ref->set_kind("ClusterRole");
  role_ref->set_name(std::string(role_name));
}

void UseBlockStyle(YAML::Node node) {
  if (node.IsMap()) {
    node.SetStyle(YAML::EmitterStyle::Block);
    for (auto entry : node) {
      UseBlockStyle(entry.second);
    }
  } else if (node.IsSequence()) {
    node.SetStyle(YAML::EmitterStyle::Block);
    for (auto item : node) {
      UseBlockStyle(item);
    }
  }
}

} // namespace

workbundle::v1::Namespace NamespaceObject(const std::string& name) {
  return NamedObject<workbundle::v1::Namespace>(name);
}

workbundle::v1::ClusterRole VrgClusterRole() {
  auto role = NamedObject<workbundle::v1::ClusterRole>(kVrgEditRoleName);
  AddEditRule(role, "ramendr.openshift.io", "volumereplicationgroups");
  return role;
}

workbundle::v1::ClusterRoleBinding VrgClusterRoleBinding() {
  auto binding = NamedObject<workbundle::v1::ClusterRoleBinding>(kVrgEditRoleName);
  BindWorkAgent(binding, kVrgEditRoleName);
  return binding;
}

workbundle::v1::ClusterRole OlmClusterRole() {
  auto role = NamedObject<workbundle::v1::ClusterRole>(kOlmEditRoleName);
  AddEditRule(role, "operators.coreos.com", "operatorgroups");
  return role;
}

workbundle::v1::RoleBinding OlmRoleBinding(const std::string& namespace_name) {
  auto binding = NamedObject<workbundle::v1::RoleBinding>(kOlmEditRoleName, namespace_name);
  BindWorkAgent(binding, kOlmEditRoleName);
  return binding;
}

workbundle::v1::OperatorGroup OperatorGroupObject(const std::string& namespace_name) {
  return NamedObject<workbundle::v1::OperatorGroup>(kOperatorGroupName, namespace_name);
}

workbundle::v1::Subscription OperatorSubscription(const workbundle::runtime::config::DrClusterOperatorConfig& op) {
  auto subscription = NamedObject<workbundle::v1::Subscription>(kSubscriptionName, op.namespace_name());

  auto* spec = subscription.mutable_spec();
  spec->set_catalog_source(op.catalog_source_name());
  spec->set_catalog_source_namespace(op.catalog_source_namespace_name());
  spec->set_package(op.package_name());
  spec->set_channel(op.channel_name());
  spec->set_starting_csv(op.cluster_service_version_name());
  spec->set_install_plan_approval("Automatic");
  return subscription;
}

std::string RenderDrClusterConfig(const workbundle::runtime::config::RamenConfig& hub_config) {
  auto dr_config = hub_config;
  dr_config.mutable_leader_election()->set_resource_name(std::string(kDrClusterLeaseName));
  dr_config.set_ramen_controller_type(std::string(kDrClusterControllerType));

  // lowerCamelCase keys, as the dr-cluster operator reads them
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(dr_config, &json);
  if (!status.ok()) {
    throw util::EncodeError("failed to render dr-cluster ramen config: " + std::string(status.message()));
  }

  YAML::Node root;
  try {
    root = YAML::Load(json);
  } catch (const YAML::Exception& ex) {
    throw util::EncodeError(std::string("failed to render dr-cluster ramen config: ") + ex.what());
  }
  UseBlockStyle(root);

  YAML::Emitter out;
  out << root;
  if (!out.good()) {
    throw util::EncodeError("failed to render dr-cluster ramen config: " + out.GetLastError());
  }
  return std::string(out.c_str()) + "\n";
}

workbundle::v1::ConfigMap OperatorConfigMap(const std::string&                             namespace_name,
                                            const workbundle::runtime::config::RamenConfig& hub_config) {
  auto config_map = NamedObject<workbundle::v1::ConfigMap>(kOperatorConfigMapName, namespace_name);

  auto* entry = config_map.add_data();
  entry->set_key(std::string(kOperatorConfigKey));
  entry->set_value(RenderDrClusterConfig(hub_config));
  return config_map;
}

std::vector<Object> DrClusterObjects(const workbundle::runtime::config::RamenConfig&             hub_config,
                                     const workbundle::runtime::config::DrClusterOperatorConfig& op) {
  std::vector<Object> objects{VrgClusterRole(), VrgClusterRoleBinding()};

  if (hub_config.dr_cluster_operator().deployment_automation_enabled()) {
    auto config_map = OperatorConfigMap(op.namespace_name(), hub_config);

    objects.emplace_back(NamespaceObject(op.namespace_name()));
    objects.emplace_back(OlmClusterRole());
    objects.emplace_back(OlmRoleBinding(op.namespace_name()));
    objects.emplace_back(OperatorGroupObject(op.namespace_name()));
    objects.emplace_back(OperatorSubscription(op));
    objects.emplace_back(std::move(config_map));
  }
  return objects;
}

} // namespace workbundle::work
