#include <cassert>
#include <iostream>
#include <string>
#include <variant>

#include <google/protobuf/util/message_differencer.h>

#include "internal/util/errors.hpp"
#include "internal/work/dr_cluster_objects.hpp"
#include "internal/work/manifest_encoder.hpp"

namespace {

using workbundle::work::Decode;
using workbundle::work::Encode;
using workbundle::work::Object;

workbundle::v1::VolumeReplicationGroup SampleVrg() {
  auto vrg = workbundle::work::NewObject<workbundle::v1::VolumeReplicationGroup>();
  vrg.mutable_metadata()->set_name("app1");
  vrg.mutable_metadata()->set_namespace_("ns1");
  auto* label = vrg.mutable_spec()->mutable_pvc_selector()->add_match_labels();
  label->set_key("appname");
  label->set_value("busybox");
  vrg.mutable_spec()->set_replication_state("primary");
  vrg.mutable_spec()->add_s3_profiles("s3-east");
  vrg.mutable_spec()->set_sync(true);
  return vrg;
}

void TestEncodeCarriesKindAndApiVersion() {
  const auto manifest = Encode(SampleVrg());
  assert(manifest.kind() == "VolumeReplicationGroup");
  assert(manifest.api_version() == "ramendr.openshift.io/v1alpha1");
  assert(manifest.raw().find("\"replicationState\":\"primary\"") != std::string::npos);
}

void TestDecodeRestoresTypedObject() {
  const auto original = SampleVrg();
  const auto decoded  = Decode(Encode(original));

  assert(std::holds_alternative<workbundle::v1::VolumeReplicationGroup>(decoded));
  assert(google::protobuf::util::MessageDifferencer::Equals(std::get<workbundle::v1::VolumeReplicationGroup>(decoded), original));
}

void TestEncodingIsByteStable() {
  assert(Encode(SampleVrg()).raw() == Encode(SampleVrg()).raw());
  assert(Encode(workbundle::work::VrgClusterRoleBinding()).raw() == Encode(workbundle::work::VrgClusterRoleBinding()).raw());
}

void TestKindOfReportsDiscriminator() {
  const Object object = workbundle::work::NamespaceObject("ns1");
  assert(workbundle::work::KindOf(object) == "Namespace");
}

void TestMissingNameIsEncodeError() {
  auto ns = workbundle::work::NewObject<workbundle::v1::Namespace>();

  bool threw = false;
  try {
    (void)Encode(ns);
  } catch (const workbundle::util::EncodeError&) {
    threw = true;
  }
  assert(threw && "Encode must reject an object without metadata.name.");
}

void TestMissingKindIsEncodeError() {
  workbundle::v1::Namespace ns;
  ns.set_api_version("v1");
  ns.mutable_metadata()->set_name("ns1");

  bool threw = false;
  try {
    (void)Encode(ns);
  } catch (const workbundle::util::EncodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestMismatchedKindIsEncodeError() {
  auto ns = workbundle::work::NamespaceObject("ns1");
  ns.set_kind("ConfigMap");

  bool threw = false;
  try {
    (void)Encode(ns);
  } catch (const workbundle::util::EncodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownKindIsDecodeError() {
  workbundle::v1::Manifest manifest;
  manifest.set_kind("Deployment");
  manifest.set_api_version("apps/v1");
  manifest.set_raw("{}");

  bool threw = false;
  try {
    (void)Decode(manifest);
  } catch (const workbundle::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestMalformedPayloadIsDecodeError() {
  auto manifest = Encode(workbundle::work::NamespaceObject("ns1"));
  manifest.set_raw("{\"kind\": ");

  bool threw = false;
  try {
    (void)Decode(manifest);
  } catch (const workbundle::util::DecodeError&) {
    threw = true;
  }
  assert(threw);
}

void TestEncodeAllKeepsOrder() {
  const auto manifests = workbundle::work::EncodeAll({workbundle::work::VrgClusterRole(), workbundle::work::VrgClusterRoleBinding()});
  assert(manifests.size() == 2);
  assert(manifests[0].kind() == "ClusterRole");
  assert(manifests[1].kind() == "ClusterRoleBinding");
}

template <typename T>
void CheckTraits(const std::string& kind, const std::string& api_version) {
  auto object = workbundle::work::NewObject<T>();
  object.mutable_metadata()->set_name("x");

  const auto manifest = Encode(object);
  assert(manifest.kind() == kind);
  assert(manifest.api_version() == api_version);
  assert(workbundle::work::KindOf(Decode(manifest)) == kind);
}

void TestEveryKindHasItsApiVersion() {
  CheckTraits<workbundle::v1::ClusterRole>("ClusterRole", "rbac.authorization.k8s.io/v1");
  CheckTraits<workbundle::v1::ClusterRoleBinding>("ClusterRoleBinding", "rbac.authorization.k8s.io/v1");
  CheckTraits<workbundle::v1::RoleBinding>("RoleBinding", "rbac.authorization.k8s.io/v1");
  CheckTraits<workbundle::v1::Namespace>("Namespace", "v1");
  CheckTraits<workbundle::v1::OperatorGroup>("OperatorGroup", "operators.coreos.com/v1");
  CheckTraits<workbundle::v1::Subscription>("Subscription", "operators.coreos.com/v1alpha1");
  CheckTraits<workbundle::v1::ConfigMap>("ConfigMap", "v1");
  CheckTraits<workbundle::v1::VolumeReplicationGroup>("VolumeReplicationGroup", "ramendr.openshift.io/v1alpha1");
}

} // namespace

int main() {
  TestEncodeCarriesKindAndApiVersion();
  TestDecodeRestoresTypedObject();
  TestEncodingIsByteStable();
  TestKindOfReportsDiscriminator();
  TestMissingNameIsEncodeError();
  TestMissingKindIsEncodeError();
  TestMismatchedKindIsEncodeError();
  TestUnknownKindIsDecodeError();
  TestMalformedPayloadIsDecodeError();
  TestEncodeAllKeepsOrder();
  TestEveryKindHasItsApiVersion();

  std::cout << "workbundle_unit_manifest_encoder: pass\n";
  return 0;
}
