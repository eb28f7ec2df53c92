#pragma once

#include <string_view>
#include <variant>
#include <vector>

#include "workbundle/v1.hpp"

namespace workbundle::work {

/*
  Closed set of object kinds that can travel inside a bundle.
*/
using Object = std::variant<workbundle::v1::ClusterRole, workbundle::v1::ClusterRoleBinding, workbundle::v1::RoleBinding,
                            workbundle::v1::Namespace, workbundle::v1::OperatorGroup, workbundle::v1::Subscription,
                            workbundle::v1::ConfigMap, workbundle::v1::VolumeReplicationGroup>;

template <typename T>
struct ObjectTraits;

template <>
struct ObjectTraits<workbundle::v1::ClusterRole> {
  static constexpr std::string_view kKind       = "ClusterRole";
  static constexpr std::string_view kApiVersion = "rbac.authorization.k8s.io/v1";
};

template <>
struct ObjectTraits<workbundle::v1::ClusterRoleBinding> {
  static constexpr std::string_view kKind       = "ClusterRoleBinding";
  static constexpr std::string_view kApiVersion = "rbac.authorization.k8s.io/v1";
};

template <>
struct ObjectTraits<workbundle::v1::RoleBinding> {
  static constexpr std::string_view kKind       = "RoleBinding";
  static constexpr std::string_view kApiVersion = "rbac.authorization.k8s.io/v1";
};

template <>
struct ObjectTraits<workbundle::v1::Namespace> {
  static constexpr std::string_view kKind       = "Namespace";
  static constexpr std::string_view kApiVersion = "v1";
};

template <>
struct ObjectTraits<workbundle::v1::OperatorGroup> {
  static constexpr std::string_view kKind       = "OperatorGroup";
  static constexpr std::string_view kApiVersion = "operators.coreos.com/v1";
};

template <>
struct ObjectTraits<workbundle::v1::Subscription> {
  static constexpr std::string_view kKind       = "Subscription";
  static constexpr std::string_view kApiVersion = "operators.coreos.com/v1alpha1";
};

template <>
struct ObjectTraits<workbundle::v1::ConfigMap> {
  static constexpr std::string_view kKind       = "ConfigMap";
  static constexpr std::string_view kApiVersion = "v1";
};

template <>
struct ObjectTraits<workbundle::v1::VolumeReplicationGroup> {
  static constexpr std::string_view kKind       = "VolumeReplicationGroup";
  static constexpr std::string_view kApiVersion = "ramendr.openshift.io/v1alpha1";
};

// Object with kind and apiVersion filled from its traits.
template <typename T>
T NewObject() {
  T object;
  object.set_kind(std::string(ObjectTraits<T>::kKind));
  object.set_api_version(std::string(ObjectTraits<T>::kApiVersion));
  return object;
}

std::string_view KindOf(const Object& object);

/*
  Serializes one object to its JSON payload.

  Throws util::EncodeError when the object carries no kind, apiVersion or
  metadata.name, when its kind disagrees with its type, or when the JSON
  printer rejects it.
*/
workbundle::v1::Manifest Encode(const Object& object);

std::vector<workbundle::v1::Manifest> EncodeAll(const std::vector<Object>& objects);

// Throws util::DecodeError for an unknown kind or an unparsable payload.
Object Decode(const workbundle::v1::Manifest& manifest);

} // namespace workbundle::work
