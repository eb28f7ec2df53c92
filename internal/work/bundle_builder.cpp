#include "internal/work/bundle_builder.hpp"

#include "internal/util/errors.hpp"

namespace workbundle::work {

workbundle::v1::WorkBundle Build(const std::string& name, const std::string& target_location, const Labels& labels,
                                 const std::vector<workbundle::v1::Manifest>& manifests, const std::string& owner_name,
                                 const std::string& owner_namespace) {
  if (target_location.empty()) {
    throw util::InvalidTarget("bundle " + name + " has no target location");
  }
  if (name.empty()) {
    throw util::InvalidArgument("bundle name is empty");
  }

  workbundle::v1::WorkBundle bundle;
  bundle.set_name(name);
  bundle.set_target_location(target_location);

  auto& bundle_labels = *bundle.mutable_labels();
  for (const auto& [key, value] : labels) {
    bundle_labels[key] = value;
  }

  auto& annotations                                   = *bundle.mutable_annotations();
  annotations[std::string(kOwnerNameAnnotation)]      = owner_name;
  annotations[std::string(kOwnerNamespaceAnnotation)] = owner_namespace;

  bundle.mutable_manifests()->Reserve(static_cast<int>(manifests.size()));
  for (const auto& manifest : manifests) {
    *bundle.add_manifests() = manifest;
  }
  return bundle;
}

} // namespace workbundle::work
