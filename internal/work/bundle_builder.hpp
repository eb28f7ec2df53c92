#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "workbundle/v1.hpp"

namespace workbundle::work {

inline constexpr std::string_view kOwnerNameAnnotation      = "drplacementcontrol.ramendr.openshift.io/drpc-name";
inline constexpr std::string_view kOwnerNamespaceAnnotation = "drplacementcontrol.ramendr.openshift.io/drpc-namespace";

using Labels = std::map<std::string, std::string>;

/*
  Assembles a bundle addressed to `target_location`.

  The owner provenance annotations are always set. Manifest order is kept as
  given; the store compares it positionally.

  Throws util::InvalidTarget for an empty target and util::InvalidArgument
  for an empty name.
*/
workbundle::v1::WorkBundle Build(const std::string& name, const std::string& target_location, const Labels& labels,
                                 const std::vector<workbundle::v1::Manifest>& manifests, const std::string& owner_name,
                                 const std::string& owner_namespace);

} // namespace workbundle::work
