#pragma once

#include <string>
#include <string_view>

namespace workbundle::work {

// Bundle kinds reserved by this engine. Callers may use any other string.
inline constexpr std::string_view kKindWorkload  = "vrg";
inline constexpr std::string_view kKindNamespace = "ns";

// Cluster-scoped bootstrap bundle; not derived from an owner.
inline constexpr std::string_view kDrClusterBundleName = "ramen-dr-cluster";

/*
  "{owner_name}-{owner_namespace}-{kind}-mw"

  The name is the only key used to find a bundle again, so the format must
  never change.
*/
std::string BundleName(std::string_view owner_name, std::string_view owner_namespace, std::string_view kind);

} // namespace workbundle::work
