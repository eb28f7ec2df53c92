#include "internal/work/name_formatter.hpp"

namespace workbundle::work {

std::string BundleName(std::string_view owner_name, std::string_view owner_namespace, std::string_view kind) {
  std::string name;
  name.reserve(owner_name.size() + owner_namespace.size() + kind.size() + 5);
  name.append(owner_name).append("-").append(owner_namespace).append("-").append(kind).append("-mw");
  return name;
}

} // namespace workbundle::work
