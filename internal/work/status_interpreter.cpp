#include "internal/work/status_interpreter.hpp"

namespace workbundle::work {

namespace {

bool AnyTrue(const google::protobuf::RepeatedPtrField<workbundle::v1::Condition>& conditions, std::string_view type) {
  for (const auto& condition : conditions) {
    if (condition.type() == type && condition.status() == kConditionTrue) {
      return true;
    }
  }
  return false;
}

} // namespace

bool IsApplied(const google::protobuf::RepeatedPtrField<workbundle::v1::Condition>& conditions) {
  return AnyTrue(conditions, kConditionApplied) && AnyTrue(conditions, kConditionAvailable) &&
         !AnyTrue(conditions, kConditionDegraded);
}

bool IsApplied(const workbundle::v1::WorkBundle& bundle) {
  return IsApplied(bundle.status().conditions());
}

} // namespace workbundle::work
