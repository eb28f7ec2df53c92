#pragma once

#include <string_view>

#include <google/protobuf/repeated_ptr_field.h>

#include "workbundle/v1.hpp"

namespace workbundle::work {

inline constexpr std::string_view kConditionApplied   = "Applied";
inline constexpr std::string_view kConditionAvailable = "Available";
inline constexpr std::string_view kConditionDegraded  = "Degraded";

inline constexpr std::string_view kConditionTrue    = "True";
inline constexpr std::string_view kConditionFalse   = "False";
inline constexpr std::string_view kConditionUnknown = "Unknown";

/*
  Applied == True, Available == True and Degraded != True.

  A type counts as True when any condition of that type is True, so a
  repeated type cannot mask a Degraded=True or an Applied=True.
*/
bool IsApplied(const google::protobuf::RepeatedPtrField<workbundle::v1::Condition>& conditions);
bool IsApplied(const workbundle::v1::WorkBundle& bundle);

} // namespace workbundle::work
