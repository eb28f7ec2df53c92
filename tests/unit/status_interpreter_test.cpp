#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/work/status_interpreter.hpp"
#include "workbundle/v1.hpp"

namespace {

using workbundle::work::IsApplied;

workbundle::v1::WorkBundle WithConditions(const std::vector<std::pair<std::string, std::string>>& conditions) {
  workbundle::v1::WorkBundle bundle;
  for (const auto& [type, status] : conditions) {
    auto* condition = bundle.mutable_status()->add_conditions();
    condition->set_type(type);
    condition->set_status(status);
  }
  return bundle;
}

void TestAppliedAndAvailableWithoutDegraded() {
  assert(IsApplied(WithConditions({{"Applied", "True"}, {"Available", "True"}})));
}

void TestDegradedFalseStillApplied() {
  assert(IsApplied(WithConditions({{"Applied", "True"}, {"Available", "True"}, {"Degraded", "False"}})));
}

void TestDegradedUnknownStillApplied() {
  assert(IsApplied(WithConditions({{"Applied", "True"}, {"Available", "True"}, {"Degraded", "Unknown"}})));
}

void TestDegradedTrueIsNotApplied() {
  assert(!IsApplied(WithConditions({{"Applied", "True"}, {"Available", "True"}, {"Degraded", "True"}})));
}

void TestMissingAvailableIsNotApplied() {
  assert(!IsApplied(WithConditions({{"Applied", "True"}})));
}

void TestUnknownAppliedIsNotApplied() {
  assert(!IsApplied(WithConditions({{"Applied", "Unknown"}, {"Available", "True"}})));
}

void TestEmptyStatusIsNotApplied() {
  assert(!IsApplied(workbundle::v1::WorkBundle{}));
}

void TestLaterDegradedTrueIsNotApplied() {
  assert(!IsApplied(
      WithConditions({{"Applied", "True"}, {"Available", "True"}, {"Degraded", "False"}, {"Degraded", "True"}})));
}

void TestLaterAppliedTrueIsApplied() {
  assert(IsApplied(WithConditions({{"Applied", "False"}, {"Applied", "True"}, {"Available", "True"}})));
  assert(IsApplied(WithConditions({{"Applied", "True"}, {"Applied", "False"}, {"Available", "True"}})));
}

void TestConditionListOverload() {
  const auto bundle = WithConditions({{"Available", "True"}, {"Applied", "True"}});
  assert(IsApplied(bundle.status().conditions()));
}

} // namespace

int main() {
  TestAppliedAndAvailableWithoutDegraded();
  TestDegradedFalseStillApplied();
  TestDegradedUnknownStillApplied();
  TestDegradedTrueIsNotApplied();
  TestMissingAvailableIsNotApplied();
  TestUnknownAppliedIsNotApplied();
  TestEmptyStatusIsNotApplied();
  TestLaterDegradedTrueIsNotApplied();
  TestLaterAppliedTrueIsApplied();
  TestConditionListOverload();

  std::cout << "workbundle_unit_status_interpreter: pass\n";
  return 0;
}
