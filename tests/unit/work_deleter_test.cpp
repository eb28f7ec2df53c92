#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/work/name_formatter.hpp"
#include "internal/work/work_deleter.hpp"
#include "tests/unit/support/scripted_bundle_store.hpp"

namespace {

using workbundle::store::CallContext;
using workbundle::store::ErrorCode;
using workbundle::store::Result;
using workbundle::testing::ScriptedBundleStore;
using workbundle::work::DeleteOutcome;
using workbundle::work::WorkDeleter;

void Seed(ScriptedBundleStore& store, const std::string& name, const std::string& location) {
  workbundle::v1::WorkBundle bundle;
  bundle.set_name(name);
  bundle.set_target_location(location);
  const auto created = store.inner.Create(CallContext(), bundle);
  assert(created);
}

void TestDeleteRemovesBundle() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  Seed(*store, "app1-ns1-vrg-mw", "cluster-a");

  assert(deleter.Delete(CallContext(), "app1-ns1-vrg-mw", "cluster-a") == DeleteOutcome::kDeleted);
  assert(store->inner.Size() == 0);
}

void TestDeleteIsIdempotent() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  Seed(*store, "b", "cluster-a");

  assert(deleter.Delete(CallContext(), "b", "cluster-a") == DeleteOutcome::kDeleted);
  assert(deleter.Delete(CallContext(), "b", "cluster-a") == DeleteOutcome::kAlreadyAbsent);
  assert(store->deletes == 1);
}

void TestConcurrentDeleterWinningIsSuccess() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  Seed(*store, "b", "cluster-a");

  store->before_delete = [&] {
    const auto removed = store->inner.Delete(CallContext(), "b", "cluster-a");
    assert(removed);
  };

  assert(deleter.Delete(CallContext(), "b", "cluster-a") == DeleteOutcome::kAlreadyAbsent);
}

void TestGetFailureIsFetchError() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  store->fail_get = Result::Err(ErrorCode::Unavailable, "broker down");

  bool threw = false;
  try {
    (void)deleter.Delete(CallContext(), "b", "cluster-a");
  } catch (const workbundle::util::FetchError& e) {
    threw = e.code() == ErrorCode::Unavailable;
  }
  assert(threw);
  assert(store->deletes == 0);
}

void TestDeleteFailureIsStoreError() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  Seed(*store, "b", "cluster-a");
  store->fail_delete = Result::Err(ErrorCode::IOError, "disk");

  bool threw = false;
  try {
    (void)deleter.Delete(CallContext(), "b", "cluster-a");
  } catch (const workbundle::util::StoreError& e) {
    threw = e.code() == ErrorCode::IOError;
  }
  assert(threw);
}

void TestEmptyTargetIsInvalidTarget() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);

  bool threw = false;
  try {
    (void)deleter.Delete(CallContext(), "b", "");
  } catch (const workbundle::util::InvalidTarget&) {
    threw = true;
  }
  assert(threw);
  assert(store->Calls() == 0);
}

void TestWorkloadTeardownKeepsNamespaceBundle() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);

  const auto vrg_name = workbundle::work::BundleName("app1", "ns1", workbundle::work::kKindWorkload);
  const auto ns_name  = workbundle::work::BundleName("app1", "ns1", workbundle::work::kKindNamespace);
  Seed(*store, vrg_name, "cluster-a");
  Seed(*store, ns_name, "cluster-a");

  assert(deleter.DeleteWorkloadBundle(CallContext(), "app1", "ns1", "cluster-a") == DeleteOutcome::kDeleted);
  assert(store->inner.Get(CallContext(), vrg_name, "cluster-a", nullptr).code == ErrorCode::NotFound);
  assert(store->inner.Get(CallContext(), ns_name, "cluster-a", nullptr).code == ErrorCode::OK);
}

void TestCancelledContextAbortsDelete() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  Seed(*store, "b", "cluster-a");

  CallContext ctx;
  ctx.Cancel();

  bool threw = false;
  try {
    (void)deleter.Delete(ctx, "b", "cluster-a");
  } catch (const workbundle::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(store->inner.Size() == 1);
}

void TestCancelBetweenGetAndDeleteKeepsBundle() {
  auto        store = std::make_shared<ScriptedBundleStore>();
  WorkDeleter deleter(store);
  Seed(*store, "app1-ns1-vrg-mw", "cluster-a");

  CallContext ctx;
  store->after_get = [ctx]() mutable { ctx.Cancel(); };

  bool threw = false;
  try {
    (void)deleter.Delete(ctx, "app1-ns1-vrg-mw", "cluster-a");
  } catch (const workbundle::util::Cancelled&) {
    threw = true;
  }
  assert(threw);
  assert(store->gets == 1);
  assert(store->deletes == 0);
  assert(store->inner.Size() == 1);
}

} // namespace

int main() {
  TestDeleteRemovesBundle();
  TestDeleteIsIdempotent();
  TestConcurrentDeleterWinningIsSuccess();
  TestGetFailureIsFetchError();
  TestDeleteFailureIsStoreError();
  TestEmptyTargetIsInvalidTarget();
  TestWorkloadTeardownKeepsNamespaceBundle();
  TestCancelledContextAbortsDelete();
  TestCancelBetweenGetAndDeleteKeepsBundle();

  std::cout << "workbundle_unit_work_deleter: pass\n";
  return 0;
}
