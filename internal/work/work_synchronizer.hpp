#pragma once

#include <memory>

#include <google/protobuf/repeated_ptr_field.h>

#include "internal/store/api/bundle_store.hpp"
#include "workbundle/v1.hpp"

namespace workbundle::observability {
class MetricsRegistry;
}

namespace workbundle::work {

enum class ConvergeOutcome { kCreated, kUnchanged, kUpdated };

const char* ToString(ConvergeOutcome outcome);

/*
  Same length, same order, and per position the same kind and byte-identical
  raw payload. apiVersion is not compared; it is implied by kind.
*/
bool ManifestsEqual(const google::protobuf::RepeatedPtrField<workbundle::v1::Manifest>& lhs,
                    const google::protobuf::RepeatedPtrField<workbundle::v1::Manifest>& rhs);

/*
  Create-or-update convergence of one bundle against the remote store.

  CRITICAL GUARANTEES:

  - Nothing is written when the remote manifests already equal the desired ones
  - An update is always conditioned on the fetched resource_version; the
    store rejects it with Conflict when another writer got there first
  - A concurrent creator winning the create race is not an error
  - No retries; the caller owns the retry policy
  - The CallContext is checked before every remote call
*/
class WorkSynchronizer {
 public:
  // Throws util::InvalidState when `store` does not enforce versioned updates.
  explicit WorkSynchronizer(std::shared_ptr<store::BundleStore>          store,
                            std::shared_ptr<observability::MetricsRegistry> metrics = nullptr);

  ConvergeOutcome Converge(const store::CallContext& ctx, const workbundle::v1::WorkBundle& desired);

 private:
  ConvergeOutcome Reconcile(const store::CallContext& ctx, const workbundle::v1::WorkBundle& desired);

  std::shared_ptr<store::BundleStore>             store_;
  std::shared_ptr<observability::MetricsRegistry> metrics_;
};

} // namespace workbundle::work
