#pragma once

#include <string>

#include "internal/store/api/call_context.hpp"
#include "internal/store/api/result.hpp"
#include "workbundle/v1.hpp"

namespace workbundle::store {

/*
  Remote store gateway for work bundles, keyed by (name, target_location).

  CRITICAL GUARANTEES:

  - Create fails with AlreadyExists when the key is taken
  - Create assigns resource_version = 1 and clears status
  - Update / UpdateStatus only succeed when the submitted resource_version
    equals the stored one (Conflict otherwise) and bump it by one
  - Update replaces labels, annotations and manifests and keeps status
  - UpdateStatus replaces status only
  - Get / Delete report NotFound for a missing key

  Every call honors the CallContext: a cancelled or expired context yields
  Cancelled / DeadlineExceeded without touching the store.
*/

class BundleStore {
 public:
  virtual ~BundleStore() = default;

  virtual Result Get(const CallContext&, const std::string& name, const std::string& target_location,
                     workbundle::v1::WorkBundle* out) = 0;

  // On success `bundle` carries the stored resource_version.
  virtual Result Create(const CallContext&, workbundle::v1::WorkBundle& bundle) = 0;

  virtual Result Update(const CallContext&, workbundle::v1::WorkBundle& bundle) = 0;

  virtual Result UpdateStatus(const CallContext&, workbundle::v1::WorkBundle& bundle) = 0;

  virtual Result Delete(const CallContext&, const std::string& name, const std::string& target_location) = 0;

  // False for a backend that cannot reject stale writes. The synchronizer
  // refuses to run on such a store.
  virtual bool EnforcesVersionedUpdates() const = 0;
};

} // namespace workbundle::store
