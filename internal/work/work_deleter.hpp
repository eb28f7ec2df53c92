#pragma once

#include <memory>
#include <string>

#include "internal/store/api/bundle_store.hpp"

namespace workbundle::observability {
class MetricsRegistry;
}

namespace workbundle::work {

enum class DeleteOutcome { kDeleted, kAlreadyAbsent };

const char* ToString(DeleteOutcome outcome);

/*
  Idempotent bundle removal. A bundle that is already gone, or that another
  deleter removes between our get and delete, is reported as kAlreadyAbsent
  rather than an error.
*/
class WorkDeleter {
 public:
  explicit WorkDeleter(std::shared_ptr<store::BundleStore>             store,
                       std::shared_ptr<observability::MetricsRegistry> metrics = nullptr);

  DeleteOutcome Delete(const store::CallContext& ctx, const std::string& name, const std::string& target_location);

  // Removes the owner's "vrg" bundle only. The "ns" bundle stays.
  DeleteOutcome DeleteWorkloadBundle(const store::CallContext& ctx, const std::string& owner_name,
                                     const std::string& owner_namespace, const std::string& target_location);

 private:
  DeleteOutcome Remove(const store::CallContext& ctx, const std::string& name, const std::string& target_location);
  void          Count(std::string_view metric) const;

  std::shared_ptr<store::BundleStore>             store_;
  std::shared_ptr<observability::MetricsRegistry> metrics_;
};

} // namespace workbundle::work
