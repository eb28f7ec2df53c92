#pragma once

#include <map>
#include <mutex>
#include <string>
#include <utility>

#include "internal/store/api/bundle_store.hpp"

namespace workbundle::store::memory {

class MemoryBundleStore final : public store::BundleStore {
 public:
  MemoryBundleStore();

  Result Get(const CallContext&, const std::string& name, const std::string& target_location,
             workbundle::v1::WorkBundle* out) override;
  Result Create(const CallContext&, workbundle::v1::WorkBundle& bundle) override;
  Result Update(const CallContext&, workbundle::v1::WorkBundle& bundle) override;
  Result UpdateStatus(const CallContext&, workbundle::v1::WorkBundle& bundle) override;
  Result Delete(const CallContext&, const std::string& name, const std::string& target_location) override;

  bool EnforcesVersionedUpdates() const override {
    return true;
  }

  std::size_t Size() const;

 private:
  // (target_location, name)
  using Key = std::pair<std::string, std::string>;

  mutable std::mutex                        mutex_;
  std::map<Key, workbundle::v1::WorkBundle> bundles_;
};

} // namespace workbundle::store::memory
