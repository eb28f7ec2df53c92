#include "memory_bundle_store.hpp"

#include "internal/util/time.hpp"

namespace workbundle::store::memory {

MemoryBundleStore::MemoryBundleStore() = default;

Result MemoryBundleStore::Get(const CallContext& ctx, const std::string& name, const std::string& target_location,
                              workbundle::v1::WorkBundle* out) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  const auto       it = bundles_.find(Key(target_location, name));
  if (it == bundles_.end()) {
    return Result::Err(ErrorCode::NotFound, "bundle " + name + " not found in " + target_location);
  }
  if (out) *out = it->second;
  return Result::Ok();
}

Result MemoryBundleStore::Create(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  const auto       key = Key(bundle.target_location(), bundle.name());
  if (bundles_.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "bundle " + bundle.name() + " already exists in " + bundle.target_location());
  }

  bundle.set_resource_version(1);
  bundle.set_created_at_ms(util::NowUnixMillis());
  bundle.clear_status();
  bundles_[key] = bundle;
  return Result::Ok();
}

Result MemoryBundleStore::Update(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  auto             it = bundles_.find(Key(bundle.target_location(), bundle.name()));
  if (it == bundles_.end()) {
    return Result::Err(ErrorCode::NotFound, "bundle " + bundle.name() + " not found in " + bundle.target_location());
  }

  auto& stored = it->second;
  if (stored.resource_version() != bundle.resource_version()) {
    return Result::Err(ErrorCode::Conflict, "stale resource_version " + std::to_string(bundle.resource_version()) + ", current " +
                                                std::to_string(stored.resource_version()));
  }

  *stored.mutable_labels()      = bundle.labels();
  *stored.mutable_annotations() = bundle.annotations();
  *stored.mutable_manifests()   = bundle.manifests();
  stored.set_resource_version(stored.resource_version() + 1);

  bundle = stored;
  return Result::Ok();
}

Result MemoryBundleStore::UpdateStatus(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  auto             it = bundles_.find(Key(bundle.target_location(), bundle.name()));
  if (it == bundles_.end()) {
    return Result::Err(ErrorCode::NotFound, "bundle " + bundle.name() + " not found in " + bundle.target_location());
  }

  auto& stored = it->second;
  if (stored.resource_version() != bundle.resource_version()) {
    return Result::Err(ErrorCode::Conflict, "stale resource_version " + std::to_string(bundle.resource_version()) + ", current " +
                                                std::to_string(stored.resource_version()));
  }

  *stored.mutable_status() = bundle.status();
  stored.set_resource_version(stored.resource_version() + 1);

  bundle = stored;
  return Result::Ok();
}

Result MemoryBundleStore::Delete(const CallContext& ctx, const std::string& name, const std::string& target_location) {
  if (auto check = ctx.Check(); !check) return check;

  std::scoped_lock lock(mutex_);
  if (bundles_.erase(Key(target_location, name)) == 0) {
    return Result::Err(ErrorCode::NotFound, "bundle " + name + " not found in " + target_location);
  }
  return Result::Ok();
}

std::size_t MemoryBundleStore::Size() const {
  std::scoped_lock lock(mutex_);
  return bundles_.size();
}

} // namespace workbundle::store::memory
