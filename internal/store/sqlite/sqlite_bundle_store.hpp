#pragma once

#include <memory>
#include <mutex>

#include "internal/store/api/bundle_store.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace workbundle::store::sqlite {

/*
  BundleStore persisted in a single sqlite table.

  Bundles are stored as serialized protobuf (spec and status in separate
  columns). Version-conditioned writes are a single
  UPDATE ... WHERE resource_version = ? inside an immediate transaction.
*/
class SqliteBundleStore final : public store::BundleStore {
 public:
  explicit SqliteBundleStore(std::shared_ptr<SqliteDB> db);

  // Creates the table if missing.
  void Bootstrap();

  Result Get(const CallContext&, const std::string& name, const std::string& target_location,
             workbundle::v1::WorkBundle* out) override;
  Result Create(const CallContext&, workbundle::v1::WorkBundle& bundle) override;
  Result Update(const CallContext&, workbundle::v1::WorkBundle& bundle) override;
  Result UpdateStatus(const CallContext&, workbundle::v1::WorkBundle& bundle) override;
  Result Delete(const CallContext&, const std::string& name, const std::string& target_location) override;

  bool EnforcesVersionedUpdates() const override {
    return true;
  }

 private:
  static Result Translate(sqlite3* db, int rc);

  Result GetLocked(const std::string& name, const std::string& target_location, workbundle::v1::WorkBundle* out);
  Result ConditionalWrite(const CallContext& ctx, workbundle::v1::WorkBundle& bundle, const char* sql, const std::string& blob);

  std::shared_ptr<SqliteDB> db_;

  // One connection; transactions must not interleave across threads.
  std::mutex mutex_;
};

} // namespace workbundle::store::sqlite
