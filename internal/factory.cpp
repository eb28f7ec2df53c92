#include "factory.hpp"

#include <memory>
#include <utility>

#include "internal/grpc/bundle_store_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/memory/memory_bundle_store.hpp"
#include "internal/store/sqlite/sqlite_bundle_store.hpp"
#include "internal/store/sqlite/sqlite_db.hpp"

namespace workbundle::factory {

std::shared_ptr<store::BundleStore> BuildStore(const workbundle::runtime::config::RuntimeConfig& config) {
  const auto& store_config = config.store();
  if (store_config.has_sqlite() && !store_config.sqlite().path().empty()) {
    const auto& sqlite = store_config.sqlite();
    WORKBUNDLE_LOG_INFO("Using sqlite bundle store", {observability::StringField("path", sqlite.path()),
                                                      observability::BoolField("wal_mode", sqlite.wal_mode())});
    auto db    = std::make_shared<store::sqlite::SqliteDB>(sqlite.path(), sqlite.wal_mode());
    auto store = std::make_shared<store::sqlite::SqliteBundleStore>(std::move(db));
    store->Bootstrap();
    return store;
  }

  WORKBUNDLE_LOG_INFO("Using in-memory bundle store");
  return std::make_shared<store::memory::MemoryBundleStore>();
}

Application Build(const workbundle::runtime::config::RuntimeConfig& config) {
  Application app;

  app.store = BuildStore(config);

  app.grpc_services.push_back(std::make_unique<grpc::BundleStoreServer>(app.store));

  return app;
}

} // namespace workbundle::factory
