#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"
#include "internal/store/api/bundle_store.hpp"

namespace workbundle::factory {

/*
  Everything the broker process owns for its lifetime.
*/
struct Application {
  std::shared_ptr<store::BundleStore>           store;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Builds the store selected by `config.store()`: sqlite when a sqlite path is
  configured, in-memory otherwise.

  NOTE:
  This is the composition root. It is the ONLY place allowed to know
  concrete store types.
*/
std::shared_ptr<store::BundleStore> BuildStore(const workbundle::runtime::config::RuntimeConfig& config);

Application Build(const workbundle::runtime::config::RuntimeConfig& config);

} // namespace workbundle::factory
