#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "internal/store/api/bundle_store.hpp"
#include "workbundle/v1_grpc.hpp"

namespace workbundle::grpc {

class BundleStoreServer final : public workbundle::v1::BundleStoreService::Service {
 public:
  explicit BundleStoreServer(std::shared_ptr<store::BundleStore> store);

  ::grpc::Status GetBundle(::grpc::ServerContext*, const workbundle::v1::GetBundleRequest*,
                           workbundle::v1::WorkBundle*) override;
  ::grpc::Status CreateBundle(::grpc::ServerContext*, const workbundle::v1::WorkBundle*,
                              workbundle::v1::WorkBundle*) override;
  ::grpc::Status UpdateBundle(::grpc::ServerContext*, const workbundle::v1::WorkBundle*,
                              workbundle::v1::WorkBundle*) override;
  ::grpc::Status UpdateBundleStatus(::grpc::ServerContext*, const workbundle::v1::WorkBundle*,
                                    workbundle::v1::WorkBundle*) override;
  ::grpc::Status DeleteBundle(::grpc::ServerContext*, const workbundle::v1::DeleteBundleRequest*,
                              google::protobuf::Empty*) override;

 private:
  std::shared_ptr<store::BundleStore> store_;
};

} // namespace workbundle::grpc
