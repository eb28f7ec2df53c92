#pragma once

#include <grpcpp/channel.h>

#include <memory>
#include <string>

#include "internal/store/api/bundle_store.hpp"
#include "workbundle/v1_grpc.hpp"

namespace workbundle::store {

/*
  BundleStore backed by a remote broker over gRPC.

  The CallContext deadline becomes the RPC deadline. Status codes are mapped
  back onto store ErrorCodes; version checks happen on the broker.
*/
class GrpcBundleStore final : public BundleStore {
 public:
  explicit GrpcBundleStore(std::shared_ptr<::grpc::Channel> channel);

  Result Get(const CallContext& ctx, const std::string& name, const std::string& target_location,
             workbundle::v1::WorkBundle* out) override;
  Result Create(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) override;
  Result Update(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) override;
  Result UpdateStatus(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) override;
  Result Delete(const CallContext& ctx, const std::string& name, const std::string& target_location) override;

  bool EnforcesVersionedUpdates() const override {
    return true;
  }

 private:
  std::unique_ptr<workbundle::v1::BundleStoreService::Stub> stub_;
};

} // namespace workbundle::store
