#include "internal/store/grpc/grpc_bundle_store.hpp"

#include <grpcpp/client_context.h>

#include <chrono>
#include <utility>

#include "internal/grpc/grpc_error.hpp"

namespace workbundle::store {

namespace {

void ApplyDeadline(const CallContext& ctx, ::grpc::ClientContext* client) {
  if (auto remaining = ctx.Remaining()) {
    client->set_deadline(std::chrono::system_clock::now() + *remaining);
  }
}

template <typename Fn>
Result Call(const CallContext& ctx, Fn&& fn) {
  if (auto check = ctx.Check(); !check) {
    return check;
  }
  ::grpc::ClientContext client;
  ApplyDeadline(ctx, &client);
  return workbundle::grpc::FromStatus(fn(&client));
}

} // namespace

GrpcBundleStore::GrpcBundleStore(std::shared_ptr<::grpc::Channel> channel)
    : stub_(workbundle::v1::BundleStoreService::NewStub(std::move(channel))) {
}

Result GrpcBundleStore::Get(const CallContext& ctx, const std::string& name, const std::string& target_location,
                            workbundle::v1::WorkBundle* out) {
  workbundle::v1::GetBundleRequest req;
  req.set_name(name);
  req.set_target_location(target_location);
  workbundle::v1::WorkBundle fetched;
  auto result = Call(ctx, [&](::grpc::ClientContext* client) { return stub_->GetBundle(client, req, &fetched); });
  if (result && out) {
    *out = std::move(fetched);
  }
  return result;
}

Result GrpcBundleStore::Create(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  workbundle::v1::WorkBundle stored;
  auto result = Call(ctx, [&](::grpc::ClientContext* client) { return stub_->CreateBundle(client, bundle, &stored); });
  if (result) {
    bundle = std::move(stored);
  }
  return result;
}

Result GrpcBundleStore::Update(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  workbundle::v1::WorkBundle stored;
  auto result = Call(ctx, [&](::grpc::ClientContext* client) { return stub_->UpdateBundle(client, bundle, &stored); });
  if (result) {
    bundle = std::move(stored);
  }
  return result;
}

Result GrpcBundleStore::UpdateStatus(const CallContext& ctx, workbundle::v1::WorkBundle& bundle) {
  workbundle::v1::WorkBundle stored;
  auto result = Call(ctx, [&](::grpc::ClientContext* client) { return stub_->UpdateBundleStatus(client, bundle, &stored); });
  if (result) {
    bundle = std::move(stored);
  }
  return result;
}

Result GrpcBundleStore::Delete(const CallContext& ctx, const std::string& name, const std::string& target_location) {
  workbundle::v1::DeleteBundleRequest req;
  req.set_name(name);
  req.set_target_location(target_location);
  google::protobuf::Empty resp;
  return Call(ctx, [&](::grpc::ClientContext* client) { return stub_->DeleteBundle(client, req, &resp); });
}

} // namespace workbundle::store
