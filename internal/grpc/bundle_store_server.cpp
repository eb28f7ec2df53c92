#include "bundle_store_server.hpp"

#include <chrono>
#include <utility>

#include "grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace workbundle::grpc {

namespace {

// Carries the caller's RPC deadline into the store call.
store::CallContext ContextFor(const ::grpc::ServerContext* context) {
  const auto deadline = context->deadline();
  if (deadline == std::chrono::system_clock::time_point::max()) {
    return store::CallContext();
  }
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::system_clock::now());
  return store::CallContext::WithTimeout(remaining);
}

template <typename Fn>
::grpc::Status Serve(std::string_view route, std::string_view name, std::string_view target_location, Fn&& fn) {
  observability::SpanScope span(route, name, target_location);
  try {
    auto result = fn();
    span.SetOutcome(store::ToString(result.code));
    if (!result) {
      WORKBUNDLE_LOG_DEBUG("Store call rejected", {observability::StringField("route", route),
                                                   observability::StringField("code", store::ToString(result.code)),
                                                   observability::StringField("error", result.message)});
    }
    return ToStatus(result);
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    WORKBUNDLE_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", e.what())});
    return ToStatus(e);
  }
}

} // namespace

BundleStoreServer::BundleStoreServer(std::shared_ptr<store::BundleStore> store) : store_(std::move(store)) {
}

::grpc::Status BundleStoreServer::GetBundle(::grpc::ServerContext* context, const workbundle::v1::GetBundleRequest* req,
                                            workbundle::v1::WorkBundle* resp) {
  return Serve("GetBundle", req->name(), req->target_location(),
               [&] { return store_->Get(ContextFor(context), req->name(), req->target_location(), resp); });
}

::grpc::Status BundleStoreServer::CreateBundle(::grpc::ServerContext* context, const workbundle::v1::WorkBundle* req,
                                               workbundle::v1::WorkBundle* resp) {
  return Serve("CreateBundle", req->name(), req->target_location(), [&] {
    *resp = *req;
    return store_->Create(ContextFor(context), *resp);
  });
}

::grpc::Status BundleStoreServer::UpdateBundle(::grpc::ServerContext* context, const workbundle::v1::WorkBundle* req,
                                               workbundle::v1::WorkBundle* resp) {
  return Serve("UpdateBundle", req->name(), req->target_location(), [&] {
    *resp = *req;
    return store_->Update(ContextFor(context), *resp);
  });
}

::grpc::Status BundleStoreServer::UpdateBundleStatus(::grpc::ServerContext* context, const workbundle::v1::WorkBundle* req,
                                                     workbundle::v1::WorkBundle* resp) {
  return Serve("UpdateBundleStatus", req->name(), req->target_location(), [&] {
    *resp = *req;
    return store_->UpdateStatus(ContextFor(context), *resp);
  });
}

::grpc::Status BundleStoreServer::DeleteBundle(::grpc::ServerContext* context, const workbundle::v1::DeleteBundleRequest* req,
                                               google::protobuf::Empty*) {
  return Serve("DeleteBundle", req->name(), req->target_location(),
               [&] { return store_->Delete(ContextFor(context), req->name(), req->target_location()); });
}

} // namespace workbundle::grpc
