#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace workbundle::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace workbundle::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const InvalidTarget*>(&e) ||
      dynamic_cast<const EncodeError*>(&e) || dynamic_cast<const DecodeError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const Cancelled*>(&e)) {
    return {::grpc::StatusCode::CANCELLED, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const Unimplemented*>(&e)) {
    return {::grpc::StatusCode::UNIMPLEMENTED, e.what()};
  }
  if (const auto* store_error = dynamic_cast<const StoreError*>(&e)) {
    return ToStatus(store::Result::Err(store_error->code(), e.what()));
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

::grpc::Status ToStatus(const store::Result& result) {
  switch (result.code) {
    case store::ErrorCode::OK:
      return ::grpc::Status::OK;
    case store::ErrorCode::NotFound:
      return {::grpc::StatusCode::NOT_FOUND, result.message};
    case store::ErrorCode::AlreadyExists:
      return {::grpc::StatusCode::ALREADY_EXISTS, result.message};
    case store::ErrorCode::Conflict:
      return {::grpc::StatusCode::ABORTED, result.message};
    case store::ErrorCode::Cancelled:
      return {::grpc::StatusCode::CANCELLED, result.message};
    case store::ErrorCode::DeadlineExceeded:
      return {::grpc::StatusCode::DEADLINE_EXCEEDED, result.message};
    case store::ErrorCode::InvalidArgument:
      return {::grpc::StatusCode::INVALID_ARGUMENT, result.message};
    case store::ErrorCode::Unavailable:
      return {::grpc::StatusCode::UNAVAILABLE, result.message};
    case store::ErrorCode::Unsupported:
      return {::grpc::StatusCode::UNIMPLEMENTED, result.message};
    default:
      return {::grpc::StatusCode::INTERNAL, result.message};
  }
}

store::Result FromStatus(const ::grpc::Status& status) {
  switch (status.error_code()) {
    case ::grpc::StatusCode::OK:
      return store::Result::Ok();
    case ::grpc::StatusCode::NOT_FOUND:
      return store::Result::Err(store::ErrorCode::NotFound, status.error_message());
    case ::grpc::StatusCode::ALREADY_EXISTS:
      return store::Result::Err(store::ErrorCode::AlreadyExists, status.error_message());
    case ::grpc::StatusCode::ABORTED:
      return store::Result::Err(store::ErrorCode::Conflict, status.error_message());
    case ::grpc::StatusCode::CANCELLED:
      return store::Result::Err(store::ErrorCode::Cancelled, status.error_message());
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      return store::Result::Err(store::ErrorCode::DeadlineExceeded, status.error_message());
    case ::grpc::StatusCode::INVALID_ARGUMENT:
      return store::Result::Err(store::ErrorCode::InvalidArgument, status.error_message());
    case ::grpc::StatusCode::UNAVAILABLE:
      return store::Result::Err(store::ErrorCode::Unavailable, status.error_message());
    case ::grpc::StatusCode::UNIMPLEMENTED:
      return store::Result::Err(store::ErrorCode::Unsupported, status.error_message());
    case ::grpc::StatusCode::DATA_LOSS:
      return store::Result::Err(store::ErrorCode::Corruption, status.error_message());
    default:
      return store::Result::Err(store::ErrorCode::InternalError, status.error_message());
  }
}

} // namespace workbundle::grpc
