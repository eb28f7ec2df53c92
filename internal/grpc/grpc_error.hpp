#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/store/api/result.hpp"
#include "internal/util/errors.hpp"

namespace workbundle::grpc {

/*
  Converts internal exceptions and store results into gRPC status codes,
  and gRPC statuses back into store results on the client side.
*/

::grpc::Status ToStatus(const std::exception& e);

::grpc::Status ToStatus(const store::Result& result);

store::Result FromStatus(const ::grpc::Status& status);

} // namespace workbundle::grpc
