#pragma once

#include <string>
#include <utility>

namespace workbundle::store {

/*
  Portable store result codes.

  Every BundleStore backend must translate its native errors (sqlite rc,
  gRPC status) into these. The work layer never sees backend error types.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,

  Cancelled,
  DeadlineExceeded,
  Unavailable,

  InvalidArgument,
  IOError,
  Corruption,

  Unsupported,
  InternalError
};

const char* ToString(ErrorCode code);

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace workbundle::store
