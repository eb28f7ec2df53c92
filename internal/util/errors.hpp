#pragma once

#include <stdexcept>
#include <string>

#include "internal/store/api/result.hpp"

namespace workbundle::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Empty or otherwise unusable target location. Raised before any remote call.
class InvalidTarget : public std::runtime_error {
 public:
  explicit InvalidTarget(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EncodeError : public std::runtime_error {
 public:
  explicit EncodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DecodeError : public std::runtime_error {
 public:
  explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unimplemented : public std::runtime_error {
 public:
  explicit Unimplemented(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Cancelled : public std::runtime_error {
 public:
  explicit Cancelled(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public std::runtime_error {
 public:
  explicit DeadlineExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

/*
  Remote store failure. Keeps the portable store code so callers can tell a
  transient outage from a corrupt record.
*/
class StoreError : public std::runtime_error {
 public:
  StoreError(store::ErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  store::ErrorCode code() const {
    return code_;
  }

 private:
  store::ErrorCode code_;
};

// A read of the remote bundle failed for a reason other than absence.
class FetchError : public StoreError {
 public:
  FetchError(store::ErrorCode code, const std::string& msg) : StoreError(code, msg) {
  }
};

// Version-conditioned write rejected; the caller should re-read and retry.
class Conflict : public StoreError {
 public:
  explicit Conflict(const std::string& msg) : StoreError(store::ErrorCode::Conflict, msg) {
  }
};

} // namespace workbundle::util
