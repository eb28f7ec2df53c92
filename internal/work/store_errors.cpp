#include "internal/work/store_errors.hpp"

#include "internal/util/errors.hpp"

namespace workbundle::work {

void ThrowIfStoreError(const store::Result& result, std::string_view op, const std::string& name,
                       const std::string& target_location) {
  if (result) {
    return;
  }

  const std::string message = "failed to " + std::string(op) + " bundle " + name + " on " + target_location + ": " +
                              store::ToString(result.code) + ": " + result.message;

  switch (result.code) {
    case store::ErrorCode::Cancelled:
      throw util::Cancelled(message);
    case store::ErrorCode::DeadlineExceeded:
      throw util::DeadlineExceeded(message);
    case store::ErrorCode::Conflict:
      throw util::Conflict(message);
    default:
      break;
  }

  if (op == kOpGet) {
    throw util::FetchError(result.code, message);
  }
  throw util::StoreError(result.code, message);
}

} // namespace workbundle::work
