#pragma once

#include <string>
#include <string_view>

#include "internal/store/api/result.hpp"

namespace workbundle::work {

/*
  Turns a failed gateway Result into the matching util exception.

  Cancelled / DeadlineExceeded become util::Cancelled / util::DeadlineExceeded,
  Conflict becomes util::Conflict, and everything else a util::StoreError
  (util::FetchError when `op` is a read). Messages carry op, bundle and
  location. OK is a no-op.
*/
void ThrowIfStoreError(const store::Result& result, std::string_view op, const std::string& name,
                       const std::string& target_location);

inline constexpr std::string_view kOpGet    = "get";
inline constexpr std::string_view kOpCreate = "create";
inline constexpr std::string_view kOpUpdate = "update";
inline constexpr std::string_view kOpDelete = "delete";

} // namespace workbundle::work
