#pragma once

#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace ainp::db {

inline void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto message = context + " (" + ErrorCodeName(result.code) + ")";
  if (!result.message.empty()) {
    message += ": " + result.message;
  }
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::StoreError(message);
  }
}

} // namespace ainp::db
