#pragma once

#include <string>

namespace ainp::db {

/*
  Repository status codes.

  Backends map sqlite / pqxx failures onto these; nothing above the
  repository sees a backend error type. ThrowIfDbError turns a failed
  Result into the matching util:: exception.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,
  Busy,

  ConstraintViolation,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:                   return "ok";
    case ErrorCode::NotFound:             return "not_found";
    case ErrorCode::AlreadyExists:        return "already_exists";
    case ErrorCode::Conflict:             return "conflict";
    case ErrorCode::Busy:                 return "busy";
    case ErrorCode::ConstraintViolation:  return "constraint_violation";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::IOError:              return "io_error";
    case ErrorCode::Corruption:           return "corruption";
    case ErrorCode::InternalError:        return "internal_error";
  }
  return "unknown";
}

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

} // namespace ainp::db
