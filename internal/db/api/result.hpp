#pragma once

#include <string>
#include <string_view>

namespace claims::db {

/*
  Outcome of a ClaimStore call.

  Backends translate native errors (sqlite result codes, pqxx exceptions)
  into these codes; ClaimService maps them onto domain exceptions.
*/
enum class ErrorCode {
  OK = 0,

  NotFound,
  AlreadyExists,
  Conflict,             // compare-and-set lost
  Busy,                 // database locked by another writer
  SerializationFailure, // postgres serialization conflict
  ConstraintViolation,  // invalid claim or illegal mutation
  IOError,
  InternalError
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not-found";
    case ErrorCode::AlreadyExists:
      return "already-exists";
    case ErrorCode::Conflict:
      return "conflict";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization-failure";
    case ErrorCode::ConstraintViolation:
      return "constraint-violation";
    case ErrorCode::IOError:
      return "io-error";
    case ErrorCode::InternalError:
    default:
      return "internal-error";
  }
}

// True for codes a caller may resolve by re-reading the claim and trying again.
constexpr bool IsContention(ErrorCode code) {
  return code == ErrorCode::Conflict || code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
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

} // namespace claims::db
