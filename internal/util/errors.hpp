#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "internal/model/claim.hpp"

namespace claims::util {

/*
  Central error types.

  Foreground operations throw one of these. When the failure concerns an
  existing claim, the exception carries the claim as it was observed so the
  caller can decide whether to re-read, retry or escalate.
*/

enum class ErrorKind {
  kValidation,
  kNotFound,
  kConflict,
  kInvalidTransition,
  kNotOwner,
  kAlreadyClaimed,
  kHandoffNotFound,
  kHandoffAlreadyResolved,
  kClaimNotOwnedByRequester,
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kValidation:
      return "ValidationError";
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kConflict:
      return "Conflict";
    case ErrorKind::kInvalidTransition:
      return "InvalidTransition";
    case ErrorKind::kNotOwner:
      return "NotOwner";
    case ErrorKind::kAlreadyClaimed:
      return "AlreadyClaimed";
    case ErrorKind::kHandoffNotFound:
      return "HandoffNotFound";
    case ErrorKind::kHandoffAlreadyResolved:
      return "HandoffAlreadyResolved";
    case ErrorKind::kClaimNotOwnedByRequester:
    default:
      return "ClaimNotOwnedByRequester";
  }
}

class ClaimError : public std::runtime_error {
 public:
  ClaimError(ErrorKind kind, const std::string& msg, std::optional<model::Claim> snapshot = std::nullopt)
      : std::runtime_error(msg), kind_(kind), snapshot_(std::move(snapshot)) {
  }

  ErrorKind Kind() const {
    return kind_;
  }

  const std::optional<model::Claim>& Snapshot() const {
    return snapshot_;
  }

 private:
  ErrorKind                   kind_;
  std::optional<model::Claim> snapshot_;
};

class ValidationError : public ClaimError {
 public:
  explicit ValidationError(const std::string& msg) : ClaimError(ErrorKind::kValidation, msg) {
  }
};

class NotFound : public ClaimError {
 public:
  explicit NotFound(const std::string& msg) : ClaimError(ErrorKind::kNotFound, msg) {
  }
};

class Conflict : public ClaimError {
 public:
  Conflict(const std::string& msg, std::optional<model::Claim> snapshot) : ClaimError(ErrorKind::kConflict, msg, std::move(snapshot)) {
  }
};

class InvalidTransition : public ClaimError {
 public:
  InvalidTransition(const std::string& msg, std::optional<model::Claim> snapshot)
      : ClaimError(ErrorKind::kInvalidTransition, msg, std::move(snapshot)) {
  }
};

class NotOwner : public ClaimError {
 public:
  NotOwner(const std::string& msg, std::optional<model::Claim> snapshot) : ClaimError(ErrorKind::kNotOwner, msg, std::move(snapshot)) {
  }
};

class AlreadyClaimed : public ClaimError {
 public:
  AlreadyClaimed(const std::string& msg, std::optional<model::Claim> snapshot)
      : ClaimError(ErrorKind::kAlreadyClaimed, msg, std::move(snapshot)) {
  }
};

class HandoffNotFound : public ClaimError {
 public:
  explicit HandoffNotFound(const std::string& msg) : ClaimError(ErrorKind::kHandoffNotFound, msg) {
  }
};

class HandoffAlreadyResolved : public ClaimError {
 public:
  explicit HandoffAlreadyResolved(const std::string& msg) : ClaimError(ErrorKind::kHandoffAlreadyResolved, msg) {
  }
};

class ClaimNotOwnedByRequester : public ClaimError {
 public:
  ClaimNotOwnedByRequester(const std::string& msg, std::optional<model::Claim> snapshot)
      : ClaimError(ErrorKind::kClaimNotOwnedByRequester, msg, std::move(snapshot)) {
  }
};

} // namespace claims::util
