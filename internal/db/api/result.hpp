#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace flotilla::db {

// What a repository write can fail with, independent of the storage engine.
// sqlite and libpqxx errors never leave the repository implementations.
enum class ErrorCode {
  OK = 0,

  // the row addressed by id or key does not exist
  NotFound,
  // primary key already taken
  AlreadyExists,
  // unique or foreign key check failed, e.g. a second live drone name
  ConstraintViolation,

  // lost to a concurrent writer
  Busy,
  SerializationFailure,

  IOError,
  Corruption,
  InternalError,
};

constexpr std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::SerializationFailure:
      return "serialization failure";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode code, std::string message = {}) {
    return {code, std::move(message)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // Busy and serialization failures go away if the whole transaction is
  // run again; constraint violations do not.
  bool IsConflict() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  std::string Describe() const {
    std::string out(ErrorCodeName(code));
    if (!message.empty()) {
      out.append(": ").append(message);
    }
    return out;
  }
};

} // namespace flotilla::db
