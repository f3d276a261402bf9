#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace flotilla::db {

// Turns a failed repository write into the exception the core reports.
// The core checks uniqueness before it writes, so a constraint violation
// at write time means a concurrent transaction got there first and is
// reported as a conflict.
inline void ThrowIfError(const Result& result, std::string_view what) {
  if (result) return;

  const auto msg = std::string(what) + ": " + result.Describe();
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(msg);
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case ErrorCode::ConstraintViolation:
    case ErrorCode::Busy:
    case ErrorCode::SerializationFailure:
      throw TransactionConflict(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace flotilla::db
