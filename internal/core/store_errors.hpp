#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace workledger::core {

// Raises the util:: error matching a failed repository write. The open
// transaction is left to its destructor, which rolls it back.
inline void ThrowIfDbError(const db::Result& result, const std::string& what) {
  if (result) return;

  const std::string msg = what + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(msg);
    case db::ErrorCode::AlreadyExists:
      throw util::AlreadyExists(msg);
    case db::ErrorCode::ConstraintViolation:
      throw util::InvalidArgument(msg);
    default:
      throw std::runtime_error(msg);
  }
}

} // namespace workledger::core
