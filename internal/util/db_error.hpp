#pragma once

#include <stdexcept>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/util/errors.hpp"

namespace tender::util {

// Translates a failed repository call into the service error taxonomy.
inline void ThrowIfDbError(const tender::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case tender::db::ErrorCode::AlreadyExists:
      throw AlreadyExists(message);
    case tender::db::ErrorCode::NotFound:
      throw NotFound(message);
    case tender::db::ErrorCode::Conflict:
      throw InvalidState(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace tender::util
