#include "internal/db/api/result.hpp"

#include "internal/util/errors.hpp"

namespace routebid::db {

void ThrowIfError(const Result& result, std::string_view context) {
  if (result) {
    return;
  }

  std::string message(context);
  if (!result.message.empty()) {
    message += ": " + result.message;
  }

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
      throw util::Conflict(message);
    case ErrorCode::Busy:
      throw util::Busy(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::Conflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace routebid::db
