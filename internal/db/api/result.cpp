#include "internal/db/api/result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace codeintel::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::ConstraintViolation:
      throw util::Conflict(message);
    case ErrorCode::Busy:
      throw std::runtime_error("database busy: " + message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace codeintel::db
