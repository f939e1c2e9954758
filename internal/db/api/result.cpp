#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace resource::db {

void ThrowIfError(const Result& result, const std::string& prefix) {
  if (result) return;
  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(prefix + ": " + result.message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::Conflict:
      throw util::Conflict(prefix + ": " + result.message);
    default:
      throw std::runtime_error(prefix + ": " + result.message);
  }
}

} // namespace resource::db
