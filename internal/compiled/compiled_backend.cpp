#include "compiled_backend.hpp"

namespace resource::compiled {

std::string_view LookupStatusName(LookupStatus status) {
  switch (status) {
    case LookupStatus::kOk:
      return "ok";
    case LookupStatus::kStale:
      return "stale";
    case LookupStatus::kNotFound:
      return "not_found";
  }
  return "unknown";
}

} // namespace resource::compiled
