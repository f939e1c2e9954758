#include "status_mapping.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace resource::wire {

using resource::pipeline::v1::ErrorKind;

namespace {

WireError Make(Status status, ErrorKind kind, const std::exception& e) {
  WireError error;
  error.status = status;
  error.detail.set_kind(kind);
  error.detail.set_message(e.what());
  return error;
}

} // namespace

WireError ToWireError(const std::exception& e) {
  using namespace resource::util;
  using namespace resource::pipeline::v1;

  if (dynamic_cast<const NotFound*>(&e)) {
    return Make(Status::kNotFound, ERROR_KIND_NOT_FOUND, e);
  }
  if (dynamic_cast<const Stale*>(&e)) {
    return Make(Status::kStale, ERROR_KIND_STALE, e);
  }
  // SourceUnavailable before its base.
  if (dynamic_cast<const SourceUnavailable*>(&e)) {
    return Make(Status::kUnavailable, ERROR_KIND_SOURCE_UNAVAILABLE, e);
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return Make(Status::kUnavailable, ERROR_KIND_UNAVAILABLE, e);
  }
  if (dynamic_cast<const CompileFailure*>(&e)) {
    return Make(Status::kError, ERROR_KIND_COMPILE_FAILURE, e);
  }
  if (dynamic_cast<const ProtocolError*>(&e)) {
    return Make(Status::kError, ERROR_KIND_PROTOCOL, e);
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return Make(Status::kError, ERROR_KIND_CONFLICT, e);
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return Make(Status::kError, ERROR_KIND_INVALID_STATE, e);
  }

  return Make(Status::kError, ERROR_KIND_INTERNAL, e);
}

void RaiseWireError(Status status, const arrow::Buffer& payload) {
  using namespace resource::util;
  using namespace resource::pipeline::v1;

  ErrorDetail detail;
  if (!detail.ParseFromArray(payload.data(), static_cast<int>(payload.size()))) {
    throw ProtocolError("malformed error detail in " + std::string(StatusName(status)) + " response");
  }
  const std::string& message = detail.message();

  switch (detail.kind()) {
    case ERROR_KIND_NOT_FOUND:
      throw NotFound(message);
    case ERROR_KIND_STALE:
      throw Stale(message);
    case ERROR_KIND_SOURCE_UNAVAILABLE:
      throw SourceUnavailable(message);
    case ERROR_KIND_UNAVAILABLE:
      throw Unavailable(message);
    case ERROR_KIND_COMPILE_FAILURE:
      throw CompileFailure(message);
    case ERROR_KIND_PROTOCOL:
      throw ProtocolError(message);
    case ERROR_KIND_CONFLICT:
      throw Conflict(message);
    case ERROR_KIND_INVALID_STATE:
      throw InvalidState(message);
    default:
      break;
  }

  // Fall back on the status byte when the kind is generic.
  switch (status) {
    case Status::kNotFound:
      throw NotFound(message);
    case Status::kStale:
      throw Stale(message);
    case Status::kUnavailable:
      throw Unavailable(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace resource::wire
