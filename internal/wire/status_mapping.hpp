#pragma once

#include <arrow/buffer.h>

#include <exception>

#include "internal/wire/frame.hpp"
#include "resource/pipeline/v1.hpp"

namespace resource::wire {

/*
  Converts internal exceptions into wire statuses and back.

  Every non-OK response carries an ErrorDetail so the client can raise
  the same exception type the server caught.
*/

struct WireError {
  Status                             status = Status::kError;
  resource::pipeline::v1::ErrorDetail detail;
};

WireError ToWireError(const std::exception& e);

// Throws the exception matching a non-OK response.
[[noreturn]] void RaiseWireError(Status status, const arrow::Buffer& payload);

} // namespace resource::wire
