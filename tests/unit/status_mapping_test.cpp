#include "internal/wire/status_mapping.hpp"

#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "client/cpp/resource_client.h"
#include "internal/util/errors.hpp"

namespace {

using namespace resource::pipeline::v1;
using resource::wire::Status;
using resource::wire::ToWireError;

template <typename Expected>
void ExpectRaised(const resource::wire::WireError& error, const std::string& message) {
  const auto payload = arrow::Buffer::FromString(error.detail.SerializeAsString());
  bool       raised  = false;
  try {
    resource::wire::RaiseWireError(error.status, *payload);
  } catch (const Expected& e) {
    raised = std::string(e.what()) == message;
  }
  assert(raised);
}

void TestNotFoundAndStaleHaveTheirOwnStatus() {
  const auto not_found = ToWireError(resource::util::NotFound("no such id"));
  assert(not_found.status == Status::kNotFound);
  assert(not_found.detail.kind() == ERROR_KIND_NOT_FOUND);
  ExpectRaised<resource::util::NotFound>(not_found, "no such id");

  const auto stale = ToWireError(resource::util::Stale("behind"));
  assert(stale.status == Status::kStale);
  ExpectRaised<resource::util::Stale>(stale, "behind");
}

void TestSourceUnavailableKeepsItsKind() {
  const auto error = ToWireError(resource::util::SourceUnavailable("sourced down"));
  assert(error.status == Status::kUnavailable);
  assert(error.detail.kind() == ERROR_KIND_SOURCE_UNAVAILABLE);
  ExpectRaised<resource::util::SourceUnavailable>(error, "sourced down");

  const auto plain = ToWireError(resource::util::Unavailable("timeout"));
  assert(plain.detail.kind() == ERROR_KIND_UNAVAILABLE);
  ExpectRaised<resource::util::Unavailable>(plain, "timeout");
}

void TestErrorKindsTravelInDetail() {
  const auto compile = ToWireError(resource::util::CompileFailure("bad input"));
  assert(compile.status == Status::kError);
  ExpectRaised<resource::util::CompileFailure>(compile, "bad input");

  ExpectRaised<resource::util::ProtocolError>(ToWireError(resource::util::ProtocolError("garbage")), "garbage");
  ExpectRaised<resource::util::Conflict>(ToWireError(resource::util::Conflict("duplicate")), "duplicate");
  ExpectRaised<resource::util::InvalidState>(ToWireError(resource::util::InvalidState("bad arg")), "bad arg");
}

void TestUnknownExceptionsAreInternal() {
  const auto error = ToWireError(std::runtime_error("boom"));
  assert(error.status == Status::kError);
  assert(error.detail.kind() == ERROR_KIND_INTERNAL);
  ExpectRaised<std::runtime_error>(error, "boom");
}

void TestMalformedDetailIsProtocolError() {
  const auto payload = arrow::Buffer::FromString(std::string("\xff\xff\xff", 3));
  bool       raised  = false;
  try {
    resource::wire::RaiseWireError(Status::kError, *payload);
  } catch (const resource::util::ProtocolError&) {
    raised = true;
  }
  assert(raised);
}

void TestClientStatusKeepsStaleDistinct() {
  // a stale reply decoded off the wire
  const auto stale   = ToWireError(resource::util::Stale("compiled entry is stale"));
  const auto payload = arrow::Buffer::FromString(stale.detail.SerializeAsString());
  arrow::Status status;
  try {
    resource::wire::RaiseWireError(stale.status, *payload);
  } catch (const std::exception& e) {
    status = resource::client::ToStatus(e, "get");
  }
  assert(status.IsCancelled());
  assert(!status.IsKeyError() && !status.IsUnknownError());

  assert(resource::client::ToStatus(resource::util::NotFound("x"), "fetch").IsKeyError());
  assert(resource::client::ToStatus(resource::util::Unavailable("x"), "fetch").IsIOError());
  assert(resource::client::ToStatus(resource::util::CompileFailure("x"), "compile").IsExecutionError());
  assert(resource::client::ToStatus(std::runtime_error("x"), "fetch").IsUnknownError());
}

} // namespace

int main() {
  TestNotFoundAndStaleHaveTheirOwnStatus();
  TestSourceUnavailableKeepsItsKind();
  TestErrorKindsTravelInDetail();
  TestUnknownExceptionsAreInternal();
  TestMalformedDetailIsProtocolError();
  TestClientStatusKeepsStaleDistinct();

  std::cout << "resource_unit_status_mapping: pass\n";
  return 0;
}
