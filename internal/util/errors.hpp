#pragma once

#include <stdexcept>
#include <string>

namespace resource::util {

/*
  Central error types.

  Servers translate these to wire status codes in one place
  (internal/wire/status_mapping) and clients translate them back.
*/

// Identifier unknown to the backend that was asked.
class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Backend unreachable or failed. Never used for "does not exist".
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The compile pipeline could not resolve its source.
class SourceUnavailable : public Unavailable {
 public:
  explicit SourceUnavailable(const std::string& msg) : Unavailable(msg) {
  }
};

class Stale : public std::runtime_error {
 public:
  explicit Stale(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A transform rejected its input. Never cached.
class CompileFailure : public std::runtime_error {
 public:
  explicit CompileFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Malformed frame. Fatal to the connection that produced it.
class ProtocolError : public std::runtime_error {
 public:
  explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace resource::util
