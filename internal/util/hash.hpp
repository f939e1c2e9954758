#pragma once

#include <arrow/buffer.h>

#include <map>
#include <memory>
#include <string>

namespace resource::util {

/*
  Canonical content hash of a source resource.

  SHA-256 over the properties in key order (each key and value length
  prefixed) followed by the payload bytes. Property insertion order
  never affects the result.
*/
std::string ContentHash(const std::map<std::string, std::string>& properties, const arrow::Buffer& payload);

std::string ToHex(const std::string& bytes);
std::string FromHex(const std::string& hex);

} // namespace resource::util
