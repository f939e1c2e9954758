#pragma once

#include <filesystem>
#include <string>

#include "internal/util/errors.hpp"

namespace resource::storage::common {

inline void ValidateBlobKey(const std::string& key) {
  if (key.empty()) {
    throw util::InvalidState("blob key must not be empty");
  }
  for (char c : key) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidState("blob key contains invalid character");
    }
  }
  if (key == "." || key == "..") {
    throw util::InvalidState("blob key must not be a relative path component");
  }
}

// root/<key>.bin
inline std::filesystem::path BlobPath(const std::filesystem::path& root, const std::string& key) {
  ValidateBlobKey(key);
  return root / (key + ".bin");
}

} // namespace resource::storage::common
