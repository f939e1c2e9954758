#pragma once

#include <cstdint>
#include <string>

namespace resource::db::model {

/*
  Persistent compiled cache index row. Artifact bytes live in the blob
  store under the same key.
*/

struct CompiledRow {
  std::string key; // blob key, see compiled/compiled_key.hpp
  std::string id;  // dashed UUID
  uint64_t    platform              = 0;
  uint32_t    compiler_version      = 0;
  uint64_t    source_change_counter = 0;
  uint64_t    size_bytes            = 0;

  // Serialized CompiledRecord (key, counter, version, sections).
  std::string record;

  uint64_t last_access_ms = 0;
};

} // namespace resource::db::model
