#pragma once

#include <cstdint>
#include <string>

namespace resource::db::model {

/*
  Persistent source resource row.

  A removed resource keeps its row as a tombstone so a later re-add
  continues from its counter and sequence.
*/

struct SourceRow {
  std::string id; // dashed UUID

  // protobuf Struct JSON of the property map
  std::string properties_json;

  std::string content_hash; // hex SHA-256
  uint64_t    change_counter = 0;

  // Last event sequence for this id.
  uint64_t sequence = 0;

  uint64_t    size_bytes = 0;
  std::string resource_namespace;
  bool        removed = false;
};

} // namespace resource::db::model
