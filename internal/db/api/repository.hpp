#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/compiled_row.hpp"
#include "internal/db/model/source_row.hpp"

namespace resource::db {

/*
  Repository abstraction.

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes

  The DB is the source of truth for:
    source change counters and event sequences
    the compiled cache index
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Source resources
  // ---------------------------------------------------------------------

  virtual Result UpsertSource(Transaction&, const model::SourceRow&) = 0;

  virtual std::optional<model::SourceRow> GetSource(Transaction&, const std::string& id) = 0;

  // Includes tombstones.
  virtual std::vector<model::SourceRow> ListSources(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Compiled cache index
  // ---------------------------------------------------------------------

  virtual Result UpsertCompiled(Transaction&, const model::CompiledRow&) = 0;

  virtual std::optional<model::CompiledRow> GetCompiled(Transaction&, const std::string& key) = 0;

  virtual std::vector<model::CompiledRow> ListCompiled(Transaction&) = 0;

  // Every row for one resource id, any platform or version.
  virtual std::vector<model::CompiledRow> ListCompiledFor(Transaction&, const std::string& id) = 0;

  virtual Result TouchCompiled(Transaction&, const std::string& key, uint64_t last_access_ms) = 0;

  virtual Result DeleteCompiled(Transaction&, const std::string& key) = 0;
};

} // namespace resource::db
