#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace resource::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the tables if missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result                          UpsertSource(Transaction&, const model::SourceRow&) override;
  std::optional<model::SourceRow> GetSource(Transaction&, const std::string&) override;
  std::vector<model::SourceRow>   ListSources(Transaction&) override;

  Result                            UpsertCompiled(Transaction&, const model::CompiledRow&) override;
  std::optional<model::CompiledRow> GetCompiled(Transaction&, const std::string&) override;
  std::vector<model::CompiledRow>   ListCompiled(Transaction&) override;
  std::vector<model::CompiledRow>   ListCompiledFor(Transaction&, const std::string& id) override;
  Result                            TouchCompiled(Transaction&, const std::string& key, uint64_t last_access_ms) override;
  Result                            DeleteCompiled(Transaction&, const std::string& key) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace resource::db::sqlite
