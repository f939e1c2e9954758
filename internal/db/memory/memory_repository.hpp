#pragma once

#include <map>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace resource::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                           UpsertSource(Transaction&, const model::SourceRow&) override;
  std::optional<model::SourceRow>  GetSource(Transaction&, const std::string&) override;
  std::vector<model::SourceRow>    ListSources(Transaction&) override;

  Result                            UpsertCompiled(Transaction&, const model::CompiledRow&) override;
  std::optional<model::CompiledRow> GetCompiled(Transaction&, const std::string&) override;
  std::vector<model::CompiledRow>   ListCompiled(Transaction&) override;
  std::vector<model::CompiledRow>   ListCompiledFor(Transaction&, const std::string& id) override;
  Result                            TouchCompiled(Transaction&, const std::string& key, uint64_t last_access_ms) override;
  Result                            DeleteCompiled(Transaction&, const std::string& key) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::SourceRow> sources;
    // ordered so rows of one id are adjacent
    std::map<std::string, model::CompiledRow> compiled;
  };

  // held by the open transaction
  std::mutex tx_mutex_;

  std::mutex mutex_;
  State      committed_;
};

} // namespace resource::db::memory
