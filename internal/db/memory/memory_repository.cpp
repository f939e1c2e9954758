#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace resource::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::UpsertSource(Transaction& t, const model::SourceRow& r) {
  TX(t).Mutable().sources[r.id] = r;
  return Result::Ok();
}

std::optional<model::SourceRow> MemoryRepository::GetSource(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.sources.find(id);
  if (it == s.sources.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SourceRow> MemoryRepository::ListSources(Transaction& t) {
  const auto&                   s = TX(t).View();
  std::vector<model::SourceRow> rows;
  rows.reserve(s.sources.size());
  for (const auto& [_, row] : s.sources) {
    rows.push_back(row);
  }
  return rows;
}

Result MemoryRepository::UpsertCompiled(Transaction& t, const model::CompiledRow& r) {
  TX(t).Mutable().compiled[r.key] = r;
  return Result::Ok();
}

std::optional<model::CompiledRow> MemoryRepository::GetCompiled(Transaction& t, const std::string& key) {
  const auto& s  = TX(t).View();
  auto        it = s.compiled.find(key);
  if (it == s.compiled.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CompiledRow> MemoryRepository::ListCompiled(Transaction& t) {
  std::vector<model::CompiledRow> rows;
  for (const auto& [_, row] : TX(t).View().compiled) {
    rows.push_back(row);
  }
  return rows;
}

std::vector<model::CompiledRow> MemoryRepository::ListCompiledFor(Transaction& t, const std::string& id) {
  std::vector<model::CompiledRow> rows;
  for (const auto& [_, row] : TX(t).View().compiled)
    if (row.id == id) rows.push_back(row);
  return rows;
}

Result MemoryRepository::TouchCompiled(Transaction& t, const std::string& key, uint64_t last_access_ms) {
  auto& s  = TX(t).Mutable();
  auto  it = s.compiled.find(key);
  if (it == s.compiled.end()) return Result::Err(ErrorCode::NotFound, key);
  it->second.last_access_ms = last_access_ms;
  return Result::Ok();
}

Result MemoryRepository::DeleteCompiled(Transaction& t, const std::string& key) {
  TX(t).Mutable().compiled.erase(key);
  return Result::Ok();
}

} // namespace resource::db::memory
