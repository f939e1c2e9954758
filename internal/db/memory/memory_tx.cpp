#include "memory_tx.hpp"

#include "internal/util/errors.hpp"

namespace resource::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), writer_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) throw util::InvalidState("transaction already finished");
  std::scoped_lock lock(repo_.mutex_);
  repo_.committed_ = std::move(working_);
  committed_       = true;
  writer_.unlock();
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
  if (writer_.owns_lock()) writer_.unlock();
}

} // namespace resource::db::memory
