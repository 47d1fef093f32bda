#include "memory_tx.hpp"

#include <stdexcept>

namespace lieko::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  if (committed_ || rolled_back_) {
    throw std::logic_error("memory transaction already finished");
  }
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (committed_ || rolled_back_) return;
  rolled_back_ = true;
  lock_.unlock();
}

} // namespace lieko::db::memory
