#include "memory_tx.hpp"

namespace taskgate::db::memory {

MemoryTransaction::MemoryTransaction(MemoryTaskRepository& repo) : repo_(repo), lock_(repo.mutex_) {
  working_ = repo_.committed_; // snapshot copy
}

void MemoryTransaction::Commit() {
  repo_.committed_ = std::move(working_);
  committed_       = true;
  lock_.unlock();
}

void MemoryTransaction::Rollback() {
  committed_ = true;
  lock_.unlock();
}

} // namespace taskgate::db::memory
