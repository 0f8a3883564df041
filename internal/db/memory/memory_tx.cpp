#include "memory_tx.hpp"

#include <stdexcept>

namespace baton::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), tx_lock_(repo.tx_mutex_) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  if (!IsFinished()) Rollback();
}

void MemoryTransaction::Commit() {
  if (IsFinished()) {
    throw std::runtime_error("memory transaction already finished");
  }
  {
    std::scoped_lock lock(repo_.mutex_);
    repo_.committed_ = std::move(working_);
  }
  committed_ = true;
  tx_lock_.unlock();
}

void MemoryTransaction::Rollback() {
  if (IsFinished()) return;
  rolled_back_ = true;
  tx_lock_.unlock();
}

} // namespace baton::db::memory
