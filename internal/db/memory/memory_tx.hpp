#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace baton::db::memory {

// Works on a private copy of the committed state; Commit() swaps it in.
// Holds MemoryRepository::tx_mutex_ for its whole lifetime.

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State& Mutable() {
    return working_;
  }
  const MemoryRepository::State& View() const {
    return working_;
  }
  bool IsFinished() const {
    return committed_ || rolled_back_;
  }

 private:
  MemoryRepository&            repo_;
  std::unique_lock<std::mutex> tx_lock_;
  MemoryRepository::State      working_;
  bool                         committed_   = false;
  bool                         rolled_back_ = false;
};

} // namespace baton::db::memory
