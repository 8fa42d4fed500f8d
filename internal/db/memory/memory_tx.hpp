#pragma once

#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "memory_task_repository.hpp"

namespace taskgate::db::memory {

/*
  Transaction = repository lock + working copy
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryTaskRepository& repo);
  ~MemoryTransaction() override = default;

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryTaskRepository::State& Mutable() {
    return working_;
  }
  const MemoryTaskRepository::State& View() const {
    return working_;
  }

 private:
  MemoryTaskRepository&        repo_;
  std::unique_lock<std::mutex> lock_;
  MemoryTaskRepository::State  working_;
  bool                         committed_ = false;
};

} // namespace taskgate::db::memory
