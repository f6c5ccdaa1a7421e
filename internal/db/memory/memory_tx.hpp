#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace ainp::db::memory {

/*
  Transaction = write set + held row locks
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  // Blocks until the row lock is held; no-op if this transaction holds it.
  void LockRow(const std::string& key);

  MemoryRepository::State& Writes() {
    return writes_;
  }

 private:
  struct HeldLock {
    std::shared_ptr<std::mutex>  mutex;
    std::unique_lock<std::mutex> lock;
  };

  void ReleaseLocks();

  MemoryRepository&               repo_;
  MemoryRepository::State         writes_;
  std::map<std::string, HeldLock> held_;
  bool                            committed_ = false;
};

} // namespace ainp::db::memory
