#include "memory_tx.hpp"

#include <utility>

namespace ainp::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_) Rollback();
}

void MemoryTransaction::LockRow(const std::string& key) {
  if (held_.contains(key)) return;

  auto                         mutex = repo_.RowMutex(key);
  std::unique_lock<std::mutex> lock(*mutex);
  held_.emplace(key, HeldLock{std::move(mutex), std::move(lock)});
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    auto&            target = repo_.committed_;

    for (auto& [key, row] : writes_.accounts) target.accounts[key] = std::move(row);
    for (auto& [key, row] : writes_.negotiations) target.negotiations[key] = std::move(row);
    for (auto& [key, row] : writes_.settlements) target.settlements[key] = std::move(row);
    for (auto& [key, row] : writes_.usefulness) target.usefulness[key] = std::move(row);
    for (auto& row : writes_.ledger) target.ledger.push_back(std::move(row));
  }

  writes_    = MemoryRepository::State{};
  committed_ = true;
  ReleaseLocks();
}

void MemoryTransaction::Rollback() {
  writes_    = MemoryRepository::State{};
  committed_ = true;
  ReleaseLocks();
}

void MemoryTransaction::ReleaseLocks() {
  // unlock first, then hand the mutex back so an idle entry can be dropped
  for (auto& [key, held] : held_) {
    held.lock.unlock();
    held.lock.release();
    repo_.ReleaseRowMutex(key, std::move(held.mutex));
  }
  held_.clear();
}

} // namespace ainp::db::memory
