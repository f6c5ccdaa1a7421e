#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace ainp::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Committed rows live in State behind mutex_. A transaction buffers its
  writes and takes per-row mutexes that stay held until commit/rollback,
  so read-check-write sequences on one row serialize while different rows
  proceed in parallel.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertAccount(Transaction&, const model::AccountRecord&) override;
  std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string&) override;
  std::optional<model::AccountRecord> LockAccount(Transaction&, const std::string&) override;
  Result UpdateAccount(Transaction&, const model::AccountRecord&) override;

  Result AppendCreditTransaction(Transaction&, model::CreditTransactionRecord&) override;
  std::vector<model::CreditTransactionRecord> ListCreditTransactions(Transaction&, const std::string&,
                                                                     const Pagination&) override;

  Result InsertNegotiation(Transaction&, const model::NegotiationRecord&) override;
  std::optional<model::NegotiationRecord> GetNegotiation(Transaction&, const std::string&) override;
  std::optional<model::NegotiationRecord> LockNegotiation(Transaction&, const std::string&) override;
  Result UpdateNegotiation(Transaction&, const model::NegotiationRecord&) override;
  std::vector<model::NegotiationRecord> ListNegotiationsByAgent(Transaction&, const std::string&,
                                                                const std::optional<std::string>&) override;
  Result ExpireNegotiations(Transaction&, uint64_t now_ms, std::vector<std::string>* expired_ids) override;

  Result InsertSettlement(Transaction&, const model::SettlementRecord&) override;
  std::optional<model::SettlementRecord> GetSettlement(Transaction&, const std::string&) override;
  std::optional<model::SettlementRecord> LockSettlement(Transaction&, const std::string&) override;
  Result UpdateSettlement(Transaction&, const model::SettlementRecord&) override;
  std::vector<model::SettlementRecord> ListSettlementsByStatus(Transaction&, const std::string&, std::size_t) override;

  Result UpsertUsefulnessScore(Transaction&, const model::UsefulnessScoreRecord&) override;
  std::optional<model::UsefulnessScoreRecord> GetUsefulnessScore(Transaction&, const std::string&) override;
  std::vector<model::UsefulnessScoreRecord> ListUsefulnessScores(Transaction&, double) override;

  // Row lock entries currently allocated (held or waited on).
  std::size_t RowLockCount();

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::AccountRecord>         accounts;
    std::vector<model::CreditTransactionRecord>         ledger;
    std::map<std::string, model::NegotiationRecord>     negotiations;
    std::map<std::string, model::SettlementRecord>      settlements;
    std::map<std::string, model::UsefulnessScoreRecord> usefulness;
  };

  // Returns the mutex guarding one logical row, creating it on first use.
  std::shared_ptr<std::mutex> RowMutex(const std::string& key);
  // Drops the caller's reference; erases the entry once nobody else holds it.
  void ReleaseRowMutex(const std::string& key, std::shared_ptr<std::mutex> mutex);

  std::mutex            mutex_;
  State                 committed_;
  std::atomic<uint64_t> next_sequence_{0};

  std::unordered_map<std::string, std::shared_ptr<std::mutex>> row_mutexes_;
};

} // namespace ainp::db::memory
