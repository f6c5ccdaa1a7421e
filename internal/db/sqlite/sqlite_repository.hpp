#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ainp::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace ainp::db::sqlite
