#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/account_record.hpp"
#include "internal/db/model/credit_transaction_record.hpp"
#include "internal/db/model/negotiation_record.hpp"
#include "internal/db/model/settlement_record.hpp"
#include "internal/db/model/usefulness_score_record.hpp"

namespace ainp::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its own writes
  - Lock*() returns the row and holds an exclusive lock on it until the
    transaction ends; a second transaction locking the same row blocks
  - The credit transaction log is append-only

  The DB is the source of truth for:
    negotiation sessions
    account balances + ledger history
    settlement progress
    cached usefulness scores
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Credit accounts
  // ---------------------------------------------------------------------

  virtual Result InsertAccount(Transaction&, const model::AccountRecord&) = 0;

  virtual std::optional<model::AccountRecord> GetAccount(Transaction&, const std::string& agent_did) = 0;

  virtual std::optional<model::AccountRecord> LockAccount(Transaction&, const std::string& agent_did) = 0;

  virtual Result UpdateAccount(Transaction&, const model::AccountRecord&) = 0;

  // ---------------------------------------------------------------------
  // Credit transaction log
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendCreditTransaction(Transaction&, model::CreditTransactionRecord& record) = 0;

  // Newest first.
  virtual std::vector<model::CreditTransactionRecord> ListCreditTransactions(Transaction&, const std::string& agent_did,
                                                                             const Pagination& page) = 0;

  // ---------------------------------------------------------------------
  // Negotiations
  // ---------------------------------------------------------------------

  virtual Result InsertNegotiation(Transaction&, const model::NegotiationRecord&) = 0;

  virtual std::optional<model::NegotiationRecord> GetNegotiation(Transaction&, const std::string& id) = 0;

  virtual std::optional<model::NegotiationRecord> LockNegotiation(Transaction&, const std::string& id) = 0;

  virtual Result UpdateNegotiation(Transaction&, const model::NegotiationRecord&) = 0;

  // Sessions where the agent is initiator or responder, newest first.
  virtual std::vector<model::NegotiationRecord> ListNegotiationsByAgent(Transaction&, const std::string& agent_did,
                                                                        const std::optional<std::string>& state) = 0;

  // Moves every non-terminal session with expires_at_ms <= now_ms to expired.
  virtual Result ExpireNegotiations(Transaction&, uint64_t now_ms, std::vector<std::string>* expired_ids) = 0;

  // ---------------------------------------------------------------------
  // Settlements
  // ---------------------------------------------------------------------

  virtual Result InsertSettlement(Transaction&, const model::SettlementRecord&) = 0;

  virtual std::optional<model::SettlementRecord> GetSettlement(Transaction&, const std::string& negotiation_id) = 0;

  virtual std::optional<model::SettlementRecord> LockSettlement(Transaction&, const std::string& negotiation_id) = 0;

  virtual Result UpdateSettlement(Transaction&, const model::SettlementRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::SettlementRecord> ListSettlementsByStatus(Transaction&, const std::string& status,
                                                                       std::size_t limit) = 0;

  // ---------------------------------------------------------------------
  // Usefulness scores
  // ---------------------------------------------------------------------

  virtual Result UpsertUsefulnessScore(Transaction&, const model::UsefulnessScoreRecord&) = 0;

  virtual std::optional<model::UsefulnessScoreRecord> GetUsefulnessScore(Transaction&, const std::string& agent_did) = 0;

  // Ordered by agent_did.
  virtual std::vector<model::UsefulnessScoreRecord> ListUsefulnessScores(Transaction&, double min_score) = 0;
};

} // namespace ainp::db
