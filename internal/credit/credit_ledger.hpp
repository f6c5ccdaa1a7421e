#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ainp/broker/v1.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ainp::credit {

/*
  CreditLedger

  Owns account balances and the append-only transaction log. Amounts are
  atomic units.

  Every mutation is read-check-write under the account row lock. The
  overloads without a Transaction run in a transaction of their own; the
  overloads taking one join the caller's transaction so the caller can
  commit the ledger change together with its own writes.

  Errors:
    util::NotFound             account missing
    util::InsufficientCredits  not enough unreserved balance
    util::ValidationError      bad amounts, counter overflow
    util::StoreError           store failure, nothing applied
*/
class CreditLedger {
 public:
  explicit CreditLedger(std::shared_ptr<db::Repository> repository, util::ClockFn clock = util::Now);

  std::optional<ainp::broker::v1::CreditAccount> GetAccount(const std::string& agent_did);
  std::optional<ainp::broker::v1::CreditAccount> GetAccount(db::Transaction& tx, const std::string& agent_did);

  // Idempotent: an existing account is returned unchanged.
  ainp::broker::v1::CreditAccount CreateAccount(const std::string& agent_did, uint64_t initial_balance = 0);
  ainp::broker::v1::CreditAccount CreateAccount(db::Transaction& tx, const std::string& agent_did, uint64_t initial_balance = 0);

  ainp::broker::v1::CreditAccount Reserve(const std::string& agent_did, uint64_t amount, const std::string& intent_id);
  ainp::broker::v1::CreditAccount Reserve(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                          const std::string& intent_id);

  // Drops reserved_amount from the reservation and debits spent_amount of it.
  ainp::broker::v1::CreditAccount Release(const std::string& agent_did, uint64_t reserved_amount, uint64_t spent_amount,
                                          const std::string& intent_id);
  ainp::broker::v1::CreditAccount Release(db::Transaction& tx, const std::string& agent_did, uint64_t reserved_amount,
                                          uint64_t spent_amount, const std::string& intent_id);

  ainp::broker::v1::CreditAccount Deposit(const std::string& agent_did, uint64_t amount,
                                          const google::protobuf::Struct& metadata = {});
  ainp::broker::v1::CreditAccount Deposit(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                          const google::protobuf::Struct& metadata = {});

  ainp::broker::v1::CreditAccount Earn(const std::string& agent_did, uint64_t amount, const std::string& intent_id,
                                       const std::optional<std::string>& usefulness_proof_id = std::nullopt);
  ainp::broker::v1::CreditAccount Earn(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                       const std::string& intent_id,
                                       const std::optional<std::string>& usefulness_proof_id = std::nullopt);

  ainp::broker::v1::CreditAccount Spend(const std::string& agent_did, uint64_t amount, const std::string& intent_id,
                                        const std::optional<std::string>& reason = std::nullopt);
  ainp::broker::v1::CreditAccount Spend(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                        const std::string& intent_id, const std::optional<std::string>& reason = std::nullopt);

  // Newest first.
  std::vector<ainp::broker::v1::CreditTransaction> GetTransactionHistory(const std::string& agent_did, std::size_t limit = 50,
                                                                         std::size_t offset = 0);

 private:
  db::model::AccountRecord LockExisting(db::Transaction& tx, const std::string& agent_did);
  ainp::broker::v1::CreditAccount Store(db::Transaction& tx, db::model::AccountRecord& record, uint64_t now_ms);
  void Append(db::Transaction& tx, const std::string& agent_did, ainp::broker::v1::TxType type, uint64_t amount,
              const std::string& intent_id, const std::string& usefulness_proof_id, const std::string& metadata_json,
              uint64_t now_ms);
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository> repository_;
  util::ClockFn                   clock_;
};

// "deposit", "earn", ..., "pou_pool_distribution"
std::string               TxTypeName(ainp::broker::v1::TxType type);
ainp::broker::v1::TxType  ParseTxType(const std::string& name);

ainp::broker::v1::CreditAccount     ToProto(const db::model::AccountRecord& record);
ainp::broker::v1::CreditTransaction ToProto(const db::model::CreditTransactionRecord& record);

} // namespace ainp::credit
