#include "pg_repository.hpp"

#include "internal/util/errors.hpp"

namespace ainp::db::postgres {

namespace {

std::string Text(const pqxx::field& f) {
  return f.is_null() ? std::string{} : std::string(f.c_str());
}

model::AccountRecord ReadAccount(const pqxx::row& row) {
  model::AccountRecord r;
  r.agent_did     = row[0].c_str();
  r.balance       = row[1].as<uint64_t>();
  r.reserved      = row[2].as<uint64_t>();
  r.earned        = row[3].as<uint64_t>();
  r.spent         = row[4].as<uint64_t>();
  r.created_at_ms = row[5].as<uint64_t>();
  r.updated_at_ms = row[6].as<uint64_t>();
  return r;
}

model::NegotiationRecord ReadNegotiation(const pqxx::row& row) {
  model::NegotiationRecord r;
  r.id                    = row[0].c_str();
  r.intent_id             = row[1].c_str();
  r.initiator_did         = row[2].c_str();
  r.responder_did         = row[3].c_str();
  r.state                 = row[4].c_str();
  r.rounds_json           = row[5].c_str();
  r.convergence_score     = row[6].as<double>();
  r.current_proposal_json = Text(row[7]);
  r.final_proposal_json   = Text(row[8]);
  r.incentive_split_json  = Text(row[9]);
  r.max_rounds            = row[10].as<uint32_t>();
  r.created_at_ms         = row[11].as<uint64_t>();
  r.expires_at_ms         = row[12].as<uint64_t>();
  r.updated_at_ms         = row[13].as<uint64_t>();
  return r;
}

model::SettlementRecord ReadSettlement(const pqxx::row& row) {
  model::SettlementRecord r;
  r.negotiation_id       = row[0].c_str();
  r.intent_id            = row[1].c_str();
  r.payer_did            = row[2].c_str();
  r.payee_did            = row[3].c_str();
  r.validator_did        = Text(row[4]);
  r.usefulness_proof_id  = Text(row[5]);
  r.amount               = row[6].as<uint64_t>();
  r.incentive_split_json = row[7].c_str();
  r.status               = row[8].c_str();
  r.attempts             = row[9].as<uint32_t>();
  r.last_error           = Text(row[10]);
  r.created_at_ms        = row[11].as<uint64_t>();
  r.updated_at_ms        = row[12].as<uint64_t>();
  return r;
}

model::UsefulnessScoreRecord ReadUsefulness(const pqxx::row& row) {
  model::UsefulnessScoreRecord r;
  r.agent_did        = row[0].c_str();
  r.usefulness_score = row[1].as<double>();
  r.updated_at_ms    = row[2].as<uint64_t>();
  return r;
}

// Reads have no Result channel; driver failures surface as StoreError.
template <typename Fn>
auto Query(const char* what, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::failure& e) {
    throw util::StoreError(std::string(what) + ": " + e.what());
  }
}

// A failed statement aborts the whole postgres transaction; running the
// insert under a savepoint lets the caller see AlreadyExists and continue.
template <typename Fn>
void UnderSavepoint(pqxx::work& work, Fn&& fn) {
  pqxx::subtransaction savepoint(work, "insert");
  fn(savepoint);
  savepoint.commit();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Conflict, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result PgRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    UnderSavepoint(TX(t).Work(), [&](pqxx::transaction_base& sp) {
      sp.exec_prepared("insert_account", r.agent_did, r.balance, r.reserved, r.earned, r.spent, r.created_at_ms, r.updated_at_ms);
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::AccountRecord> PgRepository::GetAccount(Transaction& t, const std::string& did) {
  return Query("get account", [&]() -> std::optional<model::AccountRecord> {
    auto res = TX(t).Work().exec_prepared("get_account", did);
    if (res.empty()) return std::nullopt;
    return ReadAccount(res[0]);
  });
}

std::optional<model::AccountRecord> PgRepository::LockAccount(Transaction& t, const std::string& did) {
  return Query("lock account", [&]() -> std::optional<model::AccountRecord> {
    auto res = TX(t).Work().exec_prepared("lock_account", did);
    if (res.empty()) return std::nullopt;
    return ReadAccount(res[0]);
  });
}

Result PgRepository::UpdateAccount(Transaction& t, const model::AccountRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_account", r.agent_did, r.balance, r.reserved, r.earned, r.spent,
                                          r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "account not found: " + r.agent_did);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result PgRepository::AppendCreditTransaction(Transaction& t, model::CreditTransactionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_credit_transaction", r.id, r.agent_did, r.tx_type, r.amount, r.intent_id,
                                          r.usefulness_proof_id, r.metadata_json.empty() ? "{}" : r.metadata_json,
                                          r.created_at_ms);
    r.sequence = res[0][0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::CreditTransactionRecord> PgRepository::ListCreditTransactions(Transaction& t, const std::string& did,
                                                                               const Pagination& page) {
  return Query("list credit transactions", [&] {
    auto res = TX(t).Work().exec_prepared("list_credit_transactions", did, static_cast<uint64_t>(page.limit),
                                          static_cast<uint64_t>(page.offset));

    std::vector<model::CreditTransactionRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      model::CreditTransactionRecord r;
      r.sequence            = row[0].as<uint64_t>();
      r.id                  = row[1].c_str();
      r.agent_did           = row[2].c_str();
      r.tx_type             = row[3].c_str();
      r.amount              = row[4].as<uint64_t>();
      r.intent_id           = row[5].c_str();
      r.usefulness_proof_id = row[6].c_str();
      r.metadata_json       = row[7].c_str();
      r.created_at_ms       = row[8].as<uint64_t>();
      out.push_back(std::move(r));
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Negotiations
// ------------------------------------------------------------------

Result PgRepository::InsertNegotiation(Transaction& t, const model::NegotiationRecord& r) {
  try {
    UnderSavepoint(TX(t).Work(), [&](pqxx::transaction_base& sp) {
      sp.exec_prepared("insert_negotiation", r.id, r.intent_id, r.initiator_did, r.responder_did, r.state, r.rounds_json,
                       r.convergence_score, r.current_proposal_json, r.final_proposal_json, r.incentive_split_json, r.max_rounds,
                       r.created_at_ms, r.expires_at_ms, r.updated_at_ms);
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::NegotiationRecord> PgRepository::GetNegotiation(Transaction& t, const std::string& id) {
  return Query("get negotiation", [&]() -> std::optional<model::NegotiationRecord> {
    auto res = TX(t).Work().exec_prepared("get_negotiation", id);
    if (res.empty()) return std::nullopt;
    return ReadNegotiation(res[0]);
  });
}

std::optional<model::NegotiationRecord> PgRepository::LockNegotiation(Transaction& t, const std::string& id) {
  return Query("lock negotiation", [&]() -> std::optional<model::NegotiationRecord> {
    auto res = TX(t).Work().exec_prepared("lock_negotiation", id);
    if (res.empty()) return std::nullopt;
    return ReadNegotiation(res[0]);
  });
}

Result PgRepository::UpdateNegotiation(Transaction& t, const model::NegotiationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_negotiation", r.id, r.state, r.rounds_json, r.convergence_score,
                                          r.current_proposal_json, r.final_proposal_json, r.incentive_split_json,
                                          r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "negotiation not found: " + r.id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::NegotiationRecord> PgRepository::ListNegotiationsByAgent(Transaction& t, const std::string& did,
                                                                            const std::optional<std::string>& state) {
  return Query("list negotiations", [&] {
    auto res = TX(t).Work().exec_prepared("list_negotiations_by_agent", did, state);

    std::vector<model::NegotiationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadNegotiation(row));
    return out;
  });
}

Result PgRepository::ExpireNegotiations(Transaction& t, uint64_t now_ms, std::vector<std::string>* expired_ids) {
  try {
    auto res = TX(t).Work().exec_prepared("expire_negotiations", now_ms);
    if (expired_ids) {
      for (const auto& row : res) expired_ids->push_back(row[0].c_str());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Settlements
// ------------------------------------------------------------------

Result PgRepository::InsertSettlement(Transaction& t, const model::SettlementRecord& r) {
  try {
    UnderSavepoint(TX(t).Work(), [&](pqxx::transaction_base& sp) {
      sp.exec_prepared("insert_settlement", r.negotiation_id, r.intent_id, r.payer_did, r.payee_did, r.validator_did,
                       r.usefulness_proof_id, r.amount, r.incentive_split_json, r.status, r.attempts, r.last_error,
                       r.created_at_ms, r.updated_at_ms);
    });
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SettlementRecord> PgRepository::GetSettlement(Transaction& t, const std::string& id) {
  return Query("get settlement", [&]() -> std::optional<model::SettlementRecord> {
    auto res = TX(t).Work().exec_prepared("get_settlement", id);
    if (res.empty()) return std::nullopt;
    return ReadSettlement(res[0]);
  });
}

std::optional<model::SettlementRecord> PgRepository::LockSettlement(Transaction& t, const std::string& id) {
  return Query("lock settlement", [&]() -> std::optional<model::SettlementRecord> {
    auto res = TX(t).Work().exec_prepared("lock_settlement", id);
    if (res.empty()) return std::nullopt;
    return ReadSettlement(res[0]);
  });
}

Result PgRepository::UpdateSettlement(Transaction& t, const model::SettlementRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_settlement", r.negotiation_id, r.status, r.attempts, r.last_error,
                                          r.updated_at_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "settlement not found: " + r.negotiation_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SettlementRecord> PgRepository::ListSettlementsByStatus(Transaction& t, const std::string& status,
                                                                           std::size_t limit) {
  return Query("list settlements", [&] {
    auto res = TX(t).Work().exec_prepared("list_settlements_by_status", status, static_cast<uint64_t>(limit));

    std::vector<model::SettlementRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadSettlement(row));
    return out;
  });
}

// ------------------------------------------------------------------
// Usefulness
// ------------------------------------------------------------------

Result PgRepository::UpsertUsefulnessScore(Transaction& t, const model::UsefulnessScoreRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_usefulness", r.agent_did, r.usefulness_score, r.updated_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UsefulnessScoreRecord> PgRepository::GetUsefulnessScore(Transaction& t, const std::string& did) {
  return Query("get usefulness", [&]() -> std::optional<model::UsefulnessScoreRecord> {
    auto res = TX(t).Work().exec_prepared("get_usefulness", did);
    if (res.empty()) return std::nullopt;
    return ReadUsefulness(res[0]);
  });
}

std::vector<model::UsefulnessScoreRecord> PgRepository::ListUsefulnessScores(Transaction& t, double min_score) {
  return Query("list usefulness", [&] {
    auto res = TX(t).Work().exec_prepared("list_usefulness_at_least", min_score);

    std::vector<model::UsefulnessScoreRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) out.push_back(ReadUsefulness(row));
    return out;
  });
}

} // namespace ainp::db::postgres
