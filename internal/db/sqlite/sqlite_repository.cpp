#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/db/sql/sql_queries.hpp"

namespace ainp::db::sqlite {

using ainp::db::ErrorCode;
using ainp::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
void BindOptionalText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, s);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

model::AccountRecord ReadAccount(sqlite3_stmt* st) {
  model::AccountRecord r;
  r.agent_did     = ColText(st, 0);
  r.balance       = ColU64(st, 1);
  r.reserved      = ColU64(st, 2);
  r.earned        = ColU64(st, 3);
  r.spent         = ColU64(st, 4);
  r.created_at_ms = ColU64(st, 5);
  r.updated_at_ms = ColU64(st, 6);
  return r;
}

model::NegotiationRecord ReadNegotiation(sqlite3_stmt* st) {
  model::NegotiationRecord r;
  r.id                    = ColText(st, 0);
  r.intent_id             = ColText(st, 1);
  r.initiator_did         = ColText(st, 2);
  r.responder_did         = ColText(st, 3);
  r.state                 = ColText(st, 4);
  r.rounds_json           = ColText(st, 5);
  r.convergence_score     = ColDouble(st, 6);
  r.current_proposal_json = ColText(st, 7);
  r.final_proposal_json   = ColText(st, 8);
  r.incentive_split_json  = ColText(st, 9);
  r.max_rounds            = static_cast<uint32_t>(sqlite3_column_int(st, 10));
  r.created_at_ms         = ColU64(st, 11);
  r.expires_at_ms         = ColU64(st, 12);
  r.updated_at_ms         = ColU64(st, 13);
  return r;
}

model::SettlementRecord ReadSettlement(sqlite3_stmt* st) {
  model::SettlementRecord r;
  r.negotiation_id       = ColText(st, 0);
  r.intent_id            = ColText(st, 1);
  r.payer_did            = ColText(st, 2);
  r.payee_did            = ColText(st, 3);
  r.validator_did        = ColText(st, 4);
  r.usefulness_proof_id  = ColText(st, 5);
  r.amount               = ColU64(st, 6);
  r.incentive_split_json = ColText(st, 7);
  r.status               = ColText(st, 8);
  r.attempts             = static_cast<uint32_t>(sqlite3_column_int(st, 9));
  r.last_error           = ColText(st, 10);
  r.created_at_ms        = ColU64(st, 11);
  r.updated_at_ms        = ColU64(st, 12);
  return r;
}

model::UsefulnessScoreRecord ReadUsefulness(sqlite3_stmt* st) {
  model::UsefulnessScoreRecord r;
  r.agent_did        = ColText(st, 0);
  r.usefulness_score = ColDouble(st, 1);
  r.updated_at_ms    = ColU64(st, 2);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result SqliteRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_ACCOUNT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.agent_did);
  BindU64(st.get(), 2, r.balance);
  BindU64(st.get(), 3, r.reserved);
  BindU64(st.get(), 4, r.earned);
  BindU64(st.get(), 5, r.spent);
  BindU64(st.get(), 6, r.created_at_ms);
  BindU64(st.get(), 7, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::AccountRecord> SqliteRepository::GetAccount(Transaction& t, const std::string& did) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_ACCOUNT);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, did);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadAccount(st.get());
}

std::optional<model::AccountRecord> SqliteRepository::LockAccount(Transaction& t, const std::string& did) {
  // BEGIN IMMEDIATE already holds the database write lock
  return GetAccount(t, did);
}

Result SqliteRepository::UpdateAccount(Transaction& t, const model::AccountRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_ACCOUNT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st.get(), 1, r.balance);
  BindU64(st.get(), 2, r.reserved);
  BindU64(st.get(), 3, r.earned);
  BindU64(st.get(), 4, r.spent);
  BindU64(st.get(), 5, r.updated_at_ms);
  BindText(st.get(), 6, r.agent_did);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "account not found: " + r.agent_did);
  }
  return result;
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result SqliteRepository::AppendCreditTransaction(Transaction& t, model::CreditTransactionRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_CREDIT_TRANSACTION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.agent_did);
  BindText(st.get(), 3, r.tx_type);
  BindU64(st.get(), 4, r.amount);
  BindOptionalText(st.get(), 5, r.intent_id);
  BindOptionalText(st.get(), 6, r.usefulness_proof_id);
  BindText(st.get(), 7, r.metadata_json.empty() ? "{}" : r.metadata_json);
  BindU64(st.get(), 8, r.created_at_ms);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result) r.sequence = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return result;
}

std::vector<model::CreditTransactionRecord> SqliteRepository::ListCreditTransactions(Transaction& t, const std::string& did,
                                                                                   const Pagination& page) {
  std::vector<model::CreditTransactionRecord> out;

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_CREDIT_TRANSACTIONS);
  if (!st) return out;

  BindText(st.get(), 1, did);
  BindU64(st.get(), 2, page.limit);
  BindU64(st.get(), 3, page.offset);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::CreditTransactionRecord r;
    r.sequence            = ColU64(st.get(), 0);
    r.id                  = ColText(st.get(), 1);
    r.agent_did           = ColText(st.get(), 2);
    r.tx_type             = ColText(st.get(), 3);
    r.amount              = ColU64(st.get(), 4);
    r.intent_id           = ColText(st.get(), 5);
    r.usefulness_proof_id = ColText(st.get(), 6);
    r.metadata_json       = ColText(st.get(), 7);
    r.created_at_ms       = ColU64(st.get(), 8);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Negotiations
// ------------------------------------------------------------------

Result SqliteRepository::InsertNegotiation(Transaction& t, const model::NegotiationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_NEGOTIATION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.intent_id);
  BindText(st.get(), 3, r.initiator_did);
  BindText(st.get(), 4, r.responder_did);
  BindText(st.get(), 5, r.state);
  BindText(st.get(), 6, r.rounds_json);
  BindDouble(st.get(), 7, r.convergence_score);
  BindOptionalText(st.get(), 8, r.current_proposal_json);
  BindOptionalText(st.get(), 9, r.final_proposal_json);
  BindOptionalText(st.get(), 10, r.incentive_split_json);
  sqlite3_bind_int(st.get(), 11, static_cast<int>(r.max_rounds));
  BindU64(st.get(), 12, r.created_at_ms);
  BindU64(st.get(), 13, r.expires_at_ms);
  BindU64(st.get(), 14, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::NegotiationRecord> SqliteRepository::GetNegotiation(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_NEGOTIATION);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadNegotiation(st.get());
}

std::optional<model::NegotiationRecord> SqliteRepository::LockNegotiation(Transaction& t, const std::string& id) {
  return GetNegotiation(t, id);
}

Result SqliteRepository::UpdateNegotiation(Transaction& t, const model::NegotiationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_NEGOTIATION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.state);
  BindText(st.get(), 2, r.rounds_json);
  BindDouble(st.get(), 3, r.convergence_score);
  BindOptionalText(st.get(), 4, r.current_proposal_json);
  BindOptionalText(st.get(), 5, r.final_proposal_json);
  BindOptionalText(st.get(), 6, r.incentive_split_json);
  BindU64(st.get(), 7, r.updated_at_ms);
  BindText(st.get(), 8, r.id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "negotiation not found: " + r.id);
  }
  return result;
}

std::vector<model::NegotiationRecord> SqliteRepository::ListNegotiationsByAgent(Transaction& t, const std::string& did,
                                                                                const std::optional<std::string>& state) {
  std::vector<model::NegotiationRecord> out;

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_NEGOTIATIONS_BY_AGENT);
  if (!st) return out;

  BindText(st.get(), 1, did);
  if (state) {
    BindText(st.get(), 2, *state);
  } else {
    sqlite3_bind_null(st.get(), 2);
  }

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadNegotiation(st.get()));
  }
  return out;
}

Result SqliteRepository::ExpireNegotiations(Transaction& t, uint64_t now_ms, std::vector<std::string>* expired_ids) {
  auto* db = TX(t).Handle();

  if (expired_ids) {
    auto select = Prepare(db, sql::SELECT_EXPIRABLE_NEGOTIATIONS);
    if (!select) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindU64(select.get(), 1, now_ms);
    while (sqlite3_step(select.get()) == SQLITE_ROW) {
      expired_ids->push_back(ColText(select.get(), 0));
    }
  }

  auto update = Prepare(db, sql::EXPIRE_NEGOTIATIONS);
  if (!update) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindU64(update.get(), 1, now_ms);
  return Translate(db, sqlite3_step(update.get()));
}

// ------------------------------------------------------------------
// Settlements
// ------------------------------------------------------------------

Result SqliteRepository::InsertSettlement(Transaction& t, const model::SettlementRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_SETTLEMENT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.negotiation_id);
  BindText(st.get(), 2, r.intent_id);
  BindText(st.get(), 3, r.payer_did);
  BindText(st.get(), 4, r.payee_did);
  BindOptionalText(st.get(), 5, r.validator_did);
  BindOptionalText(st.get(), 6, r.usefulness_proof_id);
  BindU64(st.get(), 7, r.amount);
  BindText(st.get(), 8, r.incentive_split_json);
  BindText(st.get(), 9, r.status);
  sqlite3_bind_int(st.get(), 10, static_cast<int>(r.attempts));
  BindOptionalText(st.get(), 11, r.last_error);
  BindU64(st.get(), 12, r.created_at_ms);
  BindU64(st.get(), 13, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::SettlementRecord> SqliteRepository::GetSettlement(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SETTLEMENT);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadSettlement(st.get());
}

std::optional<model::SettlementRecord> SqliteRepository::LockSettlement(Transaction& t, const std::string& id) {
  return GetSettlement(t, id);
}

Result SqliteRepository::UpdateSettlement(Transaction& t, const model::SettlementRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPDATE_SETTLEMENT);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.status);
  sqlite3_bind_int(st.get(), 2, static_cast<int>(r.attempts));
  BindOptionalText(st.get(), 3, r.last_error);
  BindU64(st.get(), 4, r.updated_at_ms);
  BindText(st.get(), 5, r.negotiation_id);

  auto result = Translate(db, sqlite3_step(st.get()));
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "settlement not found: " + r.negotiation_id);
  }
  return result;
}

std::vector<model::SettlementRecord> SqliteRepository::ListSettlementsByStatus(Transaction& t, const std::string& status,
                                                                               std::size_t limit) {
  std::vector<model::SettlementRecord> out;

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SETTLEMENTS_BY_STATUS);
  if (!st) return out;

  BindText(st.get(), 1, status);
  BindU64(st.get(), 2, limit);

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadSettlement(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Usefulness
// ------------------------------------------------------------------

Result SqliteRepository::UpsertUsefulnessScore(Transaction& t, const model::UsefulnessScoreRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPSERT_USEFULNESS);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.agent_did);
  BindDouble(st.get(), 2, r.usefulness_score);
  BindU64(st.get(), 3, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::UsefulnessScoreRecord> SqliteRepository::GetUsefulnessScore(Transaction& t, const std::string& did) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_USEFULNESS);
  if (!st) return std::nullopt;

  BindText(st.get(), 1, did);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadUsefulness(st.get());
}

std::vector<model::UsefulnessScoreRecord> SqliteRepository::ListUsefulnessScores(Transaction& t, double min_score) {
  std::vector<model::UsefulnessScoreRecord> out;

  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_USEFULNESS_AT_LEAST);
  if (!st) return out;

  BindDouble(st.get(), 1, min_score);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadUsefulness(st.get()));
  }
  return out;
}

} // namespace ainp::db::sqlite
