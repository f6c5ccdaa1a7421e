#pragma once

namespace ainp::db::sql {

/*
  SQLite statements. The PostgreSQL backend prepares the same statements
  with $n placeholders and row locks in PgPool.
*/

// accounts

static constexpr const char* INSERT_ACCOUNT =
    "INSERT INTO credit_accounts(agent_did,balance,reserved,earned,spent,created_at_ms,updated_at_ms)"
    " VALUES(?,?,?,?,?,?,?);";

static constexpr const char* SELECT_ACCOUNT =
    "SELECT agent_did,balance,reserved,earned,spent,created_at_ms,updated_at_ms"
    " FROM credit_accounts WHERE agent_did=?;";

static constexpr const char* UPDATE_ACCOUNT =
    "UPDATE credit_accounts SET balance=?,reserved=?,earned=?,spent=?,updated_at_ms=?"
    " WHERE agent_did=?;";

// ledger

static constexpr const char* INSERT_CREDIT_TRANSACTION =
    "INSERT INTO credit_transactions(id,agent_did,tx_type,amount,intent_id,usefulness_proof_id,metadata,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_CREDIT_TRANSACTIONS =
    "SELECT seq,id,agent_did,tx_type,amount,intent_id,usefulness_proof_id,metadata,created_at_ms"
    " FROM credit_transactions WHERE agent_did=?"
    " ORDER BY seq DESC LIMIT ? OFFSET ?;";

// negotiations

#define AINP_NEGOTIATION_COLUMNS                                                                             \
  "id,intent_id,initiator_did,responder_did,state,rounds,convergence_score,current_proposal,final_proposal," \
  "incentive_split,max_rounds,created_at_ms,expires_at_ms,updated_at_ms"

static constexpr const char* INSERT_NEGOTIATION =
    "INSERT INTO negotiations(" AINP_NEGOTIATION_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_NEGOTIATION =
    "SELECT " AINP_NEGOTIATION_COLUMNS " FROM negotiations WHERE id=?;";

static constexpr const char* UPDATE_NEGOTIATION =
    "UPDATE negotiations SET state=?,rounds=?,convergence_score=?,current_proposal=?,final_proposal=?,"
    "incentive_split=?,updated_at_ms=? WHERE id=?;";

static constexpr const char* SELECT_NEGOTIATIONS_BY_AGENT =
    "SELECT " AINP_NEGOTIATION_COLUMNS " FROM negotiations"
    " WHERE (initiator_did=?1 OR responder_did=?1) AND (?2 IS NULL OR state=?2)"
    " ORDER BY created_at_ms DESC, id DESC;";

static constexpr const char* SELECT_EXPIRABLE_NEGOTIATIONS =
    "SELECT id FROM negotiations"
    " WHERE state NOT IN ('accepted','rejected','expired') AND expires_at_ms<=?"
    " ORDER BY id;";

static constexpr const char* EXPIRE_NEGOTIATIONS =
    "UPDATE negotiations SET state='expired',updated_at_ms=?1"
    " WHERE state NOT IN ('accepted','rejected','expired') AND expires_at_ms<=?1;";

// settlements

#define AINP_SETTLEMENT_COLUMNS                                                                              \
  "negotiation_id,intent_id,payer_did,payee_did,validator_did,usefulness_proof_id,amount,incentive_split,"   \
  "status,attempts,last_error,created_at_ms,updated_at_ms"

static constexpr const char* INSERT_SETTLEMENT =
    "INSERT INTO settlements(" AINP_SETTLEMENT_COLUMNS ")"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_SETTLEMENT =
    "SELECT " AINP_SETTLEMENT_COLUMNS " FROM settlements WHERE negotiation_id=?;";

static constexpr const char* UPDATE_SETTLEMENT =
    "UPDATE settlements SET status=?,attempts=?,last_error=?,updated_at_ms=? WHERE negotiation_id=?;";

static constexpr const char* SELECT_SETTLEMENTS_BY_STATUS =
    "SELECT " AINP_SETTLEMENT_COLUMNS " FROM settlements WHERE status=?"
    " ORDER BY created_at_ms ASC, negotiation_id ASC LIMIT ?;";

// usefulness

static constexpr const char* UPSERT_USEFULNESS =
    "INSERT INTO agent_usefulness(agent_did,usefulness_score,updated_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(agent_did) DO UPDATE SET"
    " usefulness_score=excluded.usefulness_score,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* SELECT_USEFULNESS =
    "SELECT agent_did,usefulness_score,updated_at_ms FROM agent_usefulness WHERE agent_did=?;";

static constexpr const char* SELECT_USEFULNESS_AT_LEAST =
    "SELECT agent_did,usefulness_score,updated_at_ms FROM agent_usefulness"
    " WHERE usefulness_score>=? ORDER BY agent_did;";

} // namespace ainp::db::sql
