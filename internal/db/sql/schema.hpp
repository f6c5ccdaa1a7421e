#pragma once

#include <string>
#include <vector>

namespace ainp::db::sql {

/*
  Table layout shared by the factory bootstrap and the backend tests.
  Amounts are unsigned 64-bit atomic units stored in signed 64-bit columns.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS negotiations (id TEXT PRIMARY KEY, intent_id TEXT NOT NULL, initiator_did TEXT NOT NULL, responder_did TEXT NOT NULL, state TEXT NOT NULL, rounds TEXT NOT NULL DEFAULT '[]', convergence_score REAL NOT NULL DEFAULT 0, current_proposal TEXT, final_proposal TEXT, incentive_split TEXT, max_rounds INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, expires_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_negotiations_initiator ON negotiations(initiator_did);",
      "CREATE INDEX IF NOT EXISTS idx_negotiations_responder ON negotiations(responder_did);",
      "CREATE INDEX IF NOT EXISTS idx_negotiations_expiry ON negotiations(state, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS credit_accounts (agent_did TEXT PRIMARY KEY, balance INTEGER NOT NULL DEFAULT 0, reserved INTEGER NOT NULL DEFAULT 0, earned INTEGER NOT NULL DEFAULT 0, spent INTEGER NOT NULL DEFAULT 0, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS credit_transactions (seq INTEGER PRIMARY KEY AUTOINCREMENT, id TEXT NOT NULL UNIQUE, agent_did TEXT NOT NULL, tx_type TEXT NOT NULL, amount INTEGER NOT NULL, intent_id TEXT, usefulness_proof_id TEXT, metadata TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_credit_transactions_agent ON credit_transactions(agent_did, seq);",
      "CREATE TABLE IF NOT EXISTS settlements (negotiation_id TEXT PRIMARY KEY, intent_id TEXT NOT NULL, payer_did TEXT NOT NULL, payee_did TEXT NOT NULL, validator_did TEXT, usefulness_proof_id TEXT, amount INTEGER NOT NULL, incentive_split TEXT NOT NULL, status TEXT NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_error TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_settlements_status ON settlements(status, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS agent_usefulness (agent_did TEXT PRIMARY KEY, usefulness_score REAL NOT NULL, updated_at_ms INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS negotiations (id TEXT PRIMARY KEY, intent_id TEXT NOT NULL, initiator_did TEXT NOT NULL, responder_did TEXT NOT NULL, state TEXT NOT NULL, rounds JSONB NOT NULL DEFAULT '[]', convergence_score DOUBLE PRECISION NOT NULL DEFAULT 0, current_proposal JSONB, final_proposal JSONB, incentive_split JSONB, max_rounds INTEGER NOT NULL, created_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_negotiations_initiator ON negotiations(initiator_did);",
      "CREATE INDEX IF NOT EXISTS idx_negotiations_responder ON negotiations(responder_did);",
      "CREATE INDEX IF NOT EXISTS idx_negotiations_expiry ON negotiations(state, expires_at_ms);",
      "CREATE TABLE IF NOT EXISTS credit_accounts (agent_did TEXT PRIMARY KEY, balance BIGINT NOT NULL DEFAULT 0 CHECK (balance >= 0), reserved BIGINT NOT NULL DEFAULT 0 CHECK (reserved >= 0), earned BIGINT NOT NULL DEFAULT 0, spent BIGINT NOT NULL DEFAULT 0, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, CHECK (balance >= reserved));",
      "CREATE TABLE IF NOT EXISTS credit_transactions (seq BIGSERIAL PRIMARY KEY, id TEXT NOT NULL UNIQUE, agent_did TEXT NOT NULL REFERENCES credit_accounts(agent_did), tx_type TEXT NOT NULL, amount BIGINT NOT NULL, intent_id TEXT, usefulness_proof_id TEXT, metadata JSONB NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_credit_transactions_agent ON credit_transactions(agent_did, seq);",
      "CREATE TABLE IF NOT EXISTS settlements (negotiation_id TEXT PRIMARY KEY REFERENCES negotiations(id), intent_id TEXT NOT NULL, payer_did TEXT NOT NULL, payee_did TEXT NOT NULL, validator_did TEXT, usefulness_proof_id TEXT, amount BIGINT NOT NULL, incentive_split JSONB NOT NULL, status TEXT NOT NULL, attempts INTEGER NOT NULL DEFAULT 0, last_error TEXT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS idx_settlements_status ON settlements(status, created_at_ms);",
      "CREATE TABLE IF NOT EXISTS agent_usefulness (agent_did TEXT PRIMARY KEY, usefulness_score DOUBLE PRECISION NOT NULL, updated_at_ms BIGINT NOT NULL);"};
  return kSchema;
}

} // namespace ainp::db::sql
