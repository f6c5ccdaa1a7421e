#pragma once

#include <cstdint>
#include <string>

namespace ainp::db::model {

/*
  One append-only ledger row. sequence is assigned by the repository on
  append and is strictly increasing across all agents.
*/
struct CreditTransactionRecord {
  std::string id;
  uint64_t    sequence = 0;
  std::string agent_did;
  std::string tx_type;
  uint64_t    amount = 0;
  std::string intent_id;
  std::string usefulness_proof_id;
  std::string metadata_json;
  uint64_t    created_at_ms = 0;
};

} // namespace ainp::db::model
