#pragma once

#include <cstdint>
#include <string>

namespace ainp::db::model {

inline constexpr const char* kSettlementPending     = "pending_distribution";
inline constexpr const char* kSettlementDistributed = "distributed";

struct SettlementRecord {
  std::string negotiation_id;
  std::string intent_id;
  std::string payer_did;
  std::string payee_did;
  std::string validator_did;
  std::string usefulness_proof_id;
  uint64_t    amount = 0;
  std::string incentive_split_json;
  std::string status = kSettlementPending;
  uint32_t    attempts = 0;
  std::string last_error;
  uint64_t    created_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace ainp::db::model
