#pragma once

#include <cstdint>
#include <string>

namespace ainp::db::model {

inline constexpr const char* kStateInitiated       = "initiated";
inline constexpr const char* kStateProposed        = "proposed";
inline constexpr const char* kStateCounterProposed = "counter_proposed";
inline constexpr const char* kStateAccepted        = "accepted";
inline constexpr const char* kStateRejected        = "rejected";
inline constexpr const char* kStateExpired         = "expired";

inline bool IsTerminalState(const std::string& state) {
  return state == kStateAccepted || state == kStateRejected || state == kStateExpired;
}

/*
  Persisted negotiation session. Structured fields (rounds, proposals,
  split) are stored as proto JSON; state is the lowercase state name.
*/
struct NegotiationRecord {
  std::string id;
  std::string intent_id;
  std::string initiator_did;
  std::string responder_did;
  std::string state;
  std::string rounds_json = "[]";
  double      convergence_score = 0.0;
  std::string current_proposal_json;
  std::string final_proposal_json;
  std::string incentive_split_json;
  uint32_t    max_rounds    = 0;
  uint64_t    created_at_ms = 0;
  uint64_t    expires_at_ms = 0;
  uint64_t    updated_at_ms = 0;
};

} // namespace ainp::db::model
