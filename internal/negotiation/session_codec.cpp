#include "internal/negotiation/session_codec.hpp"

#include <stdexcept>

#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

namespace ainp::negotiation {

using namespace ainp::broker::v1;

std::string StateName(NegotiationState state) {
  switch (state) {
    case NEGOTIATION_STATE_INITIATED:
      return db::model::kStateInitiated;
    case NEGOTIATION_STATE_PROPOSED:
      return db::model::kStateProposed;
    case NEGOTIATION_STATE_COUNTER_PROPOSED:
      return db::model::kStateCounterProposed;
    case NEGOTIATION_STATE_ACCEPTED:
      return db::model::kStateAccepted;
    case NEGOTIATION_STATE_REJECTED:
      return db::model::kStateRejected;
    case NEGOTIATION_STATE_EXPIRED:
      return db::model::kStateExpired;
    default:
      throw std::invalid_argument("unknown negotiation state: " + std::to_string(static_cast<int>(state)));
  }
}

NegotiationState ParseState(const std::string& name) {
  if (name == db::model::kStateInitiated) return NEGOTIATION_STATE_INITIATED;
  if (name == db::model::kStateProposed) return NEGOTIATION_STATE_PROPOSED;
  if (name == db::model::kStateCounterProposed) return NEGOTIATION_STATE_COUNTER_PROPOSED;
  if (name == db::model::kStateAccepted) return NEGOTIATION_STATE_ACCEPTED;
  if (name == db::model::kStateRejected) return NEGOTIATION_STATE_REJECTED;
  if (name == db::model::kStateExpired) return NEGOTIATION_STATE_EXPIRED;
  throw std::invalid_argument("unknown negotiation state: " + name);
}

bool IsTerminal(NegotiationState state) {
  return state == NEGOTIATION_STATE_ACCEPTED || state == NEGOTIATION_STATE_REJECTED || state == NEGOTIATION_STATE_EXPIRED;
}

db::model::NegotiationRecord ToRecord(const NegotiationSession& session) {
  db::model::NegotiationRecord record;
  record.id                = session.id();
  record.intent_id         = session.intent_id();
  record.initiator_did     = session.initiator_did();
  record.responder_did     = session.responder_did();
  record.state             = StateName(session.state());
  record.rounds_json       = util::RepeatedToJson(session.rounds());
  record.convergence_score = session.convergence_score();
  record.max_rounds        = session.max_rounds();
  record.created_at_ms     = util::ToUnixMillis(util::FromProto(session.created_at()));
  record.expires_at_ms     = util::ToUnixMillis(util::FromProto(session.expires_at()));
  record.updated_at_ms     = util::ToUnixMillis(util::FromProto(session.updated_at()));

  if (session.has_current_proposal()) record.current_proposal_json = util::ToJson(session.current_proposal());
  if (session.has_final_proposal()) record.final_proposal_json = util::ToJson(session.final_proposal());
  if (session.has_incentive_split()) record.incentive_split_json = util::ToJson(session.incentive_split());
  return record;
}

NegotiationSession FromRecord(const db::model::NegotiationRecord& record) {
  NegotiationSession session;
  session.set_id(record.id);
  session.set_intent_id(record.intent_id);
  session.set_initiator_did(record.initiator_did);
  session.set_responder_did(record.responder_did);
  session.set_state(ParseState(record.state));
  util::RepeatedFromJson(record.rounds_json.empty() ? "[]" : record.rounds_json, session.mutable_rounds());
  session.set_convergence_score(record.convergence_score);
  session.set_max_rounds(record.max_rounds);
  *session.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *session.mutable_expires_at() = util::MillisToProto(record.expires_at_ms);
  *session.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);

  if (!record.current_proposal_json.empty()) util::FromJson(record.current_proposal_json, session.mutable_current_proposal());
  if (!record.final_proposal_json.empty()) util::FromJson(record.final_proposal_json, session.mutable_final_proposal());
  if (!record.incentive_split_json.empty()) util::FromJson(record.incentive_split_json, session.mutable_incentive_split());
  return session;
}

} // namespace ainp::negotiation
