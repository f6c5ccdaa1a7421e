#include "internal/negotiation/negotiation_engine.hpp"

#include <cmath>

#include "internal/credit/credit_ledger.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/incentive/incentive_split.hpp"
#include "internal/negotiation/convergence.hpp"
#include "internal/negotiation/session_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/settlement/settlement_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ainp::negotiation {

using namespace ainp::broker::v1;
using ainp::db::ThrowIfDbError;
using ainp::observability::DoubleField;
using ainp::observability::IntField;
using ainp::observability::StringField;
using ainp::observability::UIntField;

namespace {

void CheckNonNegative(const char* name, double value) {
  if (!std::isfinite(value) || value < 0.0) {
    throw util::ValidationError(std::string(name) + " must be a non-negative number");
  }
}

// custom_terms keys stamped by Accept, Reject and settlement
constexpr const char* kEngineOwnedTerms[] = {"reserved_credits", "settled_credits", "rejected", "rejected_by"};

bool IsParticipant(const NegotiationSession& session, const std::string& did) {
  return did == session.initiator_did() || did == session.responder_did();
}

bool CanPropose(NegotiationState state) {
  return state == NEGOTIATION_STATE_INITIATED || state == NEGOTIATION_STATE_PROPOSED ||
         state == NEGOTIATION_STATE_COUNTER_PROPOSED;
}

bool CanAccept(NegotiationState state) {
  return state == NEGOTIATION_STATE_PROPOSED || state == NEGOTIATION_STATE_COUNTER_PROPOSED;
}

} // namespace

void ValidateTerms(const ProposalTerms& terms) {
  if (terms.has_price()) CheckNonNegative("price", terms.price());
  if (terms.has_delivery_time()) CheckNonNegative("delivery_time", terms.delivery_time());
  if (terms.has_quality_sla()) {
    const double sla = terms.quality_sla();
    if (!std::isfinite(sla) || sla < 0.0 || sla > 1.0) {
      throw util::ValidationError("quality_sla must be within [0, 1]");
    }
  }
  if (terms.has_incentive_split() && !incentive::IsValidSplit(terms.incentive_split())) {
    throw util::ValidationError("incentive_split fractions must be non-negative and sum to 1.0");
  }
  if (terms.has_custom_terms()) {
    const auto& fields = terms.custom_terms().fields();
    for (const char* key : kEngineOwnedTerms) {
      if (fields.find(key) != fields.end()) {
        throw util::ValidationError(std::string("custom_terms key '") + key + "' is reserved");
      }
    }
  }
}

uint64_t PriceToAtomicUnits(const ProposalTerms& terms, uint64_t scale) {
  if (!terms.has_price()) {
    return 0;
  }
  const double units = std::floor(terms.price() * static_cast<double>(scale));
  if (!(units < 18446744073709551616.0)) {
    throw util::ValidationError("price " + std::to_string(terms.price()) + " is out of range");
  }
  return units > 0.0 ? static_cast<uint64_t>(units) : 0;
}

NegotiationEngine::NegotiationEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<credit::CreditLedger> ledger,
                                     config::EngineOptions options, util::ClockFn clock)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), options_(std::move(options)), clock_(std::move(clock)) {
}

NegotiationSession NegotiationEngine::LockSession(db::Transaction& tx, const std::string& negotiation_id) {
  auto record = repository_->LockNegotiation(tx, negotiation_id);
  if (!record) {
    throw util::NegotiationNotFound(negotiation_id);
  }
  return FromRecord(*record);
}

void NegotiationEngine::Store(db::Transaction& tx, NegotiationSession& session) {
  *session.mutable_updated_at() = util::ToProto(clock_());
  ThrowIfDbError(repository_->UpdateNegotiation(tx, ToRecord(session)), "update negotiation " + session.id());
}

void NegotiationEngine::CheckNotExpired(const NegotiationSession& session) const {
  if (clock_() >= util::FromProto(session.expires_at())) {
    throw util::ExpiredNegotiation(session.id());
  }
}

// ------------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------------

NegotiationSession NegotiationEngine::Initiate(const InitiateParams& params) {
  if (!options_.negotiation_enabled) {
    throw util::ValidationError("negotiation protocol is disabled");
  }
  if (params.intent_id.empty() || params.initiator_did.empty() || params.responder_did.empty()) {
    throw util::ValidationError("intent_id, initiator_did and responder_did are required");
  }
  if (params.initiator_did == params.responder_did) {
    throw util::ValidationError("initiator and responder must be different agents");
  }

  const uint32_t max_rounds = params.max_rounds.value_or(options_.default_max_rounds);
  if (max_rounds < 1 || max_rounds > options_.max_rounds_limit) {
    throw util::ValidationError("max_rounds must be between 1 and " + std::to_string(options_.max_rounds_limit));
  }

  const uint32_t ttl_minutes = params.ttl_minutes.value_or(options_.default_ttl_minutes);
  if (ttl_minutes == 0) {
    throw util::ValidationError("ttl_minutes must be positive");
  }

  ValidateTerms(params.initial_proposal);

  const auto now = clock_();

  NegotiationSession session;
  session.set_id(util::NewId());
  session.set_intent_id(params.intent_id);
  session.set_initiator_did(params.initiator_did);
  session.set_responder_did(params.responder_did);
  session.set_state(NEGOTIATION_STATE_INITIATED);
  session.set_convergence_score(0.0);
  session.set_max_rounds(max_rounds);
  *session.mutable_current_proposal() = params.initial_proposal;
  *session.mutable_incentive_split() =
      params.initial_proposal.has_incentive_split() ? params.initial_proposal.incentive_split() : incentive::DefaultSplit();
  *session.mutable_created_at() = util::ToProto(now);
  *session.mutable_updated_at() = util::ToProto(now);
  *session.mutable_expires_at() = util::ToProto(now + std::chrono::minutes(ttl_minutes));

  auto* round = session.add_rounds();
  round->set_round_number(1);
  round->set_proposer_did(params.initiator_did);
  *round->mutable_proposal()  = params.initial_proposal;
  *round->mutable_timestamp() = util::ToProto(now);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->InsertNegotiation(*tx, ToRecord(session)), "insert negotiation " + session.id());
  tx->Commit();

  AINP_LOG_INFO("negotiation initiated", {StringField("negotiation_id", session.id()), StringField("intent_id", session.intent_id()),
                                          StringField("initiator_did", session.initiator_did()),
                                          StringField("responder_did", session.responder_did()),
                                          UIntField("max_rounds", max_rounds), UIntField("ttl_minutes", ttl_minutes)});
  return session;
}

NegotiationSession NegotiationEngine::Propose(const std::string& negotiation_id, const std::string& proposer_did,
                                              const ProposalTerms& proposal) {
  auto tx      = repository_->Begin();
  auto session = LockSession(*tx, negotiation_id);

  CheckNotExpired(session);
  if (!CanPropose(session.state())) {
    throw util::InvalidStateTransition(StateName(session.state()), "propose");
  }
  if (!IsParticipant(session, proposer_did)) {
    throw util::ValidationError("proposer " + proposer_did + " is not a participant in negotiation " + negotiation_id);
  }
  ValidateTerms(proposal);

  const auto next_round = static_cast<uint32_t>(session.rounds_size()) + 1;
  if (next_round > session.max_rounds()) {
    throw util::MaxRoundsExceeded(negotiation_id, session.max_rounds());
  }

  auto* round = session.add_rounds();
  round->set_round_number(next_round);
  round->set_proposer_did(proposer_did);
  *round->mutable_proposal()  = proposal;
  *round->mutable_timestamp() = util::ToProto(clock_());
  round->set_convergence_delta(session.has_current_proposal() ? ProposalSimilarity(session.current_proposal(), proposal) : 0.0);

  session.set_convergence_score(SessionConvergence(session.rounds()));
  session.set_state(session.state() == NEGOTIATION_STATE_INITIATED ? NEGOTIATION_STATE_PROPOSED
                                                                   : NEGOTIATION_STATE_COUNTER_PROPOSED);
  *session.mutable_current_proposal() = proposal;

  Store(*tx, session);
  tx->Commit();

  AINP_LOG_INFO("negotiation proposal added", {StringField("negotiation_id", negotiation_id), StringField("proposer_did", proposer_did),
                                               UIntField("round_number", next_round),
                                               StringField("state", StateName(session.state())),
                                               DoubleField("convergence_score", session.convergence_score())});
  return session;
}

NegotiationSession NegotiationEngine::Accept(const std::string& negotiation_id, const std::string& acceptor_did) {
  auto tx      = repository_->Begin();
  auto session = LockSession(*tx, negotiation_id);

  CheckNotExpired(session);
  if (!session.has_current_proposal()) {
    throw util::ValidationError("cannot accept: no current proposal to accept");
  }
  if (!CanAccept(session.state())) {
    throw util::InvalidStateTransition(StateName(session.state()), "accept");
  }
  if (!IsParticipant(session, acceptor_did)) {
    throw util::ValidationError("acceptor " + acceptor_did + " is not a participant in negotiation " + negotiation_id);
  }

  uint64_t reserved = 0;
  if (options_.settlement_enabled) {
    reserved = PriceToAtomicUnits(session.current_proposal(), options_.atomic_unit_scale);
  }
  if (reserved > 0) {
    ledger_->Reserve(*tx, session.initiator_did(), reserved, session.intent_id());
  }

  *session.mutable_final_proposal() = session.current_proposal();
  if (reserved > 0) {
    auto& terms = *session.mutable_current_proposal()->mutable_custom_terms()->mutable_fields();
    terms["reserved_credits"].set_string_value(std::to_string(reserved));
  } else if (session.current_proposal().has_custom_terms()) {
    session.mutable_current_proposal()->mutable_custom_terms()->mutable_fields()->erase("reserved_credits");
  }
  session.set_state(NEGOTIATION_STATE_ACCEPTED);

  Store(*tx, session);
  tx->Commit();

  AINP_LOG_INFO("negotiation accepted", {StringField("negotiation_id", negotiation_id), StringField("acceptor_did", acceptor_did),
                                         IntField("rounds", session.rounds_size()), UIntField("reserved_credits", reserved)});
  return session;
}

NegotiationSession NegotiationEngine::Reject(const std::string& negotiation_id, const std::string& rejector_did,
                                             const std::optional<std::string>& reason) {
  auto tx      = repository_->Begin();
  auto session = LockSession(*tx, negotiation_id);

  if (!IsParticipant(session, rejector_did)) {
    throw util::ValidationError("rejector " + rejector_did + " is not a participant in negotiation " + negotiation_id);
  }
  if (IsTerminal(session.state())) {
    throw util::InvalidStateTransition(StateName(session.state()), "reject");
  }

  // rounds never exceed max_rounds; a full history carries the marker on
  // the current proposal instead of a pseudo-round
  google::protobuf::Map<std::string, google::protobuf::Value>* marker = nullptr;
  if (static_cast<uint32_t>(session.rounds_size()) < session.max_rounds()) {
    auto* round = session.add_rounds();
    round->set_round_number(static_cast<uint32_t>(session.rounds_size()));
    round->set_proposer_did(rejector_did);
    *round->mutable_timestamp() = util::ToProto(clock_());
    marker = round->mutable_proposal()->mutable_custom_terms()->mutable_fields();
  } else {
    marker = session.mutable_current_proposal()->mutable_custom_terms()->mutable_fields();
    (*marker)["rejected_by"].set_string_value(rejector_did);
  }

  auto& terms = *marker;
  terms["rejected"].set_bool_value(true);
  if (reason) {
    terms["reason"].set_string_value(*reason);
  }

  session.set_state(NEGOTIATION_STATE_REJECTED);

  Store(*tx, session);
  tx->Commit();

  AINP_LOG_INFO("negotiation rejected", {StringField("negotiation_id", negotiation_id), StringField("rejector_did", rejector_did),
                                         StringField("reason", reason.value_or("")), IntField("rounds", session.rounds_size())});
  return session;
}

SettlementOutcome NegotiationEngine::Settle(const std::string& negotiation_id, settlement::SettlementCoordinator& coordinator,
                                            const std::optional<std::string>& validator_did,
                                            const std::optional<std::string>& usefulness_proof_id) {
  return coordinator.Settle(negotiation_id, validator_did, usefulness_proof_id);
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

std::optional<NegotiationSession> NegotiationEngine::GetSession(const std::string& negotiation_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetNegotiation(*tx, negotiation_id);
  tx->Commit();

  if (!record) return std::nullopt;
  return FromRecord(*record);
}

std::vector<NegotiationSession> NegotiationEngine::GetSessionsByAgent(const std::string& agent_did,
                                                                      const std::optional<NegotiationState>& state) {
  std::optional<std::string> state_name;
  if (state) {
    state_name = StateName(*state);
  }

  auto tx      = repository_->Begin();
  auto records = repository_->ListNegotiationsByAgent(*tx, agent_did, state_name);
  tx->Commit();

  std::vector<NegotiationSession> sessions;
  sessions.reserve(records.size());
  for (const auto& record : records) {
    sessions.push_back(FromRecord(record));
  }
  return sessions;
}

uint64_t NegotiationEngine::ExpireStaleNegotiations() {
  const auto now_ms = util::ToUnixMillis(clock_());

  std::vector<std::string> expired;

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->ExpireNegotiations(*tx, now_ms, &expired), "expire negotiations");
  tx->Commit();

  if (!expired.empty()) {
    AINP_LOG_INFO("expired stale negotiations", {UIntField("count", expired.size())});
  }
  for (const auto& id : expired) {
    AINP_LOG_DEBUG("negotiation expired", {StringField("negotiation_id", id)});
  }
  return expired.size();
}

} // namespace ainp::negotiation
