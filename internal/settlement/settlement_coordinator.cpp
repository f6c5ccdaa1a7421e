#include "internal/settlement/settlement_coordinator.hpp"

#include <charconv>
#include <cmath>

#include "internal/credit/credit_ledger.hpp"
#include "internal/db/api/throw_if_error.hpp"
#include "internal/incentive/incentive_distributor.hpp"
#include "internal/negotiation/session_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace ainp::settlement {

using namespace ainp::broker::v1;
using ainp::db::ThrowIfDbError;
using ainp::observability::StringField;
using ainp::observability::UIntField;

namespace {

constexpr const char* kReservedCredits = "reserved_credits";
constexpr const char* kSettledCredits  = "settled_credits";

} // namespace

uint64_t ReservedCredits(const ProposalTerms& terms) {
  const auto& fields = terms.custom_terms().fields();
  auto        it     = fields.find(kReservedCredits);
  if (it == fields.end()) {
    return 0;
  }

  const auto& value = it->second;
  if (value.kind_case() == google::protobuf::Value::kStringValue) {
    const auto& text   = value.string_value();
    uint64_t    amount = 0;
    auto [end, ec]     = std::from_chars(text.data(), text.data() + text.size(), amount);
    if (ec != std::errc() || end != text.data() + text.size()) {
      throw util::ValidationError("malformed reserved_credits: " + text);
    }
    return amount;
  }
  if (value.kind_case() == google::protobuf::Value::kNumberValue) {
    const double number = value.number_value();
    if (!std::isfinite(number) || number < 0.0) {
      throw util::ValidationError("malformed reserved_credits");
    }
    return static_cast<uint64_t>(number);
  }
  return 0;
}

SettlementCoordinator::SettlementCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<credit::CreditLedger> ledger,
                                             std::shared_ptr<incentive::IncentiveDistributor> distributor,
                                             config::EngineOptions options, util::ClockFn clock)
    : repository_(std::move(repository)),
      ledger_(std::move(ledger)),
      distributor_(std::move(distributor)),
      options_(std::move(options)),
      clock_(std::move(clock)) {
}

uint64_t SettlementCoordinator::NowMs() const {
  return util::ToUnixMillis(clock_());
}

SettlementOutcome SettlementCoordinator::Settle(const std::string& negotiation_id, const std::optional<std::string>& validator_did,
                                                const std::optional<std::string>& usefulness_proof_id) {
  SettlementOutcome outcome;
  outcome.set_negotiation_id(negotiation_id);

  {
    auto tx     = repository_->Begin();
    auto record = repository_->LockNegotiation(*tx, negotiation_id);
    if (!record) {
      throw util::NegotiationNotFound(negotiation_id);
    }

    auto session = negotiation::FromRecord(*record);
    outcome.set_intent_id(session.intent_id());

    if (session.state() != NEGOTIATION_STATE_ACCEPTED) {
      throw util::InvalidStateTransition(negotiation::StateName(session.state()), "settle");
    }

    if (!options_.settlement_enabled) {
      AINP_LOG_WARN("credit settlement skipped, settlement disabled", {StringField("negotiation_id", negotiation_id)});
      tx->Commit();
      outcome.set_skipped(true);
      return outcome;
    }

    const uint64_t amount = ReservedCredits(session.current_proposal());
    if (amount == 0) {
      throw util::ValidationError("no credits reserved for this negotiation");
    }

    ledger_->Release(*tx, session.initiator_did(), amount, amount, session.intent_id());

    auto& terms = *session.mutable_current_proposal()->mutable_custom_terms()->mutable_fields();
    terms.erase(kReservedCredits);
    terms[kSettledCredits].set_string_value(std::to_string(amount));
    *session.mutable_updated_at() = util::ToProto(clock_());
    ThrowIfDbError(repository_->UpdateNegotiation(*tx, negotiation::ToRecord(session)), "update negotiation " + negotiation_id);

    const auto now = NowMs();

    db::model::SettlementRecord settlement;
    settlement.negotiation_id       = negotiation_id;
    settlement.intent_id            = session.intent_id();
    settlement.payer_did            = session.initiator_did();
    settlement.payee_did            = session.responder_did();
    settlement.validator_did        = validator_did.value_or("");
    settlement.usefulness_proof_id  = usefulness_proof_id.value_or("");
    settlement.amount               = amount;
    settlement.incentive_split_json = util::ToJson(session.incentive_split());
    settlement.status               = db::model::kSettlementPending;
    settlement.created_at_ms        = now;
    settlement.updated_at_ms        = now;
    ThrowIfDbError(repository_->InsertSettlement(*tx, settlement), "insert settlement " + negotiation_id);

    tx->Commit();

    outcome.set_released_amount(amount);
    AINP_LOG_INFO("credits released from reservation", {StringField("negotiation_id", negotiation_id),
                                                        StringField("initiator_did", session.initiator_did()),
                                                        UIntField("amount", amount)});
  }

  try {
    auto result = CompleteDistribution(negotiation_id);
    if (result) {
      *outcome.mutable_distribution() = std::move(*result);
    }
  } catch (const std::exception& e) {
    AINP_LOG_ERROR("funds released but not distributed", {StringField("negotiation_id", negotiation_id),
                                                          UIntField("amount", outcome.released_amount()),
                                                          StringField("error", e.what())});
    RecordFailure(negotiation_id, e.what());
    throw;
  }

  const auto& distributed = outcome.distribution().distributed();
  AINP_LOG_INFO("negotiation settled", {StringField("negotiation_id", negotiation_id), StringField("intent_id", outcome.intent_id()),
                                        UIntField("total", outcome.distribution().total_amount()),
                                        UIntField("agent", distributed.agent()), UIntField("broker", distributed.broker()),
                                        UIntField("validator", distributed.validator()), UIntField("pool", distributed.pool())});
  return outcome;
}

std::optional<DistributionResult> SettlementCoordinator::CompleteDistribution(const std::string& negotiation_id) {
  auto tx     = repository_->Begin();
  auto record = repository_->LockSettlement(*tx, negotiation_id);
  if (!record) {
    throw util::NotFound("settlement not found: " + negotiation_id);
  }
  if (record->status == db::model::kSettlementDistributed) {
    return std::nullopt;
  }

  incentive::DistributionParams params;
  params.intent_id    = record->intent_id;
  params.total_amount = record->amount;
  params.agent_did    = record->payee_did;
  if (!options_.broker_did.empty()) params.broker_did = options_.broker_did;
  if (!record->validator_did.empty()) params.validator_did = record->validator_did;
  if (!record->usefulness_proof_id.empty()) params.usefulness_proof_id = record->usefulness_proof_id;
  util::FromJson(record->incentive_split_json, &params.incentive_split);

  auto result = distributor_->Distribute(*tx, params);

  record->status = db::model::kSettlementDistributed;
  record->attempts += 1;
  record->last_error.clear();
  record->updated_at_ms = NowMs();
  ThrowIfDbError(repository_->UpdateSettlement(*tx, *record), "update settlement " + negotiation_id);

  tx->Commit();
  return result;
}

void SettlementCoordinator::RecordFailure(const std::string& negotiation_id, const std::string& error) {
  try {
    auto tx     = repository_->Begin();
    auto record = repository_->LockSettlement(*tx, negotiation_id);
    if (!record || record->status != db::model::kSettlementPending) {
      return;
    }
    record->attempts += 1;
    record->last_error    = error;
    record->updated_at_ms = NowMs();
    ThrowIfDbError(repository_->UpdateSettlement(*tx, *record), "update settlement " + negotiation_id);
    tx->Commit();
  } catch (const std::exception& e) {
    AINP_LOG_ERROR("failed to record settlement failure", {StringField("negotiation_id", negotiation_id), StringField("error", e.what())});
  }
}

std::size_t SettlementCoordinator::ReconcilePendingSettlements(std::size_t limit) {
  std::vector<db::model::SettlementRecord> pending;
  {
    auto tx = repository_->Begin();
    pending = repository_->ListSettlementsByStatus(*tx, db::model::kSettlementPending, limit);
    tx->Commit();
  }

  std::size_t completed = 0;
  for (const auto& settlement : pending) {
    try {
      if (CompleteDistribution(settlement.negotiation_id)) {
        ++completed;
        AINP_LOG_INFO("pending settlement distributed", {StringField("negotiation_id", settlement.negotiation_id),
                                                         UIntField("amount", settlement.amount),
                                                         UIntField("attempts", settlement.attempts + 1)});
      }
    } catch (const std::exception& e) {
      AINP_LOG_ERROR("settlement reconciliation failed", {StringField("negotiation_id", settlement.negotiation_id),
                                                          StringField("error", e.what())});
      RecordFailure(settlement.negotiation_id, e.what());
    }
  }
  return completed;
}

} // namespace ainp::settlement
