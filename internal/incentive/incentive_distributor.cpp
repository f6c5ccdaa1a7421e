#include "internal/incentive/incentive_distributor.hpp"

#include <cmath>
#include <set>

#include "internal/credit/credit_ledger.hpp"
#include "internal/incentive/incentive_split.hpp"
#include "internal/observability/logging.hpp"
#include "internal/usefulness/usefulness_cache.hpp"
#include "internal/util/errors.hpp"

namespace ainp::incentive {

using namespace ainp::broker::v1;
using ainp::observability::DoubleField;
using ainp::observability::IntField;
using ainp::observability::StringField;
using ainp::observability::UIntField;

namespace {

// floor(total * fraction) in double precision, never more than remaining
uint64_t Share(uint64_t total, double fraction, uint64_t remaining) {
  const double exact = std::floor(static_cast<double>(total) * fraction);
  if (!(exact > 0.0)) {
    return 0;
  }
  if (exact >= static_cast<double>(remaining)) {
    return remaining;
  }
  return static_cast<uint64_t>(exact);
}

// floor(total * weight / total_weight), multiplying before dividing
uint64_t ProportionalShare(uint64_t total, double weight, double total_weight, uint64_t remaining) {
  const double exact = std::floor(static_cast<double>(total) * weight / total_weight);
  if (!(exact > 0.0)) {
    return 0;
  }
  if (exact >= static_cast<double>(remaining)) {
    return remaining;
  }
  return static_cast<uint64_t>(exact);
}

std::string SplitToString(const IncentiveSplit& split) {
  return std::to_string(split.agent()) + "/" + std::to_string(split.broker()) + "/" + std::to_string(split.validator()) +
         "/" + std::to_string(split.pool());
}

} // namespace

IncentiveDistributor::IncentiveDistributor(std::shared_ptr<db::Repository> repository, std::shared_ptr<credit::CreditLedger> ledger,
                                           std::shared_ptr<usefulness::UsefulnessCache> usefulness)
    : repository_(std::move(repository)), ledger_(std::move(ledger)), usefulness_(std::move(usefulness)) {
}

DistributionBreakdown IncentiveDistributor::Allocate(uint64_t total, const IncentiveSplit& split) {
  DistributionBreakdown breakdown;

  uint64_t remaining = total;
  breakdown.set_agent(Share(total, split.agent(), remaining));
  remaining -= breakdown.agent();
  breakdown.set_broker(Share(total, split.broker(), remaining));
  remaining -= breakdown.broker();
  breakdown.set_validator(Share(total, split.validator(), remaining));
  remaining -= breakdown.validator();
  breakdown.set_pool(remaining);
  return breakdown;
}

DistributionResult IncentiveDistributor::Distribute(const DistributionParams& params) {
  auto tx     = repository_->Begin();
  auto result = Distribute(*tx, params);
  tx->Commit();
  return result;
}

DistributionResult IncentiveDistributor::Distribute(db::Transaction& tx, const DistributionParams& params) {
  if (params.agent_did.empty()) {
    throw util::ValidationError("distribution requires an agent_did");
  }
  if (!IsValidSplit(params.incentive_split)) {
    throw util::ValidationError("invalid incentive split " + SplitToString(params.incentive_split) + ", expected fractions summing to 1.0");
  }

  const auto breakdown = Allocate(params.total_amount, params.incentive_split);

  const bool pay_broker    = params.broker_did && !params.broker_did->empty() && breakdown.broker() > 0;
  const bool pay_validator = params.validator_did && !params.validator_did->empty() && breakdown.validator() > 0;

  // lock every recipient up front, in DID order
  std::set<std::string> recipients{params.agent_did};
  if (pay_broker) recipients.insert(*params.broker_did);
  if (pay_validator) recipients.insert(*params.validator_did);
  for (const auto& did : recipients) {
    ledger_->CreateAccount(tx, did);
  }

  ledger_->Earn(tx, params.agent_did, breakdown.agent(), params.intent_id, params.usefulness_proof_id);
  AINP_LOG_INFO("credits distributed to agent", {StringField("intent_id", params.intent_id), StringField("agent_did", params.agent_did),
                                                 UIntField("amount", breakdown.agent())});

  if (pay_broker) {
    ledger_->Earn(tx, *params.broker_did, breakdown.broker(), params.intent_id);
    AINP_LOG_INFO("credits distributed to broker", {StringField("intent_id", params.intent_id),
                                                    StringField("broker_did", *params.broker_did), UIntField("amount", breakdown.broker())});
  }

  if (pay_validator) {
    ledger_->Earn(tx, *params.validator_did, breakdown.validator(), params.intent_id);
    AINP_LOG_INFO("credits distributed to validator",
                  {StringField("intent_id", params.intent_id), StringField("validator_did", *params.validator_did),
                   UIntField("amount", breakdown.validator())});
  }

  // no pool account exists yet; the share is reported but not credited
  if (breakdown.pool() > 0) {
    AINP_LOG_INFO("pool share allocated", {StringField("intent_id", params.intent_id), UIntField("amount", breakdown.pool())});
  }

  DistributionResult result;
  result.set_intent_id(params.intent_id);
  result.set_total_amount(params.total_amount);
  *result.mutable_distributed() = breakdown;
  result.set_agent_did(params.agent_did);
  result.set_broker_did(params.broker_did.value_or(""));
  result.set_validator_did(params.validator_did.value_or(""));

  AINP_LOG_INFO("incentive distribution complete", {StringField("intent_id", params.intent_id), UIntField("total_amount", params.total_amount),
                                                    IntField("recipients", static_cast<int64_t>(recipients.size()))});
  return result;
}

UsefulnessDistribution IncentiveDistributor::DistributeUsefulnessRewards(uint64_t reward_pool, double min_score) {
  if (std::isnan(min_score)) {
    throw util::ValidationError("min_score must be a number");
  }

  UsefulnessDistribution distribution;
  distribution.set_reward_pool(reward_pool);

  auto tx     = repository_->Begin();
  auto scores = usefulness_->Qualifying(*tx, min_score);

  double total_score = 0.0;
  for (const auto& entry : scores) total_score += entry.score;
  distribution.set_total_score(total_score);

  if (scores.empty() || total_score <= 0.0) {
    tx->Commit();
    AINP_LOG_INFO("no agents qualify for usefulness rewards", {DoubleField("min_score", min_score)});
    return distribution;
  }

  // Qualifying() is DID-ordered, which is also the lock order
  uint64_t total_distributed = 0;
  for (const auto& entry : scores) {
    const auto amount = ProportionalShare(reward_pool, entry.score, total_score, reward_pool - total_distributed);

    ledger_->CreateAccount(*tx, entry.agent_did);
    if (amount > 0) {
      ledger_->Earn(*tx, entry.agent_did, amount, kUsefulnessRewardIntent);
    }
    total_distributed += amount;

    auto* reward = distribution.add_recipients();
    reward->set_agent_did(entry.agent_did);
    reward->set_usefulness_score(entry.score);
    reward->set_amount(amount);
  }

  tx->Commit();
  distribution.set_total_distributed(total_distributed);

  AINP_LOG_INFO("usefulness rewards distributed", {UIntField("reward_pool", reward_pool), UIntField("total_distributed", total_distributed),
                                                   IntField("recipients", distribution.recipients_size())});
  return distribution;
}

} // namespace ainp::incentive
