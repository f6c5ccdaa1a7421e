#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "ainp/broker/v1.hpp"
#include "internal/db/api/repository.hpp"

namespace ainp::credit {
class CreditLedger;
}
namespace ainp::usefulness {
class UsefulnessCache;
}

namespace ainp::incentive {

// Intent reference stamped on usefulness reward credits.
inline constexpr const char* kUsefulnessRewardIntent = "usefulness_reward";

struct DistributionParams {
  std::string                      intent_id;
  uint64_t                         total_amount = 0;
  std::string                      agent_did;
  std::optional<std::string>       broker_did;
  std::optional<std::string>       validator_did;
  ainp::broker::v1::IncentiveSplit incentive_split;
  std::optional<std::string>       usefulness_proof_id;
};

/*
  IncentiveDistributor

  Fans a settled amount out to agent / broker / validator by split, and a
  reward pool out to agents in proportion to their usefulness score.
  All credits of one call commit together; recipient accounts are created
  on demand and locked in DID order.
*/
class IncentiveDistributor {
 public:
  IncentiveDistributor(std::shared_ptr<db::Repository> repository, std::shared_ptr<credit::CreditLedger> ledger,
                       std::shared_ptr<usefulness::UsefulnessCache> usefulness);

  ainp::broker::v1::DistributionResult Distribute(const DistributionParams& params);
  ainp::broker::v1::DistributionResult Distribute(db::Transaction& tx, const DistributionParams& params);

  ainp::broker::v1::UsefulnessDistribution DistributeUsefulnessRewards(uint64_t reward_pool, double min_score = 10.0);

  // floor(total * fraction) per bucket; the pool takes the remainder so the
  // four buckets always sum to total.
  static ainp::broker::v1::DistributionBreakdown Allocate(uint64_t total, const ainp::broker::v1::IncentiveSplit& split);

 private:
  std::shared_ptr<db::Repository>              repository_;
  std::shared_ptr<credit::CreditLedger>        ledger_;
  std::shared_ptr<usefulness::UsefulnessCache> usefulness_;
};

} // namespace ainp::incentive
