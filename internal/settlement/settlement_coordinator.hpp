#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "ainp/broker/v1.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ainp::credit {
class CreditLedger;
}
namespace ainp::incentive {
class IncentiveDistributor;
}

namespace ainp::settlement {

/*
  SettlementCoordinator

  Settles an accepted negotiation in two store transactions:

    1. release the initiator's reservation as spent, move reserved_credits
       to settled_credits on the session, record a pending settlement
    2. distribute the amount by the session's split and mark the
       settlement distributed

  A failure in (2) leaves the settlement pending with the error recorded;
  ReconcilePendingSettlements retries it. Each settlement is distributed
  at most once.
*/
class SettlementCoordinator {
 public:
  SettlementCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<credit::CreditLedger> ledger,
                        std::shared_ptr<incentive::IncentiveDistributor> distributor, config::EngineOptions options,
                        util::ClockFn clock = util::Now);

  ainp::broker::v1::SettlementOutcome Settle(const std::string& negotiation_id,
                                             const std::optional<std::string>& validator_did       = std::nullopt,
                                             const std::optional<std::string>& usefulness_proof_id = std::nullopt);

  // Returns the number of settlements completed.
  std::size_t ReconcilePendingSettlements(std::size_t limit);

 private:
  // nullopt when the settlement was already distributed.
  std::optional<ainp::broker::v1::DistributionResult> CompleteDistribution(const std::string& negotiation_id);
  void RecordFailure(const std::string& negotiation_id, const std::string& error);
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository>                  repository_;
  std::shared_ptr<credit::CreditLedger>            ledger_;
  std::shared_ptr<incentive::IncentiveDistributor> distributor_;
  config::EngineOptions                            options_;
  util::ClockFn                                    clock_;
};

// Atomic units stamped in custom_terms.reserved_credits; 0 when absent.
uint64_t ReservedCredits(const ainp::broker::v1::ProposalTerms& terms);

} // namespace ainp::settlement
