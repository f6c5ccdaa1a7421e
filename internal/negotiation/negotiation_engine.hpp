#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ainp/broker/v1.hpp"
#include "internal/config/engine_options.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ainp::credit {
class CreditLedger;
}
namespace ainp::settlement {
class SettlementCoordinator;
}

namespace ainp::negotiation {

struct InitiateParams {
  std::string                     intent_id;
  std::string                     initiator_did;
  std::string                     responder_did;
  ainp::broker::v1::ProposalTerms initial_proposal;
  std::optional<uint32_t>         max_rounds;
  std::optional<uint32_t>         ttl_minutes;
};

/*
  NegotiationEngine

  Multi-round negotiation state machine:

    initiated -> proposed -> counter_proposed -> counter_proposed ...
    proposed | counter_proposed -> accepted
    any non-terminal -> rejected | expired

  Every mutation runs read-check-write under the session row lock. Accept
  reserves the initiator's credits in the same store transaction as the
  state change, so either both land or neither does.

  TTL is checked lazily on Propose / Accept; ExpireStaleNegotiations sweeps
  the rest.
*/
class NegotiationEngine {
 public:
  NegotiationEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<credit::CreditLedger> ledger,
                    config::EngineOptions options, util::ClockFn clock = util::Now);

  ainp::broker::v1::NegotiationSession Initiate(const InitiateParams& params);

  ainp::broker::v1::NegotiationSession Propose(const std::string& negotiation_id, const std::string& proposer_did,
                                               const ainp::broker::v1::ProposalTerms& proposal);

  ainp::broker::v1::NegotiationSession Accept(const std::string& negotiation_id, const std::string& acceptor_did);

  ainp::broker::v1::NegotiationSession Reject(const std::string& negotiation_id, const std::string& rejector_did,
                                              const std::optional<std::string>& reason = std::nullopt);

  ainp::broker::v1::SettlementOutcome Settle(const std::string& negotiation_id, settlement::SettlementCoordinator& coordinator,
                                             const std::optional<std::string>& validator_did       = std::nullopt,
                                             const std::optional<std::string>& usefulness_proof_id = std::nullopt);

  std::optional<ainp::broker::v1::NegotiationSession> GetSession(const std::string& negotiation_id);

  // Sessions where the agent is either party, newest first.
  std::vector<ainp::broker::v1::NegotiationSession>
  GetSessionsByAgent(const std::string& agent_did, const std::optional<ainp::broker::v1::NegotiationState>& state = std::nullopt);

  // Returns the number of sessions moved to expired.
  uint64_t ExpireStaleNegotiations();

  const config::EngineOptions& options() const {
    return options_;
  }

 private:
  ainp::broker::v1::NegotiationSession LockSession(db::Transaction& tx, const std::string& negotiation_id);
  void Store(db::Transaction& tx, ainp::broker::v1::NegotiationSession& session);
  void CheckNotExpired(const ainp::broker::v1::NegotiationSession& session) const;

  std::shared_ptr<db::Repository>       repository_;
  std::shared_ptr<credit::CreditLedger> ledger_;
  config::EngineOptions                 options_;
  util::ClockFn                         clock_;
};

// Throws util::ValidationError for negative / non-finite numeric terms, a
// quality_sla outside [0,1] or an invalid incentive split.
void ValidateTerms(const ainp::broker::v1::ProposalTerms& terms);

// floor(price * scale); 0 when the proposal carries no price.
uint64_t PriceToAtomicUnits(const ainp::broker::v1::ProposalTerms& terms, uint64_t scale);

} // namespace ainp::negotiation
