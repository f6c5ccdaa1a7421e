#include "internal/incentive/incentive_distributor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/credit/credit_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/incentive/incentive_split.hpp"
#include "internal/usefulness/usefulness_cache.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using ainp::credit::CreditLedger;
using ainp::db::memory::MemoryRepository;
using ainp::incentive::DistributionParams;
using ainp::incentive::IncentiveDistributor;
using ainp::usefulness::UsefulnessCache;
using namespace ainp::broker::v1;

struct Fixture {
  explicit Fixture(std::shared_ptr<ainp::db::Repository> repo = std::make_shared<MemoryRepository>())
      : repository(std::move(repo)),
        ledger(std::make_shared<CreditLedger>(repository)),
        usefulness(std::make_shared<UsefulnessCache>(repository)),
        distributor(repository, ledger, usefulness) {
  }

  uint64_t Balance(const std::string& did) {
    auto account = ledger->GetAccount(did);
    return account ? account->balance() : 0;
  }

  std::shared_ptr<ainp::db::Repository> repository;
  std::shared_ptr<CreditLedger>         ledger;
  std::shared_ptr<UsefulnessCache>      usefulness;
  IncentiveDistributor                  distributor;
};

IncentiveSplit Split(double agent, double broker, double validator, double pool) {
  IncentiveSplit split;
  split.set_agent(agent);
  split.set_broker(broker);
  split.set_validator(validator);
  split.set_pool(pool);
  return split;
}

void TestAllocationAlwaysSumsToTotal() {
  const std::vector<IncentiveSplit> splits = {
      ainp::incentive::DefaultSplit(), Split(0.333, 0.333, 0.334, 0.0), Split(1.0, 0.0, 0.0, 0.0),
      Split(0.0, 0.0, 0.0, 1.0),       Split(0.55, 0.15, 0.2, 0.1),     Split(0.3333, 0.3333, 0.3333, 0.0001),
  };
  const std::vector<uint64_t> totals = {0, 1, 3, 7, 99, 1000, 123457, 9'999'999'999ULL};

  for (const auto& split : splits) {
    for (auto total : totals) {
      auto b = IncentiveDistributor::Allocate(total, split);
      assert(b.agent() + b.broker() + b.validator() + b.pool() == total);
    }
  }

  auto standard = IncentiveDistributor::Allocate(1000, ainp::incentive::DefaultSplit());
  assert(standard.agent() == 700);
  assert(standard.broker() == 100);
  assert(standard.validator() == 100);
  assert(standard.pool() == 100);
}

void TestDistributeCreditsParticipants() {
  Fixture f;

  DistributionParams params;
  params.intent_id           = "intent-1";
  params.total_amount        = 1000;
  params.agent_did           = "did:agent";
  params.broker_did          = "did:broker";
  params.validator_did       = "did:validator";
  params.incentive_split     = ainp::incentive::DefaultSplit();
  params.usefulness_proof_id = "proof-7";

  auto result = f.distributor.Distribute(params);
  assert(result.total_amount() == 1000);
  assert(result.distributed().pool() == 100);

  assert(f.Balance("did:agent") == 700);
  assert(f.Balance("did:broker") == 100);
  assert(f.Balance("did:validator") == 100);

  auto agent_history = f.ledger->GetTransactionHistory("did:agent");
  assert(agent_history.size() == 1);
  assert(agent_history[0].tx_type() == TX_TYPE_EARN);
  assert(agent_history[0].usefulness_proof_id() == "proof-7");
}

void TestOptionalRecipientsAreSkipped() {
  Fixture f;

  DistributionParams params;
  params.intent_id       = "intent-2";
  params.total_amount    = 1000;
  params.agent_did       = "did:agent";
  params.validator_did   = "did:validator";
  params.incentive_split = Split(0.8, 0.2, 0.0, 0.0);

  auto result = f.distributor.Distribute(params);
  assert(result.distributed().agent() == 800);
  assert(result.distributed().broker() == 200);

  // no broker DID: the broker share is computed but nobody is credited
  assert(f.Balance("did:agent") == 800);
  // validator share is zero: no account, no log row
  assert(!f.ledger->GetAccount("did:validator").has_value());
}

void TestInvalidSplitIsRejected() {
  Fixture f;

  DistributionParams params;
  params.intent_id       = "intent-3";
  params.total_amount    = 100;
  params.agent_did       = "did:agent";
  params.incentive_split = Split(0.5, 0.5, 0.5, 0.0);

  bool threw = false;
  try {
    f.distributor.Distribute(params);
  } catch (const ainp::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(!f.ledger->GetAccount("did:agent").has_value());

  params.incentive_split = Split(1.1, -0.1, 0.0, 0.0);
  threw                  = false;
  try {
    f.distributor.Distribute(params);
  } catch (const ainp::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDistributionIsAllOrNothing() {
  auto    repo = std::make_shared<ainp::testing::FaultInjectingRepository>();
  Fixture f(repo);

  DistributionParams params;
  params.intent_id       = "intent-4";
  params.total_amount    = 1000;
  params.agent_did       = "did:agent";
  params.broker_did      = "did:broker";
  params.incentive_split = ainp::incentive::DefaultSplit();

  repo->FailNext("AppendCreditTransaction:earn");

  bool threw = false;
  try {
    f.distributor.Distribute(params);
  } catch (const ainp::util::StoreError&) {
    threw = true;
  }
  assert(threw);
  assert(!f.ledger->GetAccount("did:agent").has_value());
  assert(!f.ledger->GetAccount("did:broker").has_value());
}

void TestUsefulnessRewardsAreProportional() {
  Fixture f;

  f.usefulness->Update("did:a", 30);
  f.usefulness->Update("did:b", 10);
  f.usefulness->Update("did:c", 5);

  auto distribution = f.distributor.DistributeUsefulnessRewards(1000, 10);
  assert(distribution.recipients_size() == 2);
  assert(distribution.recipients(0).agent_did() == "did:a");
  assert(distribution.recipients(0).amount() == 750);
  assert(distribution.recipients(1).agent_did() == "did:b");
  assert(distribution.recipients(1).amount() == 250);
  assert(distribution.total_distributed() == 1000);

  assert(f.Balance("did:a") == 750);
  assert(f.Balance("did:b") == 250);
  assert(!f.ledger->GetAccount("did:c").has_value());

  auto history = f.ledger->GetTransactionHistory("did:a");
  assert(history.size() == 1);
  assert(history[0].intent_id() == ainp::incentive::kUsefulnessRewardIntent);
}

void TestUsefulnessRewardsRoundDown() {
  Fixture f;

  f.ledger->CreateAccount("did:a", 5);
  f.usefulness->Update("did:a", 50);
  f.usefulness->Update("did:b", 50);
  f.usefulness->Update("did:c", 50);

  auto distribution = f.distributor.DistributeUsefulnessRewards(100, 10);
  assert(distribution.recipients_size() == 3);
  for (const auto& reward : distribution.recipients()) {
    assert(reward.amount() == 33);
  }
  // the rounding shortfall stays undistributed
  assert(distribution.total_distributed() == 99);
  assert(f.Balance("did:a") == 38);
}

// 29/100 of 100 is exactly 29; dividing first would lose a credit
void TestUsefulnessRewardsExactShares() {
  Fixture f;

  f.usefulness->Update("did:a", 29);
  f.usefulness->Update("did:b", 71);

  auto distribution = f.distributor.DistributeUsefulnessRewards(100, 10);
  assert(distribution.recipients_size() == 2);
  assert(distribution.recipients(0).amount() == 29);
  assert(distribution.recipients(1).amount() == 71);
  assert(distribution.total_distributed() == 100);
  assert(f.Balance("did:a") == 29);
  assert(f.Balance("did:b") == 71);
}

void TestNoQualifyingAgents() {
  Fixture f;

  f.usefulness->Update("did:a", 5);
  auto distribution = f.distributor.DistributeUsefulnessRewards(1000, 10);
  assert(distribution.recipients_size() == 0);
  assert(distribution.total_distributed() == 0);

  Fixture empty;
  assert(empty.distributor.DistributeUsefulnessRewards(1000).recipients_size() == 0);
}

void TestUsefulnessScoresAreClamped() {
  Fixture f;

  assert(f.usefulness->Update("did:a", 150) == 100.0);
  assert(f.usefulness->Update("did:b", -4) == 0.0);
  assert(*f.usefulness->Get("did:a") == 100.0);
  assert(!f.usefulness->Get("did:none").has_value());

  auto qualifying = f.usefulness->Qualifying(0);
  assert(qualifying.size() == 2);
  assert(qualifying[0].agent_did == "did:a");
}

} // namespace

int main() {
  TestAllocationAlwaysSumsToTotal();
  TestDistributeCreditsParticipants();
  TestOptionalRecipientsAreSkipped();
  TestInvalidSplitIsRejected();
  TestDistributionIsAllOrNothing();
  TestUsefulnessRewardsAreProportional();
  TestUsefulnessRewardsRoundDown();
  TestUsefulnessRewardsExactShares();
  TestNoQualifyingAgents();
  TestUsefulnessScoresAreClamped();

  std::cout << "ainp_unit_incentive_distributor: pass\n";
  return 0;
}
