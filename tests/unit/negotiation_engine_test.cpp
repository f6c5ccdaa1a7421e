#include "internal/negotiation/negotiation_engine.hpp"

#include <algorithm>
#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/credit/credit_ledger.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using ainp::config::EngineOptions;
using ainp::credit::CreditLedger;
using ainp::negotiation::InitiateParams;
using ainp::negotiation::NegotiationEngine;
using ainp::testing::FakeClock;
using ainp::testing::FaultInjectingRepository;
using namespace ainp::broker::v1;

constexpr const char* kInitiator = "did:initiator";
constexpr const char* kResponder = "did:responder";

struct Fixture {
  explicit Fixture(EngineOptions options = {}, std::shared_ptr<ainp::db::Repository> repo = std::make_shared<ainp::db::memory::MemoryRepository>())
      : repository(std::move(repo)),
        ledger(std::make_shared<CreditLedger>(repository, clock.Fn())),
        engine(repository, ledger, options, clock.Fn()) {
  }

  NegotiationSession Start(double price, std::optional<uint32_t> max_rounds = std::nullopt, std::optional<uint32_t> ttl = std::nullopt) {
    InitiateParams params;
    params.intent_id     = "intent-" + std::to_string(++counter);
    params.initiator_did = kInitiator;
    params.responder_did = kResponder;
    params.initial_proposal.set_price(price);
    params.max_rounds  = max_rounds;
    params.ttl_minutes = ttl;
    return engine.Initiate(params);
  }

  FakeClock                             clock;
  std::shared_ptr<ainp::db::Repository> repository;
  std::shared_ptr<CreditLedger>         ledger;
  NegotiationEngine                     engine;
  int                                   counter = 0;
};

ProposalTerms Price(double price) {
  ProposalTerms terms;
  terms.set_price(price);
  return terms;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestInitiateSeedsFirstRound() {
  Fixture f;
  auto    session = f.Start(100);

  assert(!session.id().empty());
  assert(session.state() == NEGOTIATION_STATE_INITIATED);
  assert(session.rounds_size() == 1);
  assert(session.rounds(0).round_number() == 1);
  assert(session.rounds(0).proposer_did() == kInitiator);
  assert(session.convergence_score() == 0.0);
  assert(session.max_rounds() == 10);
  assert(session.incentive_split().agent() == 0.70);
  assert(ainp::util::FromProto(session.expires_at()) == f.clock.Now() + std::chrono::minutes(60));

  auto stored = f.engine.GetSession(session.id());
  assert(stored.has_value());
  assert(stored->intent_id() == session.intent_id());
  assert(stored->current_proposal().price() == 100);
}

void TestInitiateValidation() {
  Fixture f;

  InitiateParams params;
  params.intent_id     = "intent-x";
  params.initiator_did = kInitiator;
  params.responder_did = kInitiator;
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));

  params.responder_did = kResponder;
  params.max_rounds    = 0;
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));
  params.max_rounds = 21;
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));
  params.max_rounds = 20;

  params.ttl_minutes = 0;
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));
  params.ttl_minutes.reset();

  params.initial_proposal.set_price(-1);
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));
  params.initial_proposal.set_price(10);

  params.initial_proposal.set_quality_sla(1.5);
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));
  params.initial_proposal.clear_quality_sla();

  auto* split = params.initial_proposal.mutable_incentive_split();
  split->set_agent(0.9);
  split->set_broker(0.9);
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Initiate(params); }));
  params.initial_proposal.clear_incentive_split();

  assert(f.engine.GetSessionsByAgent(kInitiator).empty());
  assert(f.engine.Initiate(params).max_rounds() == 20);

  EngineOptions disabled;
  disabled.negotiation_enabled = false;
  Fixture off(disabled);
  assert(Throws<ainp::util::ValidationError>([&] { off.Start(10); }));
}

// initiate(100) -> propose(90) -> accept reserves exactly 90 * scale
void TestAcceptReservesNegotiatedPrice() {
  Fixture f;
  f.ledger->CreateAccount(kInitiator, 1'000'000);

  auto session  = f.Start(100);
  auto proposed = f.engine.Propose(session.id(), kResponder, Price(90));
  assert(proposed.state() == NEGOTIATION_STATE_PROPOSED);
  assert(proposed.rounds_size() == 2);
  assert(std::abs(proposed.convergence_score() - 0.9) < 1e-9);
  assert(std::abs(proposed.rounds(1).convergence_delta() - 0.9) < 1e-9);

  auto accepted = f.engine.Accept(session.id(), kInitiator);
  assert(accepted.state() == NEGOTIATION_STATE_ACCEPTED);
  assert(accepted.final_proposal().price() == 90);
  assert(accepted.current_proposal().custom_terms().fields().at("reserved_credits").string_value() == "90000");
  assert(accepted.final_proposal().custom_terms().fields().count("reserved_credits") == 0);

  auto account = f.ledger->GetAccount(kInitiator);
  assert(account->reserved() == 90'000);
  assert(account->balance() == 1'000'000);

  auto history = f.ledger->GetTransactionHistory(kInitiator);
  assert(history.size() == 1);
  assert(history[0].tx_type() == TX_TYPE_RESERVE);
  assert(history[0].intent_id() == session.intent_id());
}

void TestCounterProposalsAlternate() {
  Fixture f;
  auto    session = f.Start(100);

  auto first = f.engine.Propose(session.id(), kResponder, Price(80));
  assert(first.state() == NEGOTIATION_STATE_PROPOSED);

  auto second = f.engine.Propose(session.id(), kInitiator, Price(90));
  assert(second.state() == NEGOTIATION_STATE_COUNTER_PROPOSED);

  auto third = f.engine.Propose(session.id(), kResponder, Price(90));
  assert(third.state() == NEGOTIATION_STATE_COUNTER_PROPOSED);
  assert(third.rounds_size() == 4);
  assert(third.rounds(3).round_number() == 4);
  assert(third.convergence_score() == 1.0);

  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Propose(session.id(), "did:stranger", Price(1)); }));
}

// a third proposal on a two-round session fails and changes nothing
void TestMaxRoundsIsEnforced() {
  Fixture f;
  auto    session = f.Start(100, 2);

  f.engine.Propose(session.id(), kResponder, Price(95));

  bool threw = false;
  try {
    f.engine.Propose(session.id(), kInitiator, Price(97));
  } catch (const ainp::util::MaxRoundsExceeded&) {
    threw = true;
  }
  assert(threw);

  auto stored = f.engine.GetSession(session.id());
  assert(stored->state() == NEGOTIATION_STATE_PROPOSED);
  assert(stored->rounds_size() == 2);
  assert(stored->current_proposal().price() == 95);
}

// accept without a current proposal fails before the ledger is consulted
void TestAcceptWithoutCurrentProposal() {
  Fixture f;

  ainp::db::model::NegotiationRecord record;
  record.id                   = "neg-without-proposal";
  record.intent_id            = "intent-c";
  record.initiator_did        = kInitiator;
  record.responder_did        = kResponder;
  record.state                = ainp::db::model::kStateProposed;
  record.incentive_split_json = R"({"agent":0.7,"broker":0.1,"validator":0.1,"pool":0.1})";
  record.max_rounds           = 10;
  record.created_at_ms        = ainp::util::ToUnixMillis(f.clock.Now());
  record.updated_at_ms        = record.created_at_ms;
  record.expires_at_ms        = record.created_at_ms + 3'600'000;
  {
    auto tx = f.repository->Begin();
    assert(f.repository->InsertNegotiation(*tx, record));
    tx->Commit();
  }

  // the initiator has no account: reaching the ledger would raise NotFound
  bool threw = false;
  try {
    f.engine.Accept(record.id, kResponder);
  } catch (const ainp::util::NotFound&) {
    assert(false && "ledger must not be consulted");
  } catch (const ainp::util::ValidationError& e) {
    threw = std::string(e.what()).find("no current proposal") != std::string::npos;
  }
  assert(threw);
  assert(f.engine.GetSession(record.id)->state() == NEGOTIATION_STATE_PROPOSED);
}

void TestAcceptStateAndParticipantChecks() {
  Fixture f;
  f.ledger->CreateAccount(kInitiator, 1'000'000);

  auto session = f.Start(10);
  assert(Throws<ainp::util::InvalidStateTransition>([&] { f.engine.Accept(session.id(), kResponder); }));

  f.engine.Propose(session.id(), kResponder, Price(10));
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Accept(session.id(), "did:stranger"); }));
  assert(Throws<ainp::util::NegotiationNotFound>([&] { f.engine.Accept("missing", kResponder); }));

  f.engine.Accept(session.id(), kResponder);
  assert(Throws<ainp::util::InvalidStateTransition>([&] { f.engine.Accept(session.id(), kResponder); }));
  assert(Throws<ainp::util::InvalidStateTransition>([&] { f.engine.Propose(session.id(), kResponder, Price(1)); }));
}

void TestAcceptWithInsufficientCreditsChangesNothing() {
  Fixture f;
  f.ledger->CreateAccount(kInitiator, 50'000);

  auto session = f.Start(100);
  f.engine.Propose(session.id(), kResponder, Price(90));

  assert(Throws<ainp::util::InsufficientCredits>([&] { f.engine.Accept(session.id(), kInitiator); }));

  auto stored = f.engine.GetSession(session.id());
  assert(stored->state() == NEGOTIATION_STATE_PROPOSED);
  assert(!stored->has_final_proposal());
  assert(f.ledger->GetAccount(kInitiator)->reserved() == 0);
}

// a store failure after the reservation rolls the reservation back too
void TestAcceptRollsBackReservationOnStoreFailure() {
  auto    repo = std::make_shared<FaultInjectingRepository>();
  Fixture f({}, repo);
  f.ledger->CreateAccount(kInitiator, 1'000'000);

  auto session = f.Start(100);
  f.engine.Propose(session.id(), kResponder, Price(90));

  repo->FailNext("UpdateNegotiation");
  assert(Throws<ainp::util::StoreError>([&] { f.engine.Accept(session.id(), kInitiator); }));

  auto account = f.ledger->GetAccount(kInitiator);
  assert(account->reserved() == 0);
  assert(account->balance() == 1'000'000);
  assert(f.ledger->GetTransactionHistory(kInitiator).empty());
  assert(f.engine.GetSession(session.id())->state() == NEGOTIATION_STATE_PROPOSED);

  // the same accept succeeds once the store recovers
  auto accepted = f.engine.Accept(session.id(), kInitiator);
  assert(accepted.state() == NEGOTIATION_STATE_ACCEPTED);
  assert(f.ledger->GetAccount(kInitiator)->reserved() == 90'000);
}

void TestAcceptWithoutReservation() {
  EngineOptions options;
  options.settlement_enabled = false;
  Fixture f(options);

  auto session = f.Start(100);
  f.engine.Propose(session.id(), kResponder, Price(90));

  // no account needed: nothing is reserved
  auto accepted = f.engine.Accept(session.id(), kInitiator);
  assert(accepted.state() == NEGOTIATION_STATE_ACCEPTED);
  assert(accepted.current_proposal().custom_terms().fields().count("reserved_credits") == 0);

  Fixture free_work;
  auto    zero = free_work.Start(0);
  free_work.engine.Propose(zero.id(), kResponder, Price(0.0001));
  assert(free_work.engine.Accept(zero.id(), kResponder).state() == NEGOTIATION_STATE_ACCEPTED);
}

void TestRejectRecordsReason() {
  Fixture f;
  auto    session = f.Start(100);

  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Reject(session.id(), "did:stranger"); }));

  auto rejected = f.engine.Reject(session.id(), kResponder, std::string("too expensive"));
  assert(rejected.state() == NEGOTIATION_STATE_REJECTED);
  assert(rejected.rounds_size() == 2);

  const auto& marker = rejected.rounds(1).proposal().custom_terms().fields();
  assert(marker.at("rejected").bool_value());
  assert(marker.at("reason").string_value() == "too expensive");
  assert(rejected.rounds(1).proposer_did() == kResponder);

  assert(Throws<ainp::util::InvalidStateTransition>([&] { f.engine.Reject(session.id(), kInitiator); }));
  assert(Throws<ainp::util::NegotiationNotFound>([&] { f.engine.Reject("missing", kInitiator); }));
}

// outsiders learn nothing about a closed session's state
void TestRejectByStrangerOnClosedSession() {
  Fixture f;
  f.ledger->CreateAccount(kInitiator, 1'000'000);

  auto session = f.Start(100);
  f.engine.Propose(session.id(), kResponder, Price(90));
  f.engine.Accept(session.id(), kInitiator);
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Reject(session.id(), "did:stranger"); }));
  assert(Throws<ainp::util::InvalidStateTransition>([&] { f.engine.Reject(session.id(), kResponder); }));

  auto closed = f.Start(100);
  f.engine.Reject(closed.id(), kResponder);
  assert(Throws<ainp::util::ValidationError>([&] { f.engine.Reject(closed.id(), "did:stranger"); }));
  assert(f.engine.GetSession(session.id())->state() == NEGOTIATION_STATE_ACCEPTED);
}

void TestRejectNeverExceedsMaxRounds() {
  Fixture f;
  auto    session = f.Start(100, 1);

  auto rejected = f.engine.Reject(session.id(), kInitiator);
  assert(rejected.state() == NEGOTIATION_STATE_REJECTED);
  assert(rejected.rounds_size() == 1);
  assert(rejected.current_proposal().custom_terms().fields().at("rejected").bool_value());
}

void TestExpiry() {
  Fixture f;
  f.ledger->CreateAccount(kInitiator, 1'000'000);

  auto stale    = f.Start(100, std::nullopt, 1);
  auto accepted = f.Start(100, std::nullopt, 1);
  auto fresh    = f.Start(100, std::nullopt, 60);
  f.engine.Propose(accepted.id(), kResponder, Price(100));
  f.engine.Accept(accepted.id(), kInitiator);

  f.clock.Advance(std::chrono::minutes(1));

  assert(Throws<ainp::util::ExpiredNegotiation>([&] { f.engine.Propose(stale.id(), kResponder, Price(1)); }));

  assert(f.engine.ExpireStaleNegotiations() == 1);
  assert(f.engine.GetSession(stale.id())->state() == NEGOTIATION_STATE_EXPIRED);
  assert(f.engine.GetSession(accepted.id())->state() == NEGOTIATION_STATE_ACCEPTED);
  assert(f.engine.GetSession(fresh.id())->state() == NEGOTIATION_STATE_INITIATED);

  assert(f.engine.ExpireStaleNegotiations() == 0);
  assert(Throws<ainp::util::InvalidStateTransition>([&] { f.engine.Reject(stale.id(), kInitiator); }));
}

void TestSessionsByAgent() {
  Fixture f;

  auto older = f.Start(10);
  f.clock.Advance(std::chrono::seconds(1));
  auto newer = f.Start(20);
  f.engine.Reject(newer.id(), kResponder);

  auto all = f.engine.GetSessionsByAgent(kResponder);
  assert(all.size() == 2);
  assert(all[0].id() == newer.id());
  assert(all[1].id() == older.id());

  auto rejected = f.engine.GetSessionsByAgent(kInitiator, NEGOTIATION_STATE_REJECTED);
  assert(rejected.size() == 1);
  assert(rejected[0].id() == newer.id());

  assert(f.engine.GetSessionsByAgent("did:nobody").empty());
  assert(!f.engine.GetSession("missing").has_value());
}

// concurrent proposals on one session never lose a round
void TestConcurrentProposals() {
  Fixture f;
  auto    session = f.Start(100, 20);

  constexpr int            kPerThread = 9;
  std::vector<std::thread> workers;
  for (const char* did : {kInitiator, kResponder}) {
    workers.emplace_back([&, did]() {
      for (int i = 0; i < kPerThread; ++i) {
        f.engine.Propose(session.id(), did, Price(100 - i));
      }
    });
  }
  for (auto& worker : workers) worker.join();

  auto stored = f.engine.GetSession(session.id());
  assert(stored->rounds_size() == 1 + 2 * kPerThread);
  for (int i = 0; i < stored->rounds_size(); ++i) {
    assert(stored->rounds(i).round_number() == static_cast<uint32_t>(i + 1));
  }
}

} // namespace

int main() {
  TestInitiateSeedsFirstRound();
  TestInitiateValidation();
  TestAcceptReservesNegotiatedPrice();
  TestCounterProposalsAlternate();
  TestMaxRoundsIsEnforced();
  TestAcceptWithoutCurrentProposal();
  TestAcceptStateAndParticipantChecks();
  TestAcceptWithInsufficientCreditsChangesNothing();
  TestAcceptRollsBackReservationOnStoreFailure();
  TestAcceptWithoutReservation();
  TestRejectRecordsReason();
  TestRejectByStrangerOnClosedSession();
  TestRejectNeverExceedsMaxRounds();
  TestExpiry();
  TestSessionsByAgent();
  TestConcurrentProposals();

  std::cout << "ainp_unit_negotiation_engine: pass\n";
  return 0;
}
