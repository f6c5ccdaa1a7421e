#include "internal/credit/credit_ledger.hpp"

#include <atomic>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "tests/unit/test_support.hpp"

namespace {

using ainp::credit::CreditLedger;
using ainp::db::memory::MemoryRepository;
using ainp::testing::FaultInjectingRepository;
using namespace ainp::broker::v1;

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void AssertInvariant(const CreditAccount& account) {
  assert(account.balance() >= account.reserved());
}

void TestCreateAccountIsIdempotent() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  auto first = ledger.CreateAccount("did:a", 500);
  assert(first.balance() == 500);

  auto second = ledger.CreateAccount("did:a", 9999);
  assert(second.balance() == 500);

  // account creation is not a ledger movement
  assert(ledger.GetTransactionHistory("did:a").empty());
  assert(!ledger.GetAccount("did:missing").has_value());

  assert(Throws<ainp::util::ValidationError>([&] { ledger.CreateAccount(""); }));
}

void TestReserveRejectsWhenAvailableIsShort() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:payer", 50);
  ledger.Reserve("did:payer", 40, "intent-1");

  assert(Throws<ainp::util::InsufficientCredits>([&] { ledger.Reserve("did:payer", 20, "intent-2"); }));

  auto account = ledger.GetAccount("did:payer");
  assert(account.has_value());
  assert(account->balance() == 50);
  assert(account->reserved() == 40);

  // only the successful reservation was logged
  auto history = ledger.GetTransactionHistory("did:payer");
  assert(history.size() == 1);
  assert(history[0].tx_type() == TX_TYPE_RESERVE);
  assert(history[0].amount() == 40);
}

void TestReserveThenReleaseSpendsExactly() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:payer", 1000);
  ledger.Reserve("did:payer", 300, "intent-1");

  auto account = ledger.Release("did:payer", 300, 300, "intent-1");
  assert(account.reserved() == 0);
  assert(account.balance() == 700);
  assert(account.spent() == 300);
  AssertInvariant(account);

  auto history = ledger.GetTransactionHistory("did:payer");
  assert(history.size() == 3);
  assert(history[0].tx_type() == TX_TYPE_SPEND);
  assert(history[1].tx_type() == TX_TYPE_RELEASE);
  assert(history[1].amount() == 300);
  assert(history[1].metadata().fields().at("spent").string_value() == "300");
  assert(history[2].tx_type() == TX_TYPE_RESERVE);
  assert(history[0].sequence() > history[1].sequence());
}

void TestReleaseWithoutSpendWritesNoSpendRow() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:payer", 100);
  ledger.Reserve("did:payer", 60, "intent-1");

  auto account = ledger.Release("did:payer", 60, 0, "intent-1");
  assert(account.balance() == 100);
  assert(account.reserved() == 0);
  assert(account.spent() == 0);

  auto history = ledger.GetTransactionHistory("did:payer");
  assert(history.size() == 2);
  assert(history[0].tx_type() == TX_TYPE_RELEASE);
}

void TestReleaseValidation() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:payer", 100);
  ledger.Reserve("did:payer", 50, "intent-1");

  assert(Throws<ainp::util::ValidationError>([&] { ledger.Release("did:payer", 10, 20, "intent-1"); }));
  assert(Throws<ainp::util::ValidationError>([&] { ledger.Release("did:payer", 60, 0, "intent-1"); }));

  auto account = ledger.GetAccount("did:payer");
  assert(account->reserved() == 50);
  assert(account->balance() == 100);
}

void TestDepositEarnSpend() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:a");

  google::protobuf::Struct metadata;
  (*metadata.mutable_fields())["source"].set_string_value("faucet");
  ledger.Deposit("did:a", 100, metadata);

  auto earned = ledger.Earn("did:a", 25, "intent-9", std::string("proof-1"));
  assert(earned.balance() == 125);
  assert(earned.earned() == 25);

  auto spent = ledger.Spend("did:a", 5, "intent-9", std::string("fee"));
  assert(spent.balance() == 120);
  assert(spent.spent() == 5);

  auto history = ledger.GetTransactionHistory("did:a");
  assert(history.size() == 3);
  assert(history[0].tx_type() == TX_TYPE_SPEND);
  assert(history[0].metadata().fields().at("reason").string_value() == "fee");
  assert(history[1].tx_type() == TX_TYPE_EARN);
  assert(history[1].usefulness_proof_id() == "proof-1");
  assert(history[2].tx_type() == TX_TYPE_DEPOSIT);
  assert(history[2].metadata().fields().at("source").string_value() == "faucet");

  auto page = ledger.GetTransactionHistory("did:a", 1, 1);
  assert(page.size() == 1);
  assert(page[0].tx_type() == TX_TYPE_EARN);
}

void TestSpendCannotTouchReservedFunds() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:a", 100);
  ledger.Reserve("did:a", 80, "intent-1");

  assert(Throws<ainp::util::InsufficientCredits>([&] { ledger.Spend("did:a", 30, "intent-2"); }));
  assert(Throws<ainp::util::InsufficientCredits>([&] { ledger.Spend("did:a", 101, "intent-2"); }));

  auto account = ledger.Spend("did:a", 20, "intent-2");
  assert(account.balance() == 80);
  AssertInvariant(account);
}

void TestMutationsOnMissingAccountFail() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  assert(Throws<ainp::util::NotFound>([&] { ledger.Reserve("did:none", 1, "i"); }));
  assert(Throws<ainp::util::NotFound>([&] { ledger.Earn("did:none", 1, "i"); }));
  assert(Throws<ainp::util::NotFound>([&] { ledger.Deposit("did:none", 1); }));
  assert(!ledger.GetAccount("did:none").has_value());
}

void TestStoreFailureLeavesNoPartialMutation() {
  auto         repo = std::make_shared<FaultInjectingRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:a", 100);

  repo->FailNext("AppendCreditTransaction:reserve");
  assert(Throws<ainp::util::StoreError>([&] { ledger.Reserve("did:a", 40, "intent-1"); }));

  auto account = ledger.GetAccount("did:a");
  assert(account->reserved() == 0);
  assert(account->balance() == 100);
  assert(ledger.GetTransactionHistory("did:a").empty());
}
void TestHistoryPagingBounds() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  ledger.CreateAccount("did:a");
  ledger.Deposit("did:a", 10);
  ledger.Deposit("did:a", 20);

  // an unbounded limit with an offset must not wrap around
  auto rest = ledger.GetTransactionHistory("did:a", SIZE_MAX, 1);
  assert(rest.size() == 1);
  assert(rest[0].amount() == 10);

  assert(ledger.GetTransactionHistory("did:a", SIZE_MAX, 0).size() == 2);
  assert(ledger.GetTransactionHistory("did:a", SIZE_MAX, 2).empty());
  assert(ledger.GetTransactionHistory("did:a", 5, SIZE_MAX).empty());
}

// row lock entries do not outlive the transactions that used them
void TestRowLocksAreReclaimed() {
  auto         repo = std::make_shared<MemoryRepository>();
  CreditLedger ledger(repo);

  for (int i = 0; i < 20; ++i) {
    const auto did = "did:agent-" + std::to_string(i);
    ledger.CreateAccount(did, 100);
    const auto intent = "intent-" + std::to_string(i);
    ledger.Reserve(did, 10, intent);
    ledger.Release(did, 10, 5, intent);
  }
  assert(repo->RowLockCount() == 0);

  {
    auto tx = repo->Begin();
    assert(repo->LockAccount(*tx, "did:agent-0").has_value());
    assert(repo->RowLockCount() == 1);
    tx->Rollback();
  }
  assert(repo->RowLockCount() == 0);
}

void TestConcurrentReservationsNeverOverCommit() {
  auto         repo   = std::make_shared<MemoryRepository>();
  auto         ledger = std::make_shared<CreditLedger>(repo);
  constexpr int kThreads = 8;
  constexpr int kPerThread = 10;

  // room for exactly 50 reservations of 10
  ledger->CreateAccount("did:payer", 500);

  std::atomic<int>         succeeded{0};
  std::atomic<int>         rejected{0};
  std::vector<std::thread> workers;
  for (int t = 0; t < kThreads; ++t) {
    workers.emplace_back([&, t]() {
      for (int i = 0; i < kPerThread; ++i) {
        try {
          ledger->Reserve("did:payer", 10, "intent-" + std::to_string(t) + "-" + std::to_string(i));
          ++succeeded;
        } catch (const ainp::util::InsufficientCredits&) {
          ++rejected;
        }
      }
    });
  }
  for (auto& worker : workers) worker.join();

  assert(succeeded.load() == 50);
  assert(rejected.load() == kThreads * kPerThread - 50);

  auto account = ledger->GetAccount("did:payer");
  assert(account->reserved() == 500);
  AssertInvariant(*account);
  assert(ledger->GetTransactionHistory("did:payer", 1000).size() == 50);
  assert(repo->RowLockCount() == 0);
}

} // namespace

int main() {
  TestCreateAccountIsIdempotent();
  TestReserveRejectsWhenAvailableIsShort();
  TestReserveThenReleaseSpendsExactly();
  TestReleaseWithoutSpendWritesNoSpendRow();
  TestReleaseValidation();
  TestDepositEarnSpend();
  TestSpendCannotTouchReservedFunds();
  TestMutationsOnMissingAccountFail();
  TestStoreFailureLeavesNoPartialMutation();
  TestHistoryPagingBounds();
  TestRowLocksAreReclaimed();
  TestConcurrentReservationsNeverOverCommit();

  std::cout << "ainp_unit_credit_ledger: pass\n";
  return 0;
}
