#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/time.hpp"

namespace ainp::testing {

// Manually advanced clock shared by every service under test.
class FakeClock {
 public:
  explicit FakeClock(util::TimePoint start = util::FromUnixMillis(1'700'000'000'000)) : now_(std::make_shared<util::TimePoint>(start)) {
  }

  util::ClockFn Fn() const {
    auto now = now_;
    return [now]() { return *now; };
  }

  void Advance(std::chrono::milliseconds delta) {
    *now_ += delta;
  }

  util::TimePoint Now() const {
    return *now_;
  }

 private:
  std::shared_ptr<util::TimePoint> now_;
};

/*
  Memory repository that can be told to fail selected operations.

  Operation names are the Repository method names; AppendCreditTransaction
  is also addressable per tx type ("AppendCreditTransaction:earn").
  Failures surface as db::Result errors, the same way a backend reports them.
*/
class FaultInjectingRepository final : public db::Repository {
 public:
  FaultInjectingRepository() : inner_(std::make_shared<db::memory::MemoryRepository>()) {
  }

  void FailNext(const std::string& op, int times = 1) {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_[op] += times;
  }

  void ClearFailures() {
    std::lock_guard<std::mutex> lock(mutex_);
    failures_.clear();
  }

  std::unique_ptr<db::Transaction> Begin() override {
    return inner_->Begin();
  }

  db::Result InsertAccount(db::Transaction& t, const db::model::AccountRecord& r) override {
    if (ShouldFail("InsertAccount")) return Injected("InsertAccount");
    return inner_->InsertAccount(t, r);
  }
  std::optional<db::model::AccountRecord> GetAccount(db::Transaction& t, const std::string& did) override {
    return inner_->GetAccount(t, did);
  }
  std::optional<db::model::AccountRecord> LockAccount(db::Transaction& t, const std::string& did) override {
    return inner_->LockAccount(t, did);
  }
  db::Result UpdateAccount(db::Transaction& t, const db::model::AccountRecord& r) override {
    if (ShouldFail("UpdateAccount")) return Injected("UpdateAccount");
    return inner_->UpdateAccount(t, r);
  }

  db::Result AppendCreditTransaction(db::Transaction& t, db::model::CreditTransactionRecord& r) override {
    if (ShouldFail("AppendCreditTransaction") || ShouldFail("AppendCreditTransaction:" + r.tx_type)) {
      return Injected("AppendCreditTransaction");
    }
    return inner_->AppendCreditTransaction(t, r);
  }
  std::vector<db::model::CreditTransactionRecord> ListCreditTransactions(db::Transaction& t, const std::string& did,
                                                                         const db::Pagination& page) override {
    return inner_->ListCreditTransactions(t, did, page);
  }

  db::Result InsertNegotiation(db::Transaction& t, const db::model::NegotiationRecord& r) override {
    if (ShouldFail("InsertNegotiation")) return Injected("InsertNegotiation");
    return inner_->InsertNegotiation(t, r);
  }
  std::optional<db::model::NegotiationRecord> GetNegotiation(db::Transaction& t, const std::string& id) override {
    return inner_->GetNegotiation(t, id);
  }
  std::optional<db::model::NegotiationRecord> LockNegotiation(db::Transaction& t, const std::string& id) override {
    return inner_->LockNegotiation(t, id);
  }
  db::Result UpdateNegotiation(db::Transaction& t, const db::model::NegotiationRecord& r) override {
    if (ShouldFail("UpdateNegotiation")) return Injected("UpdateNegotiation");
    return inner_->UpdateNegotiation(t, r);
  }
  std::vector<db::model::NegotiationRecord> ListNegotiationsByAgent(db::Transaction& t, const std::string& did,
                                                                    const std::optional<std::string>& state) override {
    return inner_->ListNegotiationsByAgent(t, did, state);
  }
  db::Result ExpireNegotiations(db::Transaction& t, uint64_t now_ms, std::vector<std::string>* ids) override {
    if (ShouldFail("ExpireNegotiations")) return Injected("ExpireNegotiations");
    return inner_->ExpireNegotiations(t, now_ms, ids);
  }

  db::Result InsertSettlement(db::Transaction& t, const db::model::SettlementRecord& r) override {
    if (ShouldFail("InsertSettlement")) return Injected("InsertSettlement");
    return inner_->InsertSettlement(t, r);
  }
  std::optional<db::model::SettlementRecord> GetSettlement(db::Transaction& t, const std::string& id) override {
    return inner_->GetSettlement(t, id);
  }
  std::optional<db::model::SettlementRecord> LockSettlement(db::Transaction& t, const std::string& id) override {
    return inner_->LockSettlement(t, id);
  }
  db::Result UpdateSettlement(db::Transaction& t, const db::model::SettlementRecord& r) override {
    if (ShouldFail("UpdateSettlement")) return Injected("UpdateSettlement");
    return inner_->UpdateSettlement(t, r);
  }
  std::vector<db::model::SettlementRecord> ListSettlementsByStatus(db::Transaction& t, const std::string& status,
                                                                   std::size_t limit) override {
    return inner_->ListSettlementsByStatus(t, status, limit);
  }

  db::Result UpsertUsefulnessScore(db::Transaction& t, const db::model::UsefulnessScoreRecord& r) override {
    if (ShouldFail("UpsertUsefulnessScore")) return Injected("UpsertUsefulnessScore");
    return inner_->UpsertUsefulnessScore(t, r);
  }
  std::optional<db::model::UsefulnessScoreRecord> GetUsefulnessScore(db::Transaction& t, const std::string& did) override {
    return inner_->GetUsefulnessScore(t, did);
  }
  std::vector<db::model::UsefulnessScoreRecord> ListUsefulnessScores(db::Transaction& t, double min_score) override {
    return inner_->ListUsefulnessScores(t, min_score);
  }

 private:
  bool ShouldFail(const std::string& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = failures_.find(op);
    if (it == failures_.end() || it->second <= 0) return false;
    --it->second;
    return true;
  }

  static db::Result Injected(const std::string& op) {
    return db::Result::Err(db::ErrorCode::IOError, "injected failure in " + op);
  }

  std::shared_ptr<db::memory::MemoryRepository> inner_;
  std::mutex                                    mutex_;
  std::map<std::string, int>                    failures_;
};

} // namespace ainp::testing
