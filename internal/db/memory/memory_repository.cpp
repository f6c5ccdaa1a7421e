#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace ainp::db::memory {

namespace {

std::string AccountKey(const std::string& did) {
  return "account#" + did;
}

std::string NegotiationKey(const std::string& id) {
  return "negotiation#" + id;
}

std::string SettlementKey(const std::string& id) {
  return "settlement#" + id;
}

std::string UsefulnessKey(const std::string& did) {
  return "usefulness#" + did;
}

template <typename Map>
std::optional<typename Map::mapped_type> Lookup(const Map& writes, const Map& committed, std::mutex& mutex,
                                                const std::string& key) {
  if (auto it = writes.find(key); it != writes.end()) return it->second;

  std::scoped_lock lock(mutex);
  auto             it = committed.find(key);
  if (it == committed.end()) return std::nullopt;
  return it->second;
}

// Committed rows overlaid with this transaction's pending writes.
template <typename Map>
Map Merged(const Map& writes, const Map& committed, std::mutex& mutex) {
  Map merged;
  {
    std::scoped_lock lock(mutex);
    merged = committed;
  }
  for (const auto& [key, row] : writes) merged[key] = row;
  return merged;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

std::shared_ptr<std::mutex> MemoryRepository::RowMutex(const std::string& key) {
  std::scoped_lock lock(mutex_);
  auto&            slot = row_mutexes_[key];
  if (!slot) slot = std::make_shared<std::mutex>();
  return slot;
}

void MemoryRepository::ReleaseRowMutex(const std::string& key, std::shared_ptr<std::mutex> mutex) {
  std::scoped_lock lock(mutex_);
  mutex.reset();
  auto it = row_mutexes_.find(key);
  if (it != row_mutexes_.end() && it->second.use_count() == 1) {
    row_mutexes_.erase(it);
  }
}

std::size_t MemoryRepository::RowLockCount() {
  std::scoped_lock lock(mutex_);
  return row_mutexes_.size();
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

Result MemoryRepository::InsertAccount(Transaction& t, const model::AccountRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(AccountKey(r.agent_did));
  if (Lookup(tx.Writes().accounts, committed_.accounts, mutex_, r.agent_did)) {
    return Result::Err(ErrorCode::AlreadyExists, "account exists: " + r.agent_did);
  }
  tx.Writes().accounts[r.agent_did] = r;
  return Result::Ok();
}

std::optional<model::AccountRecord> MemoryRepository::GetAccount(Transaction& t, const std::string& did) {
  return Lookup(TX(t).Writes().accounts, committed_.accounts, mutex_, did);
}

std::optional<model::AccountRecord> MemoryRepository::LockAccount(Transaction& t, const std::string& did) {
  TX(t).LockRow(AccountKey(did));
  return GetAccount(t, did);
}

Result MemoryRepository::UpdateAccount(Transaction& t, const model::AccountRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(AccountKey(r.agent_did));
  if (!Lookup(tx.Writes().accounts, committed_.accounts, mutex_, r.agent_did)) {
    return Result::Err(ErrorCode::NotFound, "account not found: " + r.agent_did);
  }
  tx.Writes().accounts[r.agent_did] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Ledger
// ------------------------------------------------------------------

Result MemoryRepository::AppendCreditTransaction(Transaction& t, model::CreditTransactionRecord& r) {
  r.sequence = ++next_sequence_;
  TX(t).Writes().ledger.push_back(r);
  return Result::Ok();
}

std::vector<model::CreditTransactionRecord> MemoryRepository::ListCreditTransactions(Transaction& t, const std::string& did,
                                                                                   const Pagination& page) {
  std::vector<model::CreditTransactionRecord> rows;
  {
    std::scoped_lock lock(mutex_);
    for (const auto& row : committed_.ledger) {
      if (row.agent_did == did) rows.push_back(row);
    }
  }
  for (const auto& row : TX(t).Writes().ledger) {
    if (row.agent_did == did) rows.push_back(row);
  }

  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) { return a.sequence > b.sequence; });

  if (page.offset >= rows.size()) return {};
  const std::size_t available = rows.size() - page.offset;
  const std::size_t count     = std::min(available, page.limit);
  auto              first     = rows.begin() + static_cast<std::ptrdiff_t>(page.offset);
  return {first, first + static_cast<std::ptrdiff_t>(count)};
}

// ------------------------------------------------------------------
// Negotiations
// ------------------------------------------------------------------

Result MemoryRepository::InsertNegotiation(Transaction& t, const model::NegotiationRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(NegotiationKey(r.id));
  if (Lookup(tx.Writes().negotiations, committed_.negotiations, mutex_, r.id)) {
    return Result::Err(ErrorCode::AlreadyExists, "negotiation exists: " + r.id);
  }
  tx.Writes().negotiations[r.id] = r;
  return Result::Ok();
}

std::optional<model::NegotiationRecord> MemoryRepository::GetNegotiation(Transaction& t, const std::string& id) {
  return Lookup(TX(t).Writes().negotiations, committed_.negotiations, mutex_, id);
}

std::optional<model::NegotiationRecord> MemoryRepository::LockNegotiation(Transaction& t, const std::string& id) {
  TX(t).LockRow(NegotiationKey(id));
  return GetNegotiation(t, id);
}

Result MemoryRepository::UpdateNegotiation(Transaction& t, const model::NegotiationRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(NegotiationKey(r.id));
  if (!Lookup(tx.Writes().negotiations, committed_.negotiations, mutex_, r.id)) {
    return Result::Err(ErrorCode::NotFound, "negotiation not found: " + r.id);
  }
  tx.Writes().negotiations[r.id] = r;
  return Result::Ok();
}

std::vector<model::NegotiationRecord> MemoryRepository::ListNegotiationsByAgent(Transaction& t, const std::string& did,
                                                                                const std::optional<std::string>& state) {
  auto merged = Merged(TX(t).Writes().negotiations, committed_.negotiations, mutex_);

  std::vector<model::NegotiationRecord> rows;
  for (auto& [_, row] : merged) {
    if (row.initiator_did != did && row.responder_did != did) continue;
    if (state && row.state != *state) continue;
    rows.push_back(std::move(row));
  }

  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms > b.created_at_ms;
    return a.id > b.id;
  });
  return rows;
}

Result MemoryRepository::ExpireNegotiations(Transaction& t, uint64_t now_ms, std::vector<std::string>* expired_ids) {
  auto& tx = TX(t);

  std::set<std::string> candidates;
  for (const auto& [id, row] : Merged(tx.Writes().negotiations, committed_.negotiations, mutex_)) {
    if (!model::IsTerminalState(row.state) && row.expires_at_ms <= now_ms) candidates.insert(id);
  }

  // std::set iterates in id order, which fixes the lock order
  for (const auto& id : candidates) {
    auto row = LockNegotiation(t, id);
    if (!row || model::IsTerminalState(row->state) || row->expires_at_ms > now_ms) continue;

    row->state         = model::kStateExpired;
    row->updated_at_ms = now_ms;
    tx.Writes().negotiations[id] = *row;
    if (expired_ids) expired_ids->push_back(id);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Settlements
// ------------------------------------------------------------------

Result MemoryRepository::InsertSettlement(Transaction& t, const model::SettlementRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(SettlementKey(r.negotiation_id));
  if (Lookup(tx.Writes().settlements, committed_.settlements, mutex_, r.negotiation_id)) {
    return Result::Err(ErrorCode::AlreadyExists, "settlement exists: " + r.negotiation_id);
  }
  tx.Writes().settlements[r.negotiation_id] = r;
  return Result::Ok();
}

std::optional<model::SettlementRecord> MemoryRepository::GetSettlement(Transaction& t, const std::string& id) {
  return Lookup(TX(t).Writes().settlements, committed_.settlements, mutex_, id);
}

std::optional<model::SettlementRecord> MemoryRepository::LockSettlement(Transaction& t, const std::string& id) {
  TX(t).LockRow(SettlementKey(id));
  return GetSettlement(t, id);
}

Result MemoryRepository::UpdateSettlement(Transaction& t, const model::SettlementRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(SettlementKey(r.negotiation_id));
  if (!Lookup(tx.Writes().settlements, committed_.settlements, mutex_, r.negotiation_id)) {
    return Result::Err(ErrorCode::NotFound, "settlement not found: " + r.negotiation_id);
  }
  tx.Writes().settlements[r.negotiation_id] = r;
  return Result::Ok();
}

std::vector<model::SettlementRecord> MemoryRepository::ListSettlementsByStatus(Transaction& t, const std::string& status,
                                                                               std::size_t limit) {
  auto merged = Merged(TX(t).Writes().settlements, committed_.settlements, mutex_);

  std::vector<model::SettlementRecord> rows;
  for (auto& [_, row] : merged) {
    if (row.status == status) rows.push_back(std::move(row));
  }

  std::sort(rows.begin(), rows.end(), [](const auto& a, const auto& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.negotiation_id < b.negotiation_id;
  });
  if (rows.size() > limit) rows.resize(limit);
  return rows;
}

// ------------------------------------------------------------------
// Usefulness
// ------------------------------------------------------------------

Result MemoryRepository::UpsertUsefulnessScore(Transaction& t, const model::UsefulnessScoreRecord& r) {
  auto& tx = TX(t);
  tx.LockRow(UsefulnessKey(r.agent_did));
  tx.Writes().usefulness[r.agent_did] = r;
  return Result::Ok();
}

std::optional<model::UsefulnessScoreRecord> MemoryRepository::GetUsefulnessScore(Transaction& t, const std::string& did) {
  return Lookup(TX(t).Writes().usefulness, committed_.usefulness, mutex_, did);
}

std::vector<model::UsefulnessScoreRecord> MemoryRepository::ListUsefulnessScores(Transaction& t, double min_score) {
  std::vector<model::UsefulnessScoreRecord> rows;
  for (auto& [_, row] : Merged(TX(t).Writes().usefulness, committed_.usefulness, mutex_)) {
    if (row.usefulness_score >= min_score) rows.push_back(std::move(row));
  }
  return rows;
}

} // namespace ainp::db::memory
