#include "internal/credit/credit_ledger.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "internal/db/api/throw_if_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/uuid.hpp"

namespace ainp::credit {

using namespace ainp::broker::v1;
using ainp::db::ThrowIfDbError;
using ainp::observability::StringField;
using ainp::observability::UIntField;

namespace {

uint64_t CheckedAdd(uint64_t lhs, uint64_t rhs, const std::string& what) {
  if (lhs > std::numeric_limits<uint64_t>::max() - rhs) {
    throw util::ValidationError(what + " would overflow");
  }
  return lhs + rhs;
}

std::string MetadataJson(const std::string& key, const std::string& value) {
  google::protobuf::Struct metadata;
  (*metadata.mutable_fields())[key].set_string_value(value);
  return util::ToJson(metadata);
}

} // namespace

std::string TxTypeName(TxType type) {
  switch (type) {
    case TX_TYPE_DEPOSIT:
      return "deposit";
    case TX_TYPE_EARN:
      return "earn";
    case TX_TYPE_RESERVE:
      return "reserve";
    case TX_TYPE_RELEASE:
      return "release";
    case TX_TYPE_SPEND:
      return "spend";
    case TX_TYPE_POU_COMPUTE:
      return "pou_compute";
    case TX_TYPE_POU_MEMORY:
      return "pou_memory";
    case TX_TYPE_POU_ROUTING:
      return "pou_routing";
    case TX_TYPE_POU_VALIDATION:
      return "pou_validation";
    case TX_TYPE_POU_POOL_DISTRIBUTION:
      return "pou_pool_distribution";
    default:
      throw std::invalid_argument("unknown tx type: " + std::to_string(static_cast<int>(type)));
  }
}

TxType ParseTxType(const std::string& name) {
  for (int value = TxType_MIN; value <= TxType_MAX; ++value) {
    const auto type = static_cast<TxType>(value);
    if (type != TX_TYPE_UNSPECIFIED && TxType_IsValid(value) && TxTypeName(type) == name) {
      return type;
    }
  }
  throw std::invalid_argument("unknown tx type: " + name);
}

CreditAccount ToProto(const db::model::AccountRecord& record) {
  CreditAccount account;
  account.set_agent_did(record.agent_did);
  account.set_balance(record.balance);
  account.set_reserved(record.reserved);
  account.set_earned(record.earned);
  account.set_spent(record.spent);
  *account.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  *account.mutable_updated_at() = util::MillisToProto(record.updated_at_ms);
  return account;
}

CreditTransaction ToProto(const db::model::CreditTransactionRecord& record) {
  CreditTransaction tx;
  tx.set_id(record.id);
  tx.set_agent_did(record.agent_did);
  tx.set_tx_type(ParseTxType(record.tx_type));
  tx.set_amount(record.amount);
  tx.set_intent_id(record.intent_id);
  tx.set_usefulness_proof_id(record.usefulness_proof_id);
  if (!record.metadata_json.empty()) {
    util::FromJson(record.metadata_json, tx.mutable_metadata());
  }
  *tx.mutable_created_at() = util::MillisToProto(record.created_at_ms);
  tx.set_sequence(record.sequence);
  return tx;
}

CreditLedger::CreditLedger(std::shared_ptr<db::Repository> repository, util::ClockFn clock)
    : repository_(std::move(repository)), clock_(std::move(clock)) {
}

uint64_t CreditLedger::NowMs() const {
  return util::ToUnixMillis(clock_());
}

db::model::AccountRecord CreditLedger::LockExisting(db::Transaction& tx, const std::string& agent_did) {
  auto record = repository_->LockAccount(tx, agent_did);
  if (!record) {
    throw util::NotFound("account not found: " + agent_did);
  }
  return *record;
}

CreditAccount CreditLedger::Store(db::Transaction& tx, db::model::AccountRecord& record, uint64_t now_ms) {
  record.updated_at_ms = now_ms;
  ThrowIfDbError(repository_->UpdateAccount(tx, record), "update account " + record.agent_did);
  return ToProto(record);
}

void CreditLedger::Append(db::Transaction& tx, const std::string& agent_did, TxType type, uint64_t amount,
                          const std::string& intent_id, const std::string& usefulness_proof_id,
                          const std::string& metadata_json, uint64_t now_ms) {
  db::model::CreditTransactionRecord row;
  row.id                  = util::NewId();
  row.agent_did           = agent_did;
  row.tx_type             = TxTypeName(type);
  row.amount              = amount;
  row.intent_id           = intent_id;
  row.usefulness_proof_id = usefulness_proof_id;
  row.metadata_json       = metadata_json.empty() ? "{}" : metadata_json;
  row.created_at_ms       = now_ms;
  ThrowIfDbError(repository_->AppendCreditTransaction(tx, row), "append " + row.tx_type + " for " + agent_did);
}

// ------------------------------------------------------------------
// Accounts
// ------------------------------------------------------------------

std::optional<CreditAccount> CreditLedger::GetAccount(const std::string& agent_did) {
  auto tx      = repository_->Begin();
  auto account = GetAccount(*tx, agent_did);
  tx->Commit();
  return account;
}

std::optional<CreditAccount> CreditLedger::GetAccount(db::Transaction& tx, const std::string& agent_did) {
  auto record = repository_->GetAccount(tx, agent_did);
  if (!record) return std::nullopt;
  return ToProto(*record);
}

CreditAccount CreditLedger::CreateAccount(const std::string& agent_did, uint64_t initial_balance) {
  auto tx      = repository_->Begin();
  auto account = CreateAccount(*tx, agent_did, initial_balance);
  tx->Commit();
  return account;
}

CreditAccount CreditLedger::CreateAccount(db::Transaction& tx, const std::string& agent_did, uint64_t initial_balance) {
  if (agent_did.empty()) {
    throw util::ValidationError("agent_did must not be empty");
  }

  if (auto existing = repository_->LockAccount(tx, agent_did)) {
    return ToProto(*existing);
  }

  const auto now = NowMs();

  db::model::AccountRecord record;
  record.agent_did     = agent_did;
  record.balance       = initial_balance;
  record.created_at_ms = now;
  record.updated_at_ms = now;
  ThrowIfDbError(repository_->InsertAccount(tx, record), "create account " + agent_did);

  AINP_LOG_INFO("credit account created", {StringField("agent_did", agent_did), UIntField("balance", initial_balance)});
  return ToProto(record);
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

CreditAccount CreditLedger::Reserve(const std::string& agent_did, uint64_t amount, const std::string& intent_id) {
  auto tx      = repository_->Begin();
  auto account = Reserve(*tx, agent_did, amount, intent_id);
  tx->Commit();
  return account;
}

CreditAccount CreditLedger::Reserve(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                    const std::string& intent_id) {
  auto       record    = LockExisting(tx, agent_did);
  const auto available = record.balance - record.reserved;
  if (available < amount) {
    throw util::InsufficientCredits(agent_did, amount, available);
  }

  const auto now  = NowMs();
  record.reserved = CheckedAdd(record.reserved, amount, "reserved");
  auto account    = Store(tx, record, now);
  Append(tx, agent_did, TX_TYPE_RESERVE, amount, intent_id, {}, {}, now);

  AINP_LOG_INFO("credits reserved",
                {StringField("agent_did", agent_did), UIntField("amount", amount), StringField("intent_id", intent_id)});
  return account;
}

CreditAccount CreditLedger::Release(const std::string& agent_did, uint64_t reserved_amount, uint64_t spent_amount,
                                    const std::string& intent_id) {
  auto tx      = repository_->Begin();
  auto account = Release(*tx, agent_did, reserved_amount, spent_amount, intent_id);
  tx->Commit();
  return account;
}

CreditAccount CreditLedger::Release(db::Transaction& tx, const std::string& agent_did, uint64_t reserved_amount,
                                    uint64_t spent_amount, const std::string& intent_id) {
  if (spent_amount > reserved_amount) {
    throw util::ValidationError("cannot spend more than reserved: spent=" + std::to_string(spent_amount) +
                                ", reserved=" + std::to_string(reserved_amount));
  }

  auto record = LockExisting(tx, agent_did);
  if (reserved_amount > record.reserved) {
    throw util::ValidationError("release of " + std::to_string(reserved_amount) + " exceeds reservation of " +
                                std::to_string(record.reserved) + " for " + agent_did);
  }

  // balance >= reserved >= reserved_amount >= spent_amount
  const auto now  = NowMs();
  record.reserved -= reserved_amount;
  record.balance -= spent_amount;
  record.spent = CheckedAdd(record.spent, spent_amount, "spent");
  auto account = Store(tx, record, now);

  Append(tx, agent_did, TX_TYPE_RELEASE, reserved_amount, intent_id, {}, MetadataJson("spent", std::to_string(spent_amount)),
         now);
  if (spent_amount > 0) {
    Append(tx, agent_did, TX_TYPE_SPEND, spent_amount, intent_id, {}, {}, now);
  }

  AINP_LOG_INFO("credits released", {StringField("agent_did", agent_did), UIntField("reserved", reserved_amount),
                                     UIntField("spent", spent_amount), StringField("intent_id", intent_id)});
  return account;
}

// ------------------------------------------------------------------
// Credits and debits
// ------------------------------------------------------------------

CreditAccount CreditLedger::Deposit(const std::string& agent_did, uint64_t amount, const google::protobuf::Struct& metadata) {
  auto tx      = repository_->Begin();
  auto account = Deposit(*tx, agent_did, amount, metadata);
  tx->Commit();
  return account;
}

CreditAccount CreditLedger::Deposit(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                    const google::protobuf::Struct& metadata) {
  auto record = LockExisting(tx, agent_did);

  const auto now = NowMs();
  record.balance = CheckedAdd(record.balance, amount, "balance");
  auto account   = Store(tx, record, now);
  Append(tx, agent_did, TX_TYPE_DEPOSIT, amount, {}, {}, util::ToJson(metadata), now);

  AINP_LOG_INFO("credits deposited", {StringField("agent_did", agent_did), UIntField("amount", amount)});
  return account;
}

CreditAccount CreditLedger::Earn(const std::string& agent_did, uint64_t amount, const std::string& intent_id,
                                 const std::optional<std::string>& usefulness_proof_id) {
  auto tx      = repository_->Begin();
  auto account = Earn(*tx, agent_did, amount, intent_id, usefulness_proof_id);
  tx->Commit();
  return account;
}

CreditAccount CreditLedger::Earn(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                 const std::string& intent_id, const std::optional<std::string>& usefulness_proof_id) {
  auto record = LockExisting(tx, agent_did);

  const auto now = NowMs();
  record.balance = CheckedAdd(record.balance, amount, "balance");
  record.earned  = CheckedAdd(record.earned, amount, "earned");
  auto account   = Store(tx, record, now);
  Append(tx, agent_did, TX_TYPE_EARN, amount, intent_id, usefulness_proof_id.value_or(""), {}, now);

  AINP_LOG_DEBUG("credits earned",
                 {StringField("agent_did", agent_did), UIntField("amount", amount), StringField("intent_id", intent_id)});
  return account;
}

CreditAccount CreditLedger::Spend(const std::string& agent_did, uint64_t amount, const std::string& intent_id,
                                  const std::optional<std::string>& reason) {
  auto tx      = repository_->Begin();
  auto account = Spend(*tx, agent_did, amount, intent_id, reason);
  tx->Commit();
  return account;
}

CreditAccount CreditLedger::Spend(db::Transaction& tx, const std::string& agent_did, uint64_t amount,
                                  const std::string& intent_id, const std::optional<std::string>& reason) {
  auto record = LockExisting(tx, agent_did);

  // reserved credits stay untouched until their settlement releases them,
  // so the check is against the unreserved balance
  const auto available = record.balance - record.reserved;
  if (available < amount) {
    throw util::InsufficientCredits(agent_did, amount, available);
  }

  const auto now = NowMs();
  record.balance -= amount;
  record.spent = CheckedAdd(record.spent, amount, "spent");
  auto account = Store(tx, record, now);
  Append(tx, agent_did, TX_TYPE_SPEND, amount, intent_id, {}, reason ? MetadataJson("reason", *reason) : std::string{}, now);

  AINP_LOG_INFO("credits spent",
                {StringField("agent_did", agent_did), UIntField("amount", amount), StringField("intent_id", intent_id)});
  return account;
}

// ------------------------------------------------------------------
// History
// ------------------------------------------------------------------

std::vector<CreditTransaction> CreditLedger::GetTransactionHistory(const std::string& agent_did, std::size_t limit,
                                                                   std::size_t offset) {
  auto tx   = repository_->Begin();
  // SQL backends bind LIMIT/OFFSET as signed 64-bit
  constexpr std::size_t kMaxPage = static_cast<std::size_t>(std::numeric_limits<int64_t>::max());
  auto rows = repository_->ListCreditTransactions(*tx, agent_did,
                                                  db::Pagination{std::min(limit, kMaxPage), std::min(offset, kMaxPage)});
  tx->Commit();

  std::vector<CreditTransaction> history;
  history.reserve(rows.size());
  for (const auto& row : rows) {
    history.push_back(ToProto(row));
  }
  return history;
}

} // namespace ainp::credit
