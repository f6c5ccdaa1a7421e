#include "pg_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ainp::db::postgres {

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
  } catch (const pqxx::failure& e) {
    throw util::StoreError(std::string("postgres begin failed: ") + e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (!committed_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      AINP_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
    }
  }
  // the work must end before its connection goes back to the pool
  tx_.reset();
}

void PgTransaction::Commit() {
  try {
    tx_->commit();
  } catch (const pqxx::failure& e) {
    // a failed commit leaves nothing to roll back
    committed_ = true;
    throw util::StoreError(std::string("postgres commit failed: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  tx_->abort();
  committed_ = true;
}

} // namespace ainp::db::postgres
