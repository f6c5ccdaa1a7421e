#include "sqlite_tx.hpp"

#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ainp::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  try {
    db_->Exec("BEGIN IMMEDIATE;");
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("sqlite begin failed: ") + e.what());
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception& e) {
      AINP_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    }
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const std::exception& e) {
    throw util::StoreError(std::string("sqlite commit failed: ") + e.what());
  }
  committed_ = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
  lock_.unlock();
}

} // namespace ainp::db::sqlite
