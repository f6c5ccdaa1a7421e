#include "sqlite_db.hpp"

#include <stdexcept>

namespace ainp::db::sqlite {

namespace {

void Check(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  constexpr int kFlags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  const int     rc     = sqlite3_open_v2(path_.c_str(), &db_, kFlags, nullptr);
  if (rc != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open sqlite database " + path_ + ": " + reason);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string reason = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error("sqlite: " + reason + " [" + sql.substr(0, 64) + "]");
  }
}

void SqliteDB::ApplySchema(const std::vector<std::string>& statements) {
  std::lock_guard<std::mutex> lock(tx_mutex_);

  Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& statement : statements) {
      Exec(statement);
    }
    Exec("COMMIT;");
  } catch (...) {
    sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    throw;
  }
}

void SqliteDB::Configure(bool wal_mode) {
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  // a crash between release and distribution must not lose the ledger rows
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  // SQLITE_CONSTRAINT_PRIMARYKEY / _UNIQUE map to AlreadyExists
  Check(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");
  Check(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");
}

} // namespace ainp::db::sqlite
