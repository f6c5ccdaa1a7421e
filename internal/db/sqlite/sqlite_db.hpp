#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>
#include <vector>

namespace ainp::db::sqlite {

/*
  Owns the broker's single sqlite3 connection.

  Every SqliteTransaction holds TxMutex() for its whole lifetime, so the
  connection never sees two transactions interleave. Errors surface as
  std::runtime_error; the transaction layer rewraps them as StoreError.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  void Exec(const std::string& sql);

  // Runs the statements in one write transaction.
  void ApplySchema(const std::vector<std::string>& statements);

 private:
  void Configure(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace ainp::db::sqlite
