#pragma once

namespace ainp::db {

/*
  Unit of work handed to every Repository call.

  The engine, ledger and coordinator pass one Transaction through several
  repository writes (session update + account mutation + ledger rows +
  settlement record) and commit once. Every backend guarantees:

  - writes are invisible to other transactions until Commit()
  - Rollback(), or destruction without Commit(), discards every write
  - row locks from Lock*() stay held until the transaction ends

  Backends: memory (write-set overlay, per-row mutexes), SQLite (BEGIN
  IMMEDIATE on a single connection), PostgreSQL (pqxx::work with
  SELECT ... FOR UPDATE).
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

} // namespace ainp::db
