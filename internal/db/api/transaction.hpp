#pragma once

namespace workledger::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible to other transactions until Commit()
  - Rows returned by the Lock* repository calls stay locked against
    other writers until Commit()/Rollback()
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE + per-connection writer mutex
  Postgres: pqxx::work, row locks via FOR UPDATE [SKIP LOCKED]
  Memory: repository writer lock held for the transaction lifetime
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace workledger::db
