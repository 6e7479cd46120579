#pragma once

namespace usbforge::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws util::TransactionConflict when a concurrent
    writer invalidated this transaction's reads

  SQLite: BEGIN IMMEDIATE (+ in-process mutex)
  Postgres: pqxx::work, row locks via FOR UPDATE
  Memory: snapshot copy + version check on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true once Commit() or Rollback() has run
  virtual bool IsCommitted() const = 0;
};

}
