#pragma once

namespace taskgate::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE under the connection lock
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy under the repository lock
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

}
