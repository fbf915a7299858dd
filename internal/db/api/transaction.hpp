#pragma once

#include <stdexcept>

namespace relgen::db {

/*
  Abstract transaction, one per document in the runner.

  Every backend holds its own connection (or snapshot) for the
  lifetime of the transaction. Writes are invisible to other
  transactions until Commit(); a transaction destroyed while still
  open rolls back.

  Commit() and Rollback() own the open/committed/rolled-back
  bookkeeping; backends only implement DoCommit()/DoRollback().

  - Commit() on a finished transaction throws.
  - Rollback() on a finished transaction is a no-op.
  - A DoCommit() that throws leaves the transaction open, so the
    destructor still rolls it back.

  SQLite: BEGIN IMMEDIATE on a pooled connection
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot + write log replayed on commit
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  void Commit() {
    if (state_ != State::Open) {
      throw std::runtime_error(state_ == State::Committed ? "transaction already committed" : "commit after rollback");
    }
    DoCommit();
    state_ = State::Committed;
  }

  void Rollback() {
    if (state_ != State::Open) return;
    state_ = State::RolledBack;
    DoRollback();
  }

  bool IsCommitted() const { return state_ == State::Committed; }
  bool IsOpen() const { return state_ == State::Open; }

protected:
  virtual void DoCommit()   = 0;
  virtual void DoRollback() = 0;

private:
  enum class State { Open, Committed, RolledBack };

  State state_ = State::Open;
};

}
