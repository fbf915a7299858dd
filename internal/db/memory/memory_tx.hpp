#pragma once

#include <functional>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace relgen::db::memory {

/*
  Transaction = private snapshot + write log.

  Reads and writes go to the snapshot taken at Begin(). Commit()
  replays the log onto the state committed since then, so two
  workers inserting the same mention or candidate both commit and
  the second insert is dropped as a duplicate.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  using Op = std::function<Result(MemoryRepository::State&)>;

  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  // Apply op to the snapshot and keep it for replay on commit.
  Result Write(Op op);

  const MemoryRepository::State& View() const {
    return working_;
  }

 protected:
  void DoCommit() override;
  void DoRollback() override;

 private:
  MemoryRepository&       repo_;
  MemoryRepository::State working_;
  std::vector<Op>         log_;
};

} // namespace relgen::db::memory
