#include "memory_tx.hpp"

#include <stdexcept>

namespace relgen::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  working_ = repo_.committed_;
}

MemoryTransaction::~MemoryTransaction() {
  Rollback();
}

Result MemoryTransaction::Write(Op op) {
  if (!IsOpen()) {
    return Result::Err(ErrorCode::Conflict, "transaction already finished");
  }
  auto result = op(working_);
  if (result) {
    log_.push_back(std::move(op));
  }
  return result;
}

void MemoryTransaction::DoCommit() {
  std::scoped_lock lock(repo_.mutex_);

  // replay onto a copy so a failing op leaves committed state untouched
  MemoryRepository::State next = repo_.committed_;
  for (auto& op : log_) {
    auto result = op(next);
    // a concurrent commit already inserted the same key
    if (!result && !result.IsDuplicate()) {
      throw std::runtime_error("transaction conflict: " + result.message);
    }
  }
  repo_.committed_ = std::move(next);
  log_.clear();
}

void MemoryTransaction::DoRollback() {
  log_.clear();
}

} // namespace relgen::db::memory
