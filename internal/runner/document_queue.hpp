#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "internal/db/model/document_record.hpp"

namespace relgen::runner {

/*
  Thread-safe blocking queue of documents for extraction workers.

  Each queued document is handed to exactly one worker.
*/
class DocumentQueue {
 public:
  void Enqueue(const db::model::DocumentRecord& document);

  // blocking wait; nullopt once shut down and drained
  std::optional<db::model::DocumentRecord> Dequeue();

  // Wakes every waiter. Remaining documents are still handed out.
  void Shutdown();

  // Drops every queued document and shuts down.
  void Cancel();

 private:
  std::mutex                            mutex_;
  std::condition_variable               cv_;
  std::queue<db::model::DocumentRecord> queue_;
  bool                                  shutdown_ = false;
};

} // namespace relgen::runner
