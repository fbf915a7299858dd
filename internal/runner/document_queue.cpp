#include "document_queue.hpp"

namespace relgen::runner {

void DocumentQueue::Enqueue(const db::model::DocumentRecord& document) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(document);
  }
  cv_.notify_one();
}

std::optional<db::model::DocumentRecord> DocumentQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  auto document = std::move(queue_.front());
  queue_.pop();
  return document;
}

void DocumentQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

void DocumentQueue::Cancel() {
  {
    std::lock_guard lock(mutex_);
    std::queue<db::model::DocumentRecord>().swap(queue_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace relgen::runner
