#include "extraction_worker.hpp"

#include <utility>

namespace relgen::runner {

ExtractionWorker::ExtractionWorker(std::shared_ptr<DocumentQueue> queue, std::shared_ptr<DocumentProcessor> processor)
    : queue_(std::move(queue)), processor_(std::move(processor)) {
}

ExtractionWorker::~ExtractionWorker() {
  queue_->Cancel();
  Join();
}

void ExtractionWorker::Start() {
  thread_ = std::thread(&ExtractionWorker::Run, this);
}

void ExtractionWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void ExtractionWorker::Run() {
  for (;;) {
    auto document = queue_->Dequeue();
    if (!document) break;

    processor_->Process(*document);
  }
}

} // namespace relgen::runner
