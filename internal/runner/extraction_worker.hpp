#pragma once

#include <memory>
#include <thread>

#include "document_processor.hpp"
#include "document_queue.hpp"

namespace relgen::runner {

/*
  Worker thread draining a DocumentQueue.

  Each transaction the processor opens gets its own connection, so
  workers never share store state.
*/
class ExtractionWorker {
 public:
  ExtractionWorker(std::shared_ptr<DocumentQueue> queue, std::shared_ptr<DocumentProcessor> processor);
  ~ExtractionWorker();

  ExtractionWorker(const ExtractionWorker&)            = delete;
  ExtractionWorker& operator=(const ExtractionWorker&) = delete;

  void Start();

  // Waits for the queue to drain.
  void Join();

 private:
  void Run();

  std::shared_ptr<DocumentQueue>     queue_;
  std::shared_ptr<DocumentProcessor> processor_;

  std::thread thread_;
};

} // namespace relgen::runner
