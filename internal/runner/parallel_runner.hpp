#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <vector>

#include "document_queue.hpp"
#include "document_task.hpp"
#include "run_report.hpp"

namespace relgen::runner {

/*
  Fans documents out across a fixed pool of worker threads.

  - every document is processed by exactly one worker
  - duplicate document ids in the input are processed once
  - parallelism == 1 runs sequentially on the calling thread
  - each document commits in its own transaction; a failing document
    is reported and does not stop the others
  - Cancel() stops handing out documents; committed ones stay
*/
class ParallelRunner {
 public:
  explicit ParallelRunner(std::shared_ptr<db::Repository> repository);

  RunReport Run(const std::vector<db::model::DocumentRecord>& documents, const std::vector<std::shared_ptr<const DocumentTask>>& tasks,
                std::size_t parallelism);

  // Safe to call from any thread. Applies to the run in progress, or
  // to the next Run() when none is; that run then processes nothing.
  void Cancel();

 private:
  std::shared_ptr<db::Repository> repository_;

  std::atomic<bool>              cancelled_{false};
  std::mutex                     mutex_;
  std::shared_ptr<DocumentQueue> active_queue_;
};

} // namespace relgen::runner
