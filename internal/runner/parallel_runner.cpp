#include "parallel_runner.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "extraction_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relgen::runner {

namespace {

std::vector<db::model::DocumentRecord> UniqueDocuments(const std::vector<db::model::DocumentRecord>& documents) {
  std::vector<db::model::DocumentRecord> unique;
  std::set<int64_t>                      seen;
  for (const auto& document : documents) {
    if (seen.insert(document.id).second) unique.push_back(document);
  }
  return unique;
}

} // namespace

ParallelRunner::ParallelRunner(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) throw util::ConfigurationError("parallel runner needs a repository");
}

RunReport ParallelRunner::Run(const std::vector<db::model::DocumentRecord>& documents,
                              const std::vector<std::shared_ptr<const DocumentTask>>& tasks, std::size_t parallelism) {
  if (parallelism == 0) throw util::ConfigurationError("parallelism must be at least 1");
  for (const auto& task : tasks) {
    if (!task) throw util::ConfigurationError("parallel runner got a null task");
  }

  const auto work      = UniqueDocuments(documents);
  auto       processor = std::make_shared<DocumentProcessor>(repository_, tasks);
  const auto workers   = std::min(parallelism, std::max<std::size_t>(work.size(), 1));

  RELGEN_LOG_INFO("run started", {observability::IntField("documents", static_cast<int64_t>(work.size())),
                                  observability::IntField("tasks", static_cast<int64_t>(tasks.size())),
                                  observability::IntField("workers", static_cast<int64_t>(workers))});

  if (workers == 1) {
    for (const auto& document : work) {
      if (cancelled_) break;
      processor->Process(document);
    }
  } else {
    auto queue = std::make_shared<DocumentQueue>();
    for (const auto& document : work) queue->Enqueue(document);
    queue->Shutdown();

    {
      std::lock_guard lock(mutex_);
      active_queue_ = queue;
    }
    if (cancelled_) queue->Cancel();

    std::vector<std::unique_ptr<ExtractionWorker>> pool;
    pool.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
      pool.push_back(std::make_unique<ExtractionWorker>(queue, processor));
      pool.back()->Start();
    }
    for (auto& worker : pool) worker->Join();

    std::lock_guard lock(mutex_);
    active_queue_.reset();
  }

  // a Cancel() that arrived before or during this run is consumed here
  auto report      = processor->TakeReport();
  report.cancelled = cancelled_.exchange(false);

  RELGEN_LOG_INFO("run finished", {observability::IntField("documents_processed", static_cast<int64_t>(report.documents_processed)),
                                   observability::IntField("documents_failed", static_cast<int64_t>(report.documents_failed)),
                                   observability::IntField("records_written", static_cast<int64_t>(report.records_written)),
                                   observability::BoolField("cancelled", report.cancelled)});
  return report;
}

void ParallelRunner::Cancel() {
  cancelled_ = true;
  std::lock_guard lock(mutex_);
  if (active_queue_) active_queue_->Cancel();
}

} // namespace relgen::runner
