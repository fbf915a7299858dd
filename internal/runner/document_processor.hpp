#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "document_task.hpp"
#include "run_report.hpp"

namespace relgen::runner {

/*
  Runs every task for one document inside a single transaction.

  Commit is per document: either all of the document's records become
  visible or none do. A failure is logged, recorded in the report and
  never propagated, so other documents keep going.
*/
class DocumentProcessor {
 public:
  DocumentProcessor(std::shared_ptr<db::Repository> repository, std::vector<std::shared_ptr<const DocumentTask>> tasks);

  // Thread-safe.
  void Process(const db::model::DocumentRecord& document);

  RunReport TakeReport();

 private:
  void RecordFailure(const db::model::DocumentRecord& document, const std::string& stage, const std::string& error);

  std::shared_ptr<db::Repository>                 repository_;
  std::vector<std::shared_ptr<const DocumentTask>> tasks_;

  std::mutex mutex_;
  RunReport  report_;
};

} // namespace relgen::runner
