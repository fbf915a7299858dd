#include "document_processor.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace relgen::runner {

DocumentProcessor::DocumentProcessor(std::shared_ptr<db::Repository> repository, std::vector<std::shared_ptr<const DocumentTask>> tasks)
    : repository_(std::move(repository)), tasks_(std::move(tasks)) {
}

void DocumentProcessor::Process(const db::model::DocumentRecord& document) {
  uint64_t    written = 0;
  std::string stage   = "begin";

  try {
    auto tx = repository_->Begin();
    for (const auto& task : tasks_) {
      stage = task->Name();
      written += task->Process(*repository_, *tx, document);
    }
    stage = "commit";
    tx->Commit();
  } catch (const std::exception& e) {
    RecordFailure(document, stage, e.what());
    return;
  } catch (...) {
    // tasks are user code and may throw anything
    RecordFailure(document, stage, "unknown error");
    return;
  }

  RELGEN_LOG_DEBUG("document committed", {observability::IntField("document_id", document.id),
                                          observability::IntField("records", static_cast<int64_t>(written))});

  std::lock_guard lock(mutex_);
  ++report_.documents_processed;
  report_.records_written += written;
}

void DocumentProcessor::RecordFailure(const db::model::DocumentRecord& document, const std::string& stage, const std::string& error) {
  RELGEN_LOG_ERROR("document failed",
                   {observability::IntField("document_id", document.id), observability::StringField("document", document.name),
                    observability::StringField("task", stage), observability::StringField("error", error)});

  std::lock_guard lock(mutex_);
  ++report_.documents_processed;
  ++report_.documents_failed;
  report_.failures.push_back(DocumentFailure{document.id, document.name, stage, error});
}

RunReport DocumentProcessor::TakeReport() {
  std::lock_guard lock(mutex_);
  return std::exchange(report_, RunReport{});
}

} // namespace relgen::runner
