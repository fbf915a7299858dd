#include "candidate_extractor.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/extract/candidate_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relgen::core {

namespace {

class CandidateTask final : public runner::DocumentTask {
 public:
  CandidateTask(model::RelationSchema schema, extract::ThrottlerPtr throttler, model::FilterPolicy policy, int32_t split, bool clear)
      : schema_(std::move(schema)), throttler_(std::move(throttler)), policy_(policy), split_(split), clear_(clear) {
  }

  const std::string& Name() const override {
    return schema_.name;
  }

  uint64_t Process(db::Repository& repository, db::Transaction& tx, const db::model::DocumentRecord& document) const override {
    if (clear_) {
      db::CandidateFilter scope;
      scope.type        = schema_.name;
      scope.split       = split_;
      scope.document_id = document.id;
      util::ThrowIfDbError(repository.DeleteCandidates(tx, scope), "clear candidates " + schema_.name);
    }

    extract::CandidateGenerator generator(repository, tx, schema_, throttler_.get(), policy_, split_, clear_, document.id);

    uint64_t written = 0;
    while (auto candidate = generator.Next()) {
      auto result = repository.InsertCandidate(tx, *candidate);
      if (result.IsDuplicate()) continue;
      util::ThrowIfDbError(result, "insert candidate " + schema_.name);
      ++written;
    }
    return written;
  }

 private:
  model::RelationSchema schema_;
  extract::ThrottlerPtr throttler_;
  model::FilterPolicy   policy_;
  int32_t               split_;
  bool                  clear_;
};

void ValidateSchemas(const std::vector<model::RelationSchema>& schemas) {
  std::set<std::string> names;
  for (const auto& schema : schemas) {
    if (schema.name.empty()) throw util::ConfigurationError("relation schema without a name");
    if (!names.insert(schema.name).second) throw util::ConfigurationError("duplicate relation schema " + schema.name);
    if (schema.Arity() == 0) throw util::ConfigurationError("relation " + schema.name + " has no arguments");
    if (schema.mention_types.size() != schema.Arity()) {
      throw util::ConfigurationError("relation " + schema.name + ": " + std::to_string(schema.Arity()) + " arguments but " +
                                     std::to_string(schema.mention_types.size()) + " mention sources");
    }
  }
}

bool ByArguments(const db::model::CandidateRecord& a, const db::model::CandidateRecord& b) {
  return a.mention_ids < b.mention_ids;
}

} // namespace

CandidateExtractor::CandidateExtractor(std::shared_ptr<db::Repository> repository, std::vector<model::RelationSchema> schemas,
                                       std::optional<std::vector<extract::ThrottlerPtr>> throttlers, model::FilterPolicy policy)
    : repository_(std::move(repository)), schemas_(std::move(schemas)), policy_(policy), runner_(repository_) {
  ValidateSchemas(schemas_);

  if (throttlers) {
    if (throttlers->size() != schemas_.size()) {
      throw util::ConfigurationError(std::to_string(schemas_.size()) + " relation schemas but " + std::to_string(throttlers->size()) +
                                     " throttlers");
    }
    throttlers_ = std::move(*throttlers);
  } else {
    throttlers_.assign(schemas_.size(), nullptr);
  }
}

runner::RunReport CandidateExtractor::Apply(const std::vector<db::model::DocumentRecord>& documents, int32_t split, bool clear,
                                            std::size_t parallelism) {
  std::vector<std::shared_ptr<const runner::DocumentTask>> tasks;
  tasks.reserve(schemas_.size());
  for (std::size_t i = 0; i < schemas_.size(); ++i) {
    tasks.push_back(std::make_shared<CandidateTask>(schemas_[i], throttlers_[i], policy_, split, clear));
  }

  RELGEN_LOG_INFO("candidate extraction", {observability::IntField("split", split), observability::BoolField("clear", clear),
                                           observability::BoolField("self_relations", policy_.self_relations),
                                           observability::BoolField("nested_relations", policy_.nested_relations),
                                           observability::BoolField("symmetric_relations", policy_.symmetric_relations)});

  return runner_.Run(documents, tasks, parallelism);
}

void CandidateExtractor::Clear(int32_t split) {
  auto tx = repository_->Begin();
  for (const auto& schema : schemas_) {
    db::CandidateFilter scope;
    scope.type  = schema.name;
    scope.split = split;
    util::ThrowIfDbError(repository_->DeleteCandidates(*tx, scope), "clear candidates " + schema.name);
  }
  tx->Commit();
  RELGEN_LOG_INFO("candidates cleared", {observability::IntField("split", split), observability::IntField("schemas", static_cast<int64_t>(schemas_.size()))});
}

void CandidateExtractor::ClearAll(int32_t split) {
  auto                tx = repository_->Begin();
  db::CandidateFilter scope;
  scope.split = split;
  util::ThrowIfDbError(repository_->DeleteCandidates(*tx, scope), "clear all candidates");
  tx->Commit();
  RELGEN_LOG_INFO("all candidates cleared", {observability::IntField("split", split)});
}

std::vector<std::vector<db::model::CandidateRecord>> CandidateExtractor::GetCandidates(
    const std::optional<std::vector<db::model::DocumentRecord>>& documents, int32_t split, bool sort) {
  auto tx = repository_->Begin();

  std::vector<std::vector<db::model::CandidateRecord>> out;
  out.reserve(schemas_.size());
  for (const auto& schema : schemas_) {
    db::CandidateFilter filter;
    filter.type  = schema.name;
    filter.split = split;

    std::vector<db::model::CandidateRecord> candidates;
    if (documents) {
      for (const auto& document : *documents) {
        filter.document_id = document.id;
        auto part          = repository_->ListCandidates(*tx, filter);
        candidates.insert(candidates.end(), part.begin(), part.end());
      }
    } else {
      candidates = repository_->ListCandidates(*tx, filter);
    }

    if (sort) std::sort(candidates.begin(), candidates.end(), ByArguments);
    out.push_back(std::move(candidates));
  }

  tx->Rollback();
  return out;
}

void CandidateExtractor::Cancel() {
  runner_.Cancel();
}

} // namespace relgen::core
