#include "mention_extractor.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "internal/extract/mention_generator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relgen::core {

namespace {

class MentionTask final : public runner::DocumentTask {
 public:
  MentionTask(std::string type, std::shared_ptr<const extract::MentionSpace> space, extract::MatcherPtr matcher, bool clear)
      : type_(std::move(type)), space_(std::move(space)), matcher_(std::move(matcher)), clear_(clear) {
  }

  const std::string& Name() const override {
    return type_;
  }

  uint64_t Process(db::Repository& repository, db::Transaction& tx, const db::model::DocumentRecord& document) const override {
    if (clear_) {
      db::MentionFilter scope;
      scope.type        = type_;
      scope.document_id = document.id;
      util::ThrowIfDbError(repository.DeleteMentions(tx, scope), "clear mentions " + type_);
    }

    extract::MentionGenerator generator(repository, tx, type_, *space_, *matcher_, clear_, document.id);

    uint64_t written = 0;
    while (auto mention = generator.Next()) {
      auto result = repository.InsertMention(tx, *mention);
      if (result.IsDuplicate()) continue;
      util::ThrowIfDbError(result, "insert mention " + type_);
      ++written;
    }
    return written;
  }

 private:
  std::string                                 type_;
  std::shared_ptr<const extract::MentionSpace> space_;
  extract::MatcherPtr                         matcher_;
  bool                                        clear_;
};

} // namespace

MentionExtractor::MentionExtractor(std::shared_ptr<db::Repository> repository, std::vector<std::string> types,
                                   std::vector<std::shared_ptr<const extract::MentionSpace>> spaces, std::vector<extract::MatcherPtr> matchers)
    : repository_(std::move(repository)),
      types_(std::move(types)),
      spaces_(std::move(spaces)),
      matchers_(std::move(matchers)),
      runner_(repository_) {
  if (types_.size() != spaces_.size()) {
    throw util::ConfigurationError(std::to_string(types_.size()) + " mention types but " + std::to_string(spaces_.size()) + " mention spaces");
  }
  if (types_.size() != matchers_.size()) {
    throw util::ConfigurationError(std::to_string(types_.size()) + " mention types but " + std::to_string(matchers_.size()) + " matchers");
  }

  std::set<std::string> seen;
  for (std::size_t i = 0; i < types_.size(); ++i) {
    if (types_[i].empty()) throw util::ConfigurationError("mention type without a name");
    if (!seen.insert(types_[i]).second) throw util::ConfigurationError("duplicate mention type " + types_[i]);
    if (!spaces_[i]) throw util::ConfigurationError("mention type " + types_[i] + " has no mention space");
    if (!matchers_[i]) throw util::ConfigurationError("mention type " + types_[i] + " has no matcher");
  }
}

runner::RunReport MentionExtractor::Apply(const std::vector<db::model::DocumentRecord>& documents, bool clear, std::size_t parallelism) {
  std::vector<std::shared_ptr<const runner::DocumentTask>> tasks;
  tasks.reserve(types_.size());
  for (std::size_t i = 0; i < types_.size(); ++i) {
    tasks.push_back(std::make_shared<MentionTask>(types_[i], spaces_[i], matchers_[i], clear));
  }

  RELGEN_LOG_INFO("mention extraction", {observability::IntField("types", static_cast<int64_t>(types_.size())), observability::BoolField("clear", clear)});

  return runner_.Run(documents, tasks, parallelism);
}

void MentionExtractor::Clear() {
  auto tx = repository_->Begin();
  for (const auto& type : types_) {
    db::MentionFilter scope;
    scope.type = type;
    util::ThrowIfDbError(repository_->DeleteMentions(*tx, scope), "clear mentions " + type);
  }
  tx->Commit();
  RELGEN_LOG_INFO("mentions cleared", {observability::IntField("types", static_cast<int64_t>(types_.size()))});
}

void MentionExtractor::ClearAll() {
  auto tx = repository_->Begin();
  util::ThrowIfDbError(repository_->DeleteMentions(*tx, db::MentionFilter{}), "clear all mentions");
  tx->Commit();
  RELGEN_LOG_INFO("all mentions cleared");
}

std::vector<std::vector<db::model::MentionRecord>> MentionExtractor::GetMentions(
    const std::optional<std::vector<db::model::DocumentRecord>>& documents, bool sort) {
  auto tx = repository_->Begin();

  std::vector<std::vector<db::model::MentionRecord>> out;
  out.reserve(types_.size());
  for (const auto& type : types_) {
    db::MentionFilter filter;
    filter.type = type;

    std::vector<db::model::MentionRecord> mentions;
    if (documents) {
      for (const auto& document : *documents) {
        filter.document_id = document.id;
        auto part          = repository_->ListMentions(*tx, filter);
        mentions.insert(mentions.end(), part.begin(), part.end());
      }
    } else {
      mentions = repository_->ListMentions(*tx, filter);
    }

    if (sort) {
      std::sort(mentions.begin(), mentions.end(), [](const auto& a, const auto& b) { return a.span < b.span; });
    }
    out.push_back(std::move(mentions));
  }

  tx->Rollback();
  return out;
}

void MentionExtractor::Cancel() {
  runner_.Cancel();
}

} // namespace relgen::core
