#include "mention_generator.hpp"

#include <utility>

#include "internal/observability/logging.hpp"

namespace relgen::extract {

MentionGenerator::MentionGenerator(db::Repository& repository, db::Transaction& tx, std::string type, const MentionSpace& space,
                                   const Matcher& matcher, bool clear, int64_t document_id)
    : repository_(repository),
      tx_(tx),
      type_(std::move(type)),
      space_(space),
      matcher_(matcher),
      clear_(clear),
      document_id_(document_id),
      sentences_(repository_.ListSentences(tx_, document_id_)) {
}

void MentionGenerator::Reset() {
  next_sentence_ = 0;
  next_span_     = 0;
  pending_.clear();
}

bool MentionGenerator::LoadNextSentence() {
  while (next_sentence_ < sentences_.size()) {
    const auto& sentence = sentences_[next_sentence_++];
    pending_             = matcher_.Apply(space_.Apply(sentence));
    next_span_           = 0;
    if (!pending_.empty()) return true;
  }
  return false;
}

std::optional<db::model::MentionRecord> MentionGenerator::Next() {
  for (;;) {
    if (next_span_ >= pending_.size() && !LoadNextSentence()) return std::nullopt;

    const auto span = pending_[next_span_++].ToSpan();

    if (!clear_ && repository_.FindMention(tx_, type_, span)) {
      RELGEN_LOG_DEBUG("mention exists", {observability::StringField("type", type_), observability::StringField("span", relgen::model::ToString(span))});
      continue;
    }

    db::model::MentionRecord record;
    record.type        = type_;
    record.document_id = document_id_;
    record.span        = span;
    return record;
  }
}

} // namespace relgen::extract
