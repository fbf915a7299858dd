#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "matchers.hpp"
#include "ngrams.hpp"

namespace relgen::extract {

/*
  Mention generation for one document and one mention type.

  Same shape as CandidateGenerator with a single role: spans come
  from the mention space sentence by sentence, the matcher takes the
  throttler's place, and there is no self/nested/symmetric step.
  In incremental mode spans already stored under the type are skipped.
*/
class MentionGenerator {
 public:
  MentionGenerator(db::Repository& repository, db::Transaction& tx, std::string type, const MentionSpace& space, const Matcher& matcher,
                   bool clear, int64_t document_id);

  std::optional<db::model::MentionRecord> Next();

  void Reset();

 private:
  bool LoadNextSentence();

  db::Repository&     repository_;
  db::Transaction&    tx_;
  std::string         type_;
  const MentionSpace& space_;
  const Matcher&      matcher_;
  bool                clear_;
  int64_t             document_id_;

  std::vector<db::model::SentenceRecord> sentences_;
  std::size_t                            next_sentence_ = 0;
  std::vector<TemporarySpan>             pending_;
  std::size_t                            next_span_ = 0;
};

} // namespace relgen::extract
