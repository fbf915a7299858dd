#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "internal/db/model/sentence_record.hpp"
#include "temporary_span.hpp"

namespace relgen::extract {

/*
  Enumerates the candidate spans of one sentence.
  Implementations are stateless and safe to share between workers.
*/
class MentionSpace {
 public:
  virtual ~MentionSpace() = default;

  virtual std::vector<TemporarySpan> Apply(const db::model::SentenceRecord& sentence) const = 0;
};

/*
  Word n-grams, longest first.

  For n = n_max..1 and every start word, emits the span covering
  n consecutive words. A single word containing a split token is
  also emitted as the part before and the part after the leftmost
  token occurrence: "New/Text-Word" -> "New/Text-Word", "New",
  "Text-Word". Each distinct span is emitted once.
*/
class Ngrams final : public MentionSpace {
 public:
  explicit Ngrams(std::size_t n_max = 5, std::vector<std::string> split_tokens = {"-", "/"});

  std::vector<TemporarySpan> Apply(const db::model::SentenceRecord& sentence) const override;

 private:
  std::size_t              n_max_;
  std::vector<std::string> split_tokens_;
};

} // namespace relgen::extract
