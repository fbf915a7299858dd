#include "ngrams.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <utility>

#include "internal/util/errors.hpp"

namespace relgen::extract {

namespace {

void CheckSentence(const db::model::SentenceRecord& sentence) {
  if (sentence.words.size() != sentence.char_offsets.size()) {
    throw std::runtime_error("sentence " + std::to_string(sentence.id) + ": words and char_offsets differ in length");
  }
  const auto text_size = static_cast<int64_t>(sentence.text.size());
  for (std::size_t i = 0; i < sentence.words.size(); ++i) {
    const int64_t begin = sentence.char_offsets[i];
    const int64_t end   = begin + static_cast<int64_t>(sentence.words[i].size());
    if (begin < 0 || end > text_size) {
      throw std::runtime_error("sentence " + std::to_string(sentence.id) + ": word " + std::to_string(i) + " lies outside the text");
    }
  }
}

} // namespace

Ngrams::Ngrams(std::size_t n_max, std::vector<std::string> split_tokens) : n_max_(n_max), split_tokens_(std::move(split_tokens)) {
  if (n_max_ == 0) {
    throw util::ConfigurationError("ngrams: n_max must be at least 1");
  }
  for (const auto& token : split_tokens_) {
    if (token.empty()) throw util::ConfigurationError("ngrams: split tokens must not be empty");
  }
}

std::vector<TemporarySpan> Ngrams::Apply(const db::model::SentenceRecord& sentence) const {
  CheckSentence(sentence);

  std::vector<TemporarySpan>             out;
  std::set<std::pair<int64_t, int64_t>> seen;

  auto emit = [&](int64_t start, int64_t end) {
    if (end <= start) return;
    if (!seen.emplace(start, end).second) return;
    out.push_back(TemporarySpan{&sentence, start, end});
  };

  const std::size_t words = sentence.words.size();
  for (std::size_t n = std::min(n_max_, words); n >= 1; --n) {
    for (std::size_t i = 0; i + n <= words; ++i) {
      const std::size_t last  = i + n - 1;
      const int64_t     start = sentence.char_offsets[i];
      const int64_t     end   = sentence.char_offsets[last] + static_cast<int64_t>(sentence.words[last].size());
      emit(start, end);

      if (n != 1 || end - start <= 1 || split_tokens_.empty()) continue;

      const std::string& word      = sentence.words[i];
      std::size_t        split_at  = std::string::npos;
      std::size_t        split_len = 0;
      for (const auto& token : split_tokens_) {
        auto pos = word.find(token);
        if (pos != std::string::npos && pos < split_at) {
          split_at  = pos;
          split_len = token.size();
        }
      }
      if (split_at == std::string::npos) continue;

      emit(start, start + static_cast<int64_t>(split_at));
      emit(start + static_cast<int64_t>(split_at + split_len), end);
    }
  }

  return out;
}

} // namespace relgen::extract
