#include "throttlers.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace relgen::extract {

LambdaThrottler::LambdaThrottler(Function fn) : fn_(std::move(fn)) {
  if (!fn_) throw util::ConfigurationError("lambda throttler needs a callable");
}

bool LambdaThrottler::Accept(const MentionTuple& mentions) const {
  return fn_(mentions);
}

bool SameSentenceThrottler::Accept(const MentionTuple& mentions) const {
  if (mentions.empty()) return true;
  const auto sentence = mentions.front()->span.sentence_id;
  return std::all_of(mentions.begin(), mentions.end(), [&](const auto* m) { return m->span.sentence_id == sentence; });
}

bool OrderedThrottler::Accept(const MentionTuple& mentions) const {
  for (std::size_t i = 1; i < mentions.size(); ++i) {
    const auto& prev = mentions[i - 1]->span;
    const auto& next = mentions[i]->span;
    if (prev.sentence_id != next.sentence_id) return false;
    if (prev.char_end > next.char_start) return false;
  }
  return true;
}

MaxCharDistanceThrottler::MaxCharDistanceThrottler(int64_t max_chars) : max_chars_(max_chars) {
  if (max_chars_ < 0) throw util::ConfigurationError("max_char_distance must not be negative");
}

bool MaxCharDistanceThrottler::Accept(const MentionTuple& mentions) const {
  for (std::size_t i = 1; i < mentions.size(); ++i) {
    const auto& a = mentions[i - 1]->span;
    const auto& b = mentions[i]->span;
    if (a.sentence_id != b.sentence_id) return false;
    const int64_t gap = std::max(a.char_start, b.char_start) - std::min(a.char_end, b.char_end);
    if (gap > max_chars_) return false;
  }
  return true;
}

} // namespace relgen::extract
