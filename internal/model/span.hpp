#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace relgen::model {

/*
  Reference to a contiguous region of one sentence.

  Offsets are half-open [char_start, char_end) and relative to the
  sentence text. Spans never carry copied text.
*/
struct Span {
  int64_t sentence_id = 0;
  int64_t char_start  = 0;
  int64_t char_end    = 0;

  int64_t Length() const {
    return char_end - char_start;
  }

  // True when `other` lies inside this span (identical spans included).
  bool Contains(const Span& other) const {
    return sentence_id == other.sentence_id && char_start <= other.char_start && other.char_end <= char_end;
  }

  // True when one span is a strict subspan of the other, in either direction.
  bool IsNestedWith(const Span& other) const {
    if (*this == other) return false;
    return Contains(other) || other.Contains(*this);
  }

  bool operator==(const Span& other) const {
    return sentence_id == other.sentence_id && char_start == other.char_start && char_end == other.char_end;
  }

  bool operator!=(const Span& other) const {
    return !(*this == other);
  }

  bool operator<(const Span& other) const {
    return std::tie(sentence_id, char_start, char_end) < std::tie(other.sentence_id, other.char_start, other.char_end);
  }
};

inline std::string ToString(const Span& span) {
  return std::to_string(span.sentence_id) + "[" + std::to_string(span.char_start) + "," + std::to_string(span.char_end) + ")";
}

} // namespace relgen::model
