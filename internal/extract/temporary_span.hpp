#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/sentence_record.hpp"
#include "internal/model/span.hpp"

namespace relgen::extract {

/*
  A span that has not been persisted yet.

  Borrows the sentence it points into; the sentence must outlive it.
*/
struct TemporarySpan {
  const db::model::SentenceRecord* sentence = nullptr;
  int64_t                          char_start = 0;
  int64_t                          char_end   = 0;

  std::string Text() const {
    return sentence->text.substr(static_cast<std::size_t>(char_start), static_cast<std::size_t>(char_end - char_start));
  }

  relgen::model::Span ToSpan() const {
    return relgen::model::Span{sentence->id, char_start, char_end};
  }

  bool Contains(const TemporarySpan& other) const {
    return ToSpan().Contains(other.ToSpan());
  }
};

} // namespace relgen::extract
