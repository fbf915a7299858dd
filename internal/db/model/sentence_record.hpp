#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace relgen::db::model {

/*
  Tokenized sentence of a document.

  char_offsets[i] is the offset of words[i] inside text.
*/
struct SentenceRecord {
  int64_t     id          = 0; // 0 = assign on insert
  int64_t     document_id = 0;
  int32_t     position    = 0;
  std::string text;

  std::vector<std::string> words;
  std::vector<int64_t>     char_offsets;
};

} // namespace relgen::db::model
