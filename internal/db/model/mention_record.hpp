#pragma once

#include <cstdint>
#include <string>

#include "internal/model/span.hpp"

namespace relgen::db::model {

/*
  Persistent arity-1 entity.

  (type, span) is unique. Mentions are immutable once written;
  deleting one cascades to every candidate referencing it.
*/
struct MentionRecord {
  int64_t     id = 0; // 0 = assign on insert
  std::string type;
  int64_t     document_id = 0;

  relgen::model::Span span;
};

} // namespace relgen::db::model
