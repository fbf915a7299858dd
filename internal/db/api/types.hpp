#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relgen::db {

/*
  Row selection for candidate reads and bulk deletes.
  Unset fields do not constrain the selection.
*/
struct CandidateFilter {
  std::optional<std::string> type;
  std::optional<int32_t>     split;
  std::optional<int64_t>     document_id;
};

/*
  Row selection for mention reads and bulk deletes.
*/
struct MentionFilter {
  std::optional<std::string> type;
  std::optional<int64_t>     document_id;
};

} // namespace relgen::db
