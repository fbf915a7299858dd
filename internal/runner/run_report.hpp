#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace relgen::runner {

struct DocumentFailure {
  int64_t     document_id = 0;
  std::string document_name;
  std::string task; // failing schema or mention type, or "commit"
  std::string error;
};

struct RunReport {
  uint64_t documents_processed = 0;
  uint64_t documents_failed    = 0;
  uint64_t records_written     = 0;
  bool     cancelled           = false;

  std::vector<DocumentFailure> failures;

  bool Ok() const {
    return failures.empty();
  }
};

} // namespace relgen::runner
