#pragma once

#include <cstdint>
#include <string>

#include "internal/db/api/repository.hpp"

namespace relgen::runner {

/*
  One unit of per-document work (one relation schema or mention type).

  Process() runs inside the document's transaction and returns the
  number of records it wrote. It is called concurrently for different
  documents, so implementations keep no per-call state in members.
  Throwing fails the whole document.
*/
class DocumentTask {
 public:
  virtual ~DocumentTask() = default;

  virtual const std::string& Name() const = 0;

  virtual uint64_t Process(db::Repository& repository, db::Transaction& tx, const db::model::DocumentRecord& document) const = 0;
};

} // namespace relgen::runner
