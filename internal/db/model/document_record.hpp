#pragma once

#include <cstdint>
#include <string>

namespace relgen::db::model {

/*
  Unit of work. Owned by ingestion; extraction only reads it.
*/
struct DocumentRecord {
  int64_t     id = 0; // 0 = assign on insert
  std::string name;
};

} // namespace relgen::db::model
