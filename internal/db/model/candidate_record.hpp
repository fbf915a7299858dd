#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace relgen::db::model {

/*
  Persistent n-ary relation instance.

  mention_ids holds one mention id per role, in role order.
  (type, split, mention_ids) is unique.
*/
struct CandidateRecord {
  int64_t     id = 0; // 0 = assign on insert
  std::string type;
  int32_t     split       = 0;
  int64_t     document_id = 0;

  std::vector<int64_t> mention_ids;
};

// Canonical comma-joined argument key, e.g. "12,57".
inline std::string ArgumentKey(const std::vector<int64_t>& mention_ids) {
  std::string key;
  for (std::size_t i = 0; i < mention_ids.size(); ++i) {
    if (i > 0) key.push_back(',');
    key += std::to_string(mention_ids[i]);
  }
  return key;
}

inline std::vector<int64_t> ParseArgumentKey(const std::string& key) {
  std::vector<int64_t> ids;
  std::size_t          begin = 0;
  while (begin < key.size()) {
    auto end = key.find(',', begin);
    if (end == std::string::npos) end = key.size();
    ids.push_back(std::stoll(key.substr(begin, end - begin)));
    begin = end + 1;
  }
  return ids;
}

} // namespace relgen::db::model
