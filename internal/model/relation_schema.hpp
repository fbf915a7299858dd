#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace relgen::model {

/*
  Relation type description.

  argument_names and mention_types are parallel lists: role i is
  named argument_names[i] and is filled by a mention of type
  mention_types[i]. Arity is the number of roles.
*/
struct RelationSchema {
  std::string              name;
  std::vector<std::string> argument_names;
  std::vector<std::string> mention_types;

  std::size_t Arity() const {
    return argument_names.size();
  }
};

/*
  Filters applied to binary relations only. Higher arities skip them.
*/
struct FilterPolicy {
  bool self_relations      = false;
  bool nested_relations    = false;
  bool symmetric_relations = true;
};

} // namespace relgen::model
