#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/extract/matchers.hpp"
#include "internal/extract/ngrams.hpp"
#include "internal/runner/parallel_runner.hpp"

namespace relgen::core {

/*
  Mention extraction session: arity-1 counterpart of CandidateExtractor.

  types[i] is produced by spaces[i] filtered through matchers[i].
  Mismatched lengths, null entries or duplicate types throw
  util::ConfigurationError from the constructor.
*/
class MentionExtractor {
 public:
  MentionExtractor(std::shared_ptr<db::Repository> repository, std::vector<std::string> types,
                   std::vector<std::shared_ptr<const extract::MentionSpace>> spaces, std::vector<extract::MatcherPtr> matchers);

  runner::RunReport Apply(const std::vector<db::model::DocumentRecord>& documents, bool clear = true, std::size_t parallelism = 1);

  // Delete every mention of the configured types. Cascades to candidates.
  void Clear();

  // Delete every mention, whatever its type. Cascades to candidates.
  void ClearAll();

  // One list per type. Sorted by span when sort is set, by id otherwise.
  std::vector<std::vector<db::model::MentionRecord>> GetMentions(const std::optional<std::vector<db::model::DocumentRecord>>& documents,
                                                                 bool sort = false);

  void Cancel();

  const std::vector<std::string>& Types() const {
    return types_;
  }

 private:
  std::shared_ptr<db::Repository>                          repository_;
  std::vector<std::string>                                 types_;
  std::vector<std::shared_ptr<const extract::MentionSpace>> spaces_;
  std::vector<extract::MatcherPtr>                         matchers_;
  runner::ParallelRunner                                   runner_;
};

} // namespace relgen::core
