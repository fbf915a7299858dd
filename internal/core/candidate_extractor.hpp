#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/extract/throttlers.hpp"
#include "internal/model/relation_schema.hpp"
#include "internal/runner/parallel_runner.hpp"

namespace relgen::core {

/*
  Candidate extraction session.

  Validates the schema/throttler configuration once, up front, and
  throws util::ConfigurationError before any document is touched:
    - every schema has at least one argument
    - argument names and mention types have equal length
    - schema names are unique
    - one throttler slot per schema (nullptr = no throttler)

  Self/nested/symmetric filtering applies to binary relations only.
*/
class CandidateExtractor {
 public:
  CandidateExtractor(std::shared_ptr<db::Repository> repository, std::vector<model::RelationSchema> schemas,
                     std::optional<std::vector<extract::ThrottlerPtr>> throttlers = std::nullopt, model::FilterPolicy policy = {});

  /*
    Generate and persist candidates for every document and schema.
    With clear, each document's existing candidates of the configured
    schemas in split are deleted inside that document's transaction
    first; without it, already stored candidates are skipped.
  */
  runner::RunReport Apply(const std::vector<db::model::DocumentRecord>& documents, int32_t split = 0, bool clear = true,
                          std::size_t parallelism = 1);

  // Delete candidates of the configured schemas in split.
  void Clear(int32_t split);

  // Delete every candidate in split, whatever its schema.
  void ClearAll(int32_t split);

  // One list per schema, in schema order. Sorted by argument ids when sort is set.
  std::vector<std::vector<db::model::CandidateRecord>> GetCandidates(const std::optional<std::vector<db::model::DocumentRecord>>& documents,
                                                                     int32_t split = 0, bool sort = false);

  void Cancel();

  const std::vector<model::RelationSchema>& Schemas() const {
    return schemas_;
  }

 private:
  std::shared_ptr<db::Repository>     repository_;
  std::vector<model::RelationSchema>  schemas_;
  std::vector<extract::ThrottlerPtr>  throttlers_;
  model::FilterPolicy                 policy_;
  runner::ParallelRunner              runner_;
};

} // namespace relgen::core
