#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/relation_schema.hpp"
#include "throttlers.hpp"

namespace relgen::extract {

/*
  Candidate generation for one document and one relation schema.

  Enumerates the Cartesian product of the per-role mention lists
  (each ordered by mention id) lazily, one surviving candidate per
  Next() call. Per tuple, in order:

    1. throttler (when set)
    2. binary relations only: self, nested, symmetric filters
    3. incremental mode only: skip tuples already stored

  Reads only; the caller persists what Next() returns.
*/
class CandidateGenerator {
 public:
  struct Stats {
    uint64_t emitted           = 0;
    uint64_t skipped_throttled = 0;
    uint64_t skipped_self      = 0;
    uint64_t skipped_nested    = 0;
    uint64_t skipped_symmetric = 0;
    uint64_t skipped_existing  = 0;
  };

  CandidateGenerator(db::Repository& repository, db::Transaction& tx, const model::RelationSchema& schema, const Throttler* throttler,
                     const model::FilterPolicy& policy, int32_t split, bool clear, int64_t document_id);

  // Next surviving candidate, or nullopt once the product is exhausted.
  std::optional<db::model::CandidateRecord> Next();

  // Restart the enumeration from the first tuple.
  void Reset();

  const Stats& GetStats() const {
    return stats_;
  }

  // Number of tuples in the unfiltered product.
  uint64_t ProductSize() const;

 private:
  void Advance();
  bool Survives(const MentionTuple& tuple, const std::vector<std::size_t>& positions);

  db::Repository&             repository_;
  db::Transaction&            tx_;
  const model::RelationSchema& schema_;
  const Throttler*            throttler_;
  model::FilterPolicy         policy_;
  int32_t                     split_;
  bool                        clear_;
  int64_t                     document_id_;

  std::vector<std::vector<db::model::MentionRecord>> role_mentions_;
  std::vector<std::size_t>                           cursor_;
  bool                                               exhausted_ = false;
  Stats                                              stats_;
};

} // namespace relgen::extract
