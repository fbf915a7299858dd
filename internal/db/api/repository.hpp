#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/candidate_record.hpp"
#include "internal/db/model/document_record.hpp"
#include "internal/db/model/mention_record.hpp"
#include "internal/db/model/sentence_record.hpp"

namespace relgen::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - Each Transaction owns an independent connection, so
    concurrent workers never share one
  - (type, split, arguments) is unique per candidate and
    (type, span) is unique per mention; a duplicate insert is
    ignored and reported as AlreadyExists, never as a second row
  - Deleting a mention deletes every candidate referencing it;
    deleting a candidate never deletes its mentions

  The DB is the source of truth for:
    documents, sentences, mentions, candidates
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Documents (written by ingestion)
  // ---------------------------------------------------------------------

  // Assigns record.id when it is 0.
  virtual Result InsertDocument(Transaction&, model::DocumentRecord&) = 0;

  virtual std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) = 0;

  // Ordered by id.
  virtual std::vector<model::DocumentRecord> ListDocuments(Transaction&) = 0;

  // Assigns record.id when it is 0.
  virtual Result InsertSentence(Transaction&, model::SentenceRecord&) = 0;

  // Ordered by position.
  virtual std::vector<model::SentenceRecord> ListSentences(Transaction&, int64_t document_id) = 0;

  // ---------------------------------------------------------------------
  // Mentions
  // ---------------------------------------------------------------------

  // Insert-or-ignore. Assigns record.id on success; AlreadyExists for a duplicate.
  virtual Result InsertMention(Transaction&, model::MentionRecord&) = 0;

  virtual std::optional<int64_t> FindMention(Transaction&, const std::string& type, const relgen::model::Span& span) = 0;

  // Ordered by mention id ascending.
  virtual std::vector<model::MentionRecord> ListMentions(Transaction&, const MentionFilter&) = 0;

  virtual uint64_t CountMentions(Transaction&, const MentionFilter&) = 0;

  // Cascades to candidates referencing a deleted mention.
  virtual Result DeleteMentions(Transaction&, const MentionFilter&) = 0;

  // ---------------------------------------------------------------------
  // Candidates
  // ---------------------------------------------------------------------

  // Insert-or-ignore. Assigns record.id on success; AlreadyExists for a duplicate.
  virtual Result InsertCandidate(Transaction&, model::CandidateRecord&) = 0;

  virtual std::optional<int64_t> FindCandidate(Transaction&, const std::string& type, int32_t split,
                                               const std::vector<int64_t>& mention_ids) = 0;

  // Ordered by candidate id ascending.
  virtual std::vector<model::CandidateRecord> ListCandidates(Transaction&, const CandidateFilter&) = 0;

  virtual uint64_t CountCandidates(Transaction&, const CandidateFilter&) = 0;

  virtual Result DeleteCandidates(Transaction&, const CandidateFilter&) = 0;
};

} // namespace relgen::db
