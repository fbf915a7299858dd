#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_pool.hpp"
#include "sqlite_tx.hpp"

namespace relgen::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqlitePool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertDocument(Transaction&, model::DocumentRecord&) override;
  std::optional<model::DocumentRecord> GetDocument(Transaction&, int64_t id) override;
  std::vector<model::DocumentRecord> ListDocuments(Transaction&) override;
  Result InsertSentence(Transaction&, model::SentenceRecord&) override;
  std::vector<model::SentenceRecord> ListSentences(Transaction&, int64_t document_id) override;

  Result InsertMention(Transaction&, model::MentionRecord&) override;
  std::optional<int64_t> FindMention(Transaction&, const std::string& type, const relgen::model::Span& span) override;
  std::vector<model::MentionRecord> ListMentions(Transaction&, const MentionFilter&) override;
  uint64_t CountMentions(Transaction&, const MentionFilter&) override;
  Result DeleteMentions(Transaction&, const MentionFilter&) override;

  Result InsertCandidate(Transaction&, model::CandidateRecord&) override;
  std::optional<int64_t> FindCandidate(Transaction&, const std::string& type, int32_t split,
                                       const std::vector<int64_t>& mention_ids) override;
  std::vector<model::CandidateRecord> ListCandidates(Transaction&, const CandidateFilter&) override;
  uint64_t CountCandidates(Transaction&, const CandidateFilter&) override;
  Result DeleteCandidates(Transaction&, const CandidateFilter&) override;

private:
  std::shared_ptr<SqlitePool> pool_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
