#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relgen::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Ids come from one shared sequence that is not rolled back,
  like a database sequence. Each transaction works on a private
  snapshot and replays its write log on commit, so concurrent
  transactions from different workers never conflict on
  unrelated rows.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  using MentionKey   = std::tuple<std::string, int64_t, int64_t, int64_t>;
  using CandidateKey = std::tuple<std::string, int32_t, std::string>;

  struct State {
    std::map<int64_t, model::DocumentRecord> documents;
    std::map<int64_t, model::SentenceRecord> sentences;

    std::map<int64_t, model::MentionRecord> mentions;
    std::map<MentionKey, int64_t>           mention_index;

    std::map<int64_t, model::CandidateRecord> candidates;
    std::map<CandidateKey, int64_t>           candidate_index;
  };

  int64_t NextId();

  std::mutex           mutex_;
  State                committed_;
  std::atomic<int64_t> next_id_{1};
};

}
