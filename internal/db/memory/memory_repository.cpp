#include "memory_repository.hpp"

#include <algorithm>
#include <set>

#include "memory_tx.hpp"

namespace relgen::db::memory {

namespace {

bool Matches(const model::MentionRecord& m, const MentionFilter& f) {
  if (f.type && m.type != *f.type) return false;
  if (f.document_id && m.document_id != *f.document_id) return false;
  return true;
}

bool Matches(const model::CandidateRecord& c, const CandidateFilter& f) {
  if (f.type && c.type != *f.type) return false;
  if (f.split && c.split != *f.split) return false;
  if (f.document_id && c.document_id != *f.document_id) return false;
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

int64_t MemoryRepository::NextId() {
  return next_id_.fetch_add(1);
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result MemoryRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  if (r.id == 0) {
    r.id = NextId();
  } else {
    // keep the sequence ahead of caller-assigned ids
    int64_t current = next_id_.load();
    while (current <= r.id && !next_id_.compare_exchange_weak(current, r.id + 1)) {
    }
  }

  return TX(t).Write([r](State& s) {
    if (s.documents.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "document " + std::to_string(r.id));
    s.documents[r.id] = r;
    return Result::Ok();
  });
}

std::optional<model::DocumentRecord> MemoryRepository::GetDocument(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.documents.find(id);
  if (it == s.documents.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DocumentRecord> MemoryRepository::ListDocuments(Transaction& t) {
  const auto&                        s = TX(t).View();
  std::vector<model::DocumentRecord> out;
  out.reserve(s.documents.size());
  for (const auto& [_, record] : s.documents) {
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::InsertSentence(Transaction& t, model::SentenceRecord& r) {
  if (r.words.size() != r.char_offsets.size()) {
    return Result::Err(ErrorCode::ConstraintViolation, "sentence words and char_offsets differ in length");
  }
  if (r.id == 0) r.id = NextId();

  return TX(t).Write([r](State& s) {
    if (!s.documents.contains(r.document_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "sentence references missing document " + std::to_string(r.document_id));
    }
    if (s.sentences.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "sentence " + std::to_string(r.id));
    s.sentences[r.id] = r;
    return Result::Ok();
  });
}

std::vector<model::SentenceRecord> MemoryRepository::ListSentences(Transaction& t, int64_t document_id) {
  std::vector<model::SentenceRecord> out;
  for (const auto& [_, record] : TX(t).View().sentences) {
    if (record.document_id == document_id) out.push_back(record);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.position < b.position; });
  return out;
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result MemoryRepository::InsertMention(Transaction& t, model::MentionRecord& r) {
  const MentionKey key{r.type, r.span.sentence_id, r.span.char_start, r.span.char_end};
  if (TX(t).View().mention_index.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "mention " + r.type + " " + relgen::model::ToString(r.span));
  }
  if (r.id == 0) r.id = NextId();

  return TX(t).Write([r, key](State& s) {
    if (s.mention_index.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
    if (!s.documents.contains(r.document_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "mention references missing document " + std::to_string(r.document_id));
    }
    s.mentions[r.id]     = r;
    s.mention_index[key] = r.id;
    return Result::Ok();
  });
}

std::optional<int64_t> MemoryRepository::FindMention(Transaction& t, const std::string& type, const relgen::model::Span& span) {
  const auto& s  = TX(t).View();
  auto        it = s.mention_index.find(MentionKey{type, span.sentence_id, span.char_start, span.char_end});
  if (it == s.mention_index.end()) return std::nullopt;
  return it->second;
}

std::vector<model::MentionRecord> MemoryRepository::ListMentions(Transaction& t, const MentionFilter& filter) {
  std::vector<model::MentionRecord> out;
  for (const auto& [_, record] : TX(t).View().mentions) {
    if (Matches(record, filter)) out.push_back(record);
  }
  return out;
}

uint64_t MemoryRepository::CountMentions(Transaction& t, const MentionFilter& filter) {
  const auto& mentions = TX(t).View().mentions;
  return static_cast<uint64_t>(
      std::count_if(mentions.begin(), mentions.end(), [&](const auto& entry) { return Matches(entry.second, filter); }));
}

Result MemoryRepository::DeleteMentions(Transaction& t, const MentionFilter& filter) {
  return TX(t).Write([filter](State& s) {
    std::set<int64_t> removed;
    for (auto it = s.mentions.begin(); it != s.mentions.end();) {
      if (Matches(it->second, filter)) {
        const auto& m = it->second;
        s.mention_index.erase(MentionKey{m.type, m.span.sentence_id, m.span.char_start, m.span.char_end});
        removed.insert(it->first);
        it = s.mentions.erase(it);
      } else {
        ++it;
      }
    }

    // cascade
    for (auto it = s.candidates.begin(); it != s.candidates.end();) {
      const auto& c = it->second;
      bool references = std::any_of(c.mention_ids.begin(), c.mention_ids.end(), [&](int64_t id) { return removed.contains(id); });
      if (references) {
        s.candidate_index.erase(CandidateKey{c.type, c.split, model::ArgumentKey(c.mention_ids)});
        it = s.candidates.erase(it);
      } else {
        ++it;
      }
    }
    return Result::Ok();
  });
}

// ------------------------------------------------------------------
// Candidates
// ------------------------------------------------------------------

Result MemoryRepository::InsertCandidate(Transaction& t, model::CandidateRecord& r) {
  const CandidateKey key{r.type, r.split, model::ArgumentKey(r.mention_ids)};
  if (TX(t).View().candidate_index.contains(key)) {
    return Result::Err(ErrorCode::AlreadyExists, "candidate " + r.type + " (" + std::get<2>(key) + ")");
  }
  if (r.id == 0) r.id = NextId();

  return TX(t).Write([r, key](State& s) {
    if (s.candidate_index.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
    if (!s.documents.contains(r.document_id)) {
      return Result::Err(ErrorCode::ConstraintViolation, "candidate references missing document " + std::to_string(r.document_id));
    }
    for (auto mention_id : r.mention_ids) {
      if (!s.mentions.contains(mention_id)) {
        return Result::Err(ErrorCode::ConstraintViolation, "candidate references missing mention " + std::to_string(mention_id));
      }
    }
    s.candidates[r.id]     = r;
    s.candidate_index[key] = r.id;
    return Result::Ok();
  });
}

std::optional<int64_t> MemoryRepository::FindCandidate(Transaction& t, const std::string& type, int32_t split,
                                                       const std::vector<int64_t>& mention_ids) {
  const auto& s  = TX(t).View();
  auto        it = s.candidate_index.find(CandidateKey{type, split, model::ArgumentKey(mention_ids)});
  if (it == s.candidate_index.end()) return std::nullopt;
  return it->second;
}

std::vector<model::CandidateRecord> MemoryRepository::ListCandidates(Transaction& t, const CandidateFilter& filter) {
  std::vector<model::CandidateRecord> out;
  for (const auto& [_, record] : TX(t).View().candidates) {
    if (Matches(record, filter)) out.push_back(record);
  }
  return out;
}

uint64_t MemoryRepository::CountCandidates(Transaction& t, const CandidateFilter& filter) {
  const auto& candidates = TX(t).View().candidates;
  return static_cast<uint64_t>(
      std::count_if(candidates.begin(), candidates.end(), [&](const auto& entry) { return Matches(entry.second, filter); }));
}

Result MemoryRepository::DeleteCandidates(Transaction& t, const CandidateFilter& filter) {
  return TX(t).Write([filter](State& s) {
    for (auto it = s.candidates.begin(); it != s.candidates.end();) {
      if (Matches(it->second, filter)) {
        const auto& c = it->second;
        s.candidate_index.erase(CandidateKey{c.type, c.split, model::ArgumentKey(c.mention_ids)});
        it = s.candidates.erase(it);
      } else {
        ++it;
      }
    }
    return Result::Ok();
  });
}

} // namespace relgen::db::memory
