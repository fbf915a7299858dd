#include "pg_repository.hpp"

namespace relgen::db::postgres {

namespace {

model::MentionRecord ReadMention(const pqxx::row& row) {
  model::MentionRecord m;
  m.id               = row[0].as<int64_t>();
  m.type             = row[1].c_str();
  m.document_id      = row[2].as<int64_t>();
  m.span.sentence_id = row[3].as<int64_t>();
  m.span.char_start  = row[4].as<int64_t>();
  m.span.char_end    = row[5].as<int64_t>();
  return m;
}

constexpr const char* kCandidateWhere =
    " WHERE ($1::text IS NULL OR type=$1) AND ($2::int IS NULL OR split=$2) AND ($3::bigint IS NULL OR document_id=$3)";

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result PgRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  try {
    if (r.id == 0) {
      auto res = TX(t).Work().exec_params("INSERT INTO document(name) VALUES($1) RETURNING id;", r.name);
      r.id     = res[0][0].as<int64_t>();
    } else {
      TX(t).Work().exec_params("INSERT INTO document(id,name) VALUES($1,$2);", r.id, r.name);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DocumentRecord> PgRepository::GetDocument(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_params("SELECT id,name FROM document WHERE id=$1;", id);
  if (res.empty()) return std::nullopt;

  model::DocumentRecord r;
  r.id   = res[0][0].as<int64_t>();
  r.name = res[0][1].c_str();
  return r;
}

std::vector<model::DocumentRecord> PgRepository::ListDocuments(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT id,name FROM document ORDER BY id;");

  std::vector<model::DocumentRecord> records;
  records.reserve(res.size());
  for (const auto& row : res) {
    model::DocumentRecord r;
    r.id   = row[0].as<int64_t>();
    r.name = row[1].c_str();
    records.push_back(std::move(r));
  }
  return records;
}

Result PgRepository::InsertSentence(Transaction& t, model::SentenceRecord& r) {
  if (r.words.size() != r.char_offsets.size()) {
    return Result::Err(ErrorCode::ConstraintViolation, "sentence words and char_offsets differ in length");
  }

  try {
    auto& work = TX(t).Work();
    if (r.id == 0) {
      auto res = work.exec_params("INSERT INTO sentence(document_id,position,text) VALUES($1,$2,$3) RETURNING id;", r.document_id,
                                  r.position, r.text);
      r.id     = res[0][0].as<int64_t>();
    } else {
      work.exec_params("INSERT INTO sentence(id,document_id,position,text) VALUES($1,$2,$3,$4);", r.id, r.document_id, r.position,
                       r.text);
    }

    for (std::size_t i = 0; i < r.words.size(); ++i) {
      work.exec_params("INSERT INTO sentence_token(sentence_id,position,word,char_offset) VALUES($1,$2,$3,$4);", r.id,
                       static_cast<int>(i), r.words[i], r.char_offsets[i]);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::SentenceRecord> PgRepository::ListSentences(Transaction& t, int64_t document_id) {
  auto& work = TX(t).Work();
  auto  res  = work.exec_params("SELECT id,document_id,position,text FROM sentence WHERE document_id=$1 ORDER BY position, id;",
                                document_id);

  std::vector<model::SentenceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::SentenceRecord r;
    r.id          = row[0].as<int64_t>();
    r.document_id = row[1].as<int64_t>();
    r.position    = row[2].as<int32_t>();
    r.text        = row[3].c_str();

    auto tokens = work.exec_params("SELECT word,char_offset FROM sentence_token WHERE sentence_id=$1 ORDER BY position;", r.id);
    for (const auto& token : tokens) {
      r.words.emplace_back(token[0].c_str());
      r.char_offsets.push_back(token[1].as<int64_t>());
    }
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result PgRepository::InsertMention(Transaction& t, model::MentionRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared(kInsertMention, r.type, r.document_id, r.span.sentence_id, r.span.char_start, r.span.char_end);
    if (res.empty()) {
      return Result::Err(ErrorCode::AlreadyExists, "mention " + r.type + " " + relgen::model::ToString(r.span));
    }
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<int64_t> PgRepository::FindMention(Transaction& t, const std::string& type, const relgen::model::Span& span) {
  auto res = TX(t).Work().exec_prepared(kFindMention, type, span.sentence_id, span.char_start, span.char_end);
  if (res.empty()) return std::nullopt;
  return res[0][0].as<int64_t>();
}

std::vector<model::MentionRecord> PgRepository::ListMentions(Transaction& t, const MentionFilter& filter) {
  auto res = TX(t).Work().exec_params(
      "SELECT id,type,document_id,sentence_id,char_start,char_end FROM mention "
      "WHERE ($1::text IS NULL OR type=$1) AND ($2::bigint IS NULL OR document_id=$2) ORDER BY id;",
      filter.type, filter.document_id);

  std::vector<model::MentionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMention(row));
  }
  return out;
}

uint64_t PgRepository::CountMentions(Transaction& t, const MentionFilter& filter) {
  auto res = TX(t).Work().exec_params(
      "SELECT COUNT(*) FROM mention WHERE ($1::text IS NULL OR type=$1) AND ($2::bigint IS NULL OR document_id=$2);", filter.type,
      filter.document_id);
  return res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteMentions(Transaction& t, const MentionFilter& filter) {
  try {
    auto& work = TX(t).Work();
    work.exec_params(
        "DELETE FROM candidate WHERE id IN (SELECT a.candidate_id FROM candidate_argument a JOIN mention m ON m.id=a.mention_id "
        "WHERE ($1::text IS NULL OR m.type=$1) AND ($2::bigint IS NULL OR m.document_id=$2));",
        filter.type, filter.document_id);
    work.exec_params("DELETE FROM mention WHERE ($1::text IS NULL OR type=$1) AND ($2::bigint IS NULL OR document_id=$2);", filter.type,
                     filter.document_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Candidates
// ------------------------------------------------------------------

Result PgRepository::InsertCandidate(Transaction& t, model::CandidateRecord& r) {
  const auto arguments = model::ArgumentKey(r.mention_ids);
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared(kInsertCandidate, r.type, r.split, r.document_id, arguments);
    if (res.empty()) {
      return Result::Err(ErrorCode::AlreadyExists, "candidate " + r.type + " (" + arguments + ")");
    }
    const auto candidate_id = res[0][0].as<int64_t>();

    for (std::size_t i = 0; i < r.mention_ids.size(); ++i) {
      work.exec_prepared(kInsertCandidateArgument, candidate_id, static_cast<int>(i), r.mention_ids[i]);
    }
    r.id = candidate_id;
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<int64_t> PgRepository::FindCandidate(Transaction& t, const std::string& type, int32_t split,
                                                   const std::vector<int64_t>& mention_ids) {
  auto res = TX(t).Work().exec_prepared(kFindCandidate, type, split, model::ArgumentKey(mention_ids));
  if (res.empty()) return std::nullopt;
  return res[0][0].as<int64_t>();
}

std::vector<model::CandidateRecord> PgRepository::ListCandidates(Transaction& t, const CandidateFilter& filter) {
  auto res = TX(t).Work().exec_params(std::string("SELECT id,type,split,document_id,arguments FROM candidate") + kCandidateWhere +
                                          " ORDER BY id;",
                                      filter.type, filter.split, filter.document_id);

  std::vector<model::CandidateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::CandidateRecord c;
    c.id          = row[0].as<int64_t>();
    c.type        = row[1].c_str();
    c.split       = row[2].as<int32_t>();
    c.document_id = row[3].as<int64_t>();
    c.mention_ids = model::ParseArgumentKey(row[4].c_str());
    out.push_back(std::move(c));
  }
  return out;
}

uint64_t PgRepository::CountCandidates(Transaction& t, const CandidateFilter& filter) {
  auto res = TX(t).Work().exec_params(std::string("SELECT COUNT(*) FROM candidate") + kCandidateWhere + ";", filter.type, filter.split,
                                      filter.document_id);
  return res[0][0].as<uint64_t>();
}

Result PgRepository::DeleteCandidates(Transaction& t, const CandidateFilter& filter) {
  try {
    TX(t).Work().exec_params(std::string("DELETE FROM candidate") + kCandidateWhere + ";", filter.type, filter.split, filter.document_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace relgen::db::postgres
