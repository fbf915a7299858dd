#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace relgen::db::sqlite {

using relgen::db::ErrorCode;
using relgen::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// Reads report failures by throwing; writes translate them into Result.
Stmt PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

Stmt Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    return nullptr;
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

template <typename T>
void BindOptInt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (v) {
    BindI64(st, idx, static_cast<int64_t>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

void ThrowIfStepFailed(sqlite3* db, int rc) {
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
  }
}

model::MentionRecord ReadMention(sqlite3_stmt* st) {
  model::MentionRecord m;
  m.id               = ColI64(st, 0);
  m.type             = ColText(st, 1);
  m.document_id      = ColI64(st, 2);
  m.span.sentence_id = ColI64(st, 3);
  m.span.char_start  = ColI64(st, 4);
  m.span.char_end    = ColI64(st, 5);
  return m;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool)
    : pool_(std::move(pool)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(pool_->Acquire());
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Documents
// ------------------------------------------------------------------

Result SqliteRepository::InsertDocument(Transaction& t, model::DocumentRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, r.id == 0 ? sql::INSERT_DOCUMENT : sql::INSERT_DOCUMENT_ID);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  if (r.id == 0) {
    BindText(st.get(), 1, r.name);
  } else {
    BindI64(st.get(), 1, r.id);
    BindText(st.get(), 2, r.name);
  }

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    return Translate(db, rc);
  }
  if (r.id == 0) r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<model::DocumentRecord> SqliteRepository::GetDocument(Transaction& t, int64_t id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_DOCUMENT);
  BindI64(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;

  model::DocumentRecord r;
  r.id   = ColI64(st.get(), 0);
  r.name = ColText(st.get(), 1);
  return r;
}

std::vector<model::DocumentRecord> SqliteRepository::ListDocuments(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::LIST_DOCUMENTS);

  std::vector<model::DocumentRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::DocumentRecord r;
    r.id   = ColI64(st.get(), 0);
    r.name = ColText(st.get(), 1);
    out.push_back(std::move(r));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

Result SqliteRepository::InsertSentence(Transaction& t, model::SentenceRecord& r) {
  auto* db = TX(t).Handle();

  if (r.words.size() != r.char_offsets.size()) {
    return Result::Err(ErrorCode::ConstraintViolation, "sentence words and char_offsets differ in length");
  }

  auto st = Prepare(db, r.id == 0 ? sql::INSERT_SENTENCE : sql::INSERT_SENTENCE_ID);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  int idx = 1;
  if (r.id != 0) BindI64(st.get(), idx++, r.id);
  BindI64(st.get(), idx++, r.document_id);
  BindI32(st.get(), idx++, r.position);
  BindText(st.get(), idx++, r.text);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (r.id == 0) r.id = sqlite3_last_insert_rowid(db);

  auto tok = Prepare(db, sql::INSERT_SENTENCE_TOKEN);
  if (!tok) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (std::size_t i = 0; i < r.words.size(); ++i) {
    sqlite3_reset(tok.get());
    BindI64(tok.get(), 1, r.id);
    BindI32(tok.get(), 2, static_cast<int>(i));
    BindText(tok.get(), 3, r.words[i]);
    BindI64(tok.get(), 4, r.char_offsets[i]);
    rc = sqlite3_step(tok.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

std::vector<model::SentenceRecord> SqliteRepository::ListSentences(Transaction& t, int64_t document_id) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::LIST_SENTENCES);
  BindI64(st.get(), 1, document_id);

  std::vector<model::SentenceRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::SentenceRecord r;
    r.id          = ColI64(st.get(), 0);
    r.document_id = ColI64(st.get(), 1);
    r.position    = ColI32(st.get(), 2);
    r.text        = ColText(st.get(), 3);
    out.push_back(std::move(r));
  }
  ThrowIfStepFailed(db, rc);

  auto tok = PrepareOrThrow(db, sql::LIST_SENTENCE_TOKENS);
  for (auto& sentence : out) {
    sqlite3_reset(tok.get());
    BindI64(tok.get(), 1, sentence.id);
    while ((rc = sqlite3_step(tok.get())) == SQLITE_ROW) {
      sentence.words.push_back(ColText(tok.get(), 0));
      sentence.char_offsets.push_back(ColI64(tok.get(), 1));
    }
    ThrowIfStepFailed(db, rc);
  }
  return out;
}

// ------------------------------------------------------------------
// Mentions
// ------------------------------------------------------------------

Result SqliteRepository::InsertMention(Transaction& t, model::MentionRecord& r) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::INSERT_MENTION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.type);
  BindI64(st.get(), 2, r.document_id);
  BindI64(st.get(), 3, r.span.sentence_id);
  BindI64(st.get(), 4, r.span.char_start);
  BindI64(st.get(), 5, r.span.char_end);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  // ON CONFLICT DO NOTHING leaves the change count at zero
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::AlreadyExists, "mention " + r.type + " " + relgen::model::ToString(r.span));
  }
  r.id = sqlite3_last_insert_rowid(db);
  return Result::Ok();
}

std::optional<int64_t> SqliteRepository::FindMention(Transaction& t, const std::string& type, const relgen::model::Span& span) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_MENTION_ID);

  BindText(st.get(), 1, type);
  BindI64(st.get(), 2, span.sentence_id);
  BindI64(st.get(), 3, span.char_start);
  BindI64(st.get(), 4, span.char_end);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ColI64(st.get(), 0);
}

std::vector<model::MentionRecord> SqliteRepository::ListMentions(Transaction& t, const MentionFilter& filter) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_MENTIONS);

  BindOptText(st.get(), 1, filter.type);
  BindOptInt(st.get(), 2, filter.document_id);

  std::vector<model::MentionRecord> out;
  int                               rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadMention(st.get()));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

uint64_t SqliteRepository::CountMentions(Transaction& t, const MentionFilter& filter) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_MENTIONS);

  BindOptText(st.get(), 1, filter.type);
  BindOptInt(st.get(), 2, filter.document_id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  return rc == SQLITE_ROW ? static_cast<uint64_t>(ColI64(st.get(), 0)) : 0;
}

Result SqliteRepository::DeleteMentions(Transaction& t, const MentionFilter& filter) {
  auto* db = TX(t).Handle();

  // candidates referencing the mentions go first
  for (const char* statement : {sql::DELETE_MENTION_CANDIDATES, sql::DELETE_MENTIONS}) {
    auto st = Prepare(db, statement);
    if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindOptText(st.get(), 1, filter.type);
    BindOptInt(st.get(), 2, filter.document_id);

    int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Candidates
// ------------------------------------------------------------------

Result SqliteRepository::InsertCandidate(Transaction& t, model::CandidateRecord& r) {
  auto* db = TX(t).Handle();

  const auto arguments = model::ArgumentKey(r.mention_ids);

  auto st = Prepare(db, sql::INSERT_CANDIDATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.type);
  BindI32(st.get(), 2, r.split);
  BindI64(st.get(), 3, r.document_id);
  BindText(st.get(), 4, arguments);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);

  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::AlreadyExists, "candidate " + r.type + " (" + arguments + ")");
  }
  const int64_t candidate_id = sqlite3_last_insert_rowid(db);

  auto arg = Prepare(db, sql::INSERT_CANDIDATE_ARGUMENT);
  if (!arg) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (std::size_t i = 0; i < r.mention_ids.size(); ++i) {
    sqlite3_reset(arg.get());
    BindI64(arg.get(), 1, candidate_id);
    BindI32(arg.get(), 2, static_cast<int>(i));
    BindI64(arg.get(), 3, r.mention_ids[i]);
    rc = sqlite3_step(arg.get());
    if (rc != SQLITE_DONE) return Translate(db, rc);
  }

  r.id = candidate_id;
  return Result::Ok();
}

std::optional<int64_t> SqliteRepository::FindCandidate(Transaction& t, const std::string& type, int32_t split,
                                                       const std::vector<int64_t>& mention_ids) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_CANDIDATE_ID);

  BindText(st.get(), 1, type);
  BindI32(st.get(), 2, split);
  BindText(st.get(), 3, model::ArgumentKey(mention_ids));

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  if (rc != SQLITE_ROW) return std::nullopt;
  return ColI64(st.get(), 0);
}

std::vector<model::CandidateRecord> SqliteRepository::ListCandidates(Transaction& t, const CandidateFilter& filter) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::SELECT_CANDIDATES);

  BindOptText(st.get(), 1, filter.type);
  BindOptInt(st.get(), 2, filter.split);
  BindOptInt(st.get(), 3, filter.document_id);

  std::vector<model::CandidateRecord> out;
  int                                 rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    model::CandidateRecord c;
    c.id          = ColI64(st.get(), 0);
    c.type        = ColText(st.get(), 1);
    c.split       = ColI32(st.get(), 2);
    c.document_id = ColI64(st.get(), 3);
    c.mention_ids = model::ParseArgumentKey(ColText(st.get(), 4));
    out.push_back(std::move(c));
  }
  ThrowIfStepFailed(db, rc);
  return out;
}

uint64_t SqliteRepository::CountCandidates(Transaction& t, const CandidateFilter& filter) {
  auto* db = TX(t).Handle();
  auto  st = PrepareOrThrow(db, sql::COUNT_CANDIDATES);

  BindOptText(st.get(), 1, filter.type);
  BindOptInt(st.get(), 2, filter.split);
  BindOptInt(st.get(), 3, filter.document_id);

  int rc = sqlite3_step(st.get());
  ThrowIfStepFailed(db, rc);
  return rc == SQLITE_ROW ? static_cast<uint64_t>(ColI64(st.get(), 0)) : 0;
}

Result SqliteRepository::DeleteCandidates(Transaction& t, const CandidateFilter& filter) {
  auto* db = TX(t).Handle();

  auto st = Prepare(db, sql::DELETE_CANDIDATES);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindOptText(st.get(), 1, filter.type);
  BindOptInt(st.get(), 2, filter.split);
  BindOptInt(st.get(), 3, filter.document_id);

  return Translate(db, sqlite3_step(st.get()));
}

} // namespace relgen::db::sqlite
