#pragma once

namespace relgen::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres binds the same shapes with $n placeholders.
*/

// documents

static constexpr const char* INSERT_DOCUMENT    = "INSERT INTO document(name) VALUES(?);";
static constexpr const char* INSERT_DOCUMENT_ID = "INSERT INTO document(id,name) VALUES(?,?);";
static constexpr const char* SELECT_DOCUMENT    = "SELECT id,name FROM document WHERE id=?;";
static constexpr const char* LIST_DOCUMENTS     = "SELECT id,name FROM document ORDER BY id;";

// sentences

static constexpr const char* INSERT_SENTENCE =
    "INSERT INTO sentence(document_id,position,text) VALUES(?,?,?);";

static constexpr const char* INSERT_SENTENCE_ID =
    "INSERT INTO sentence(id,document_id,position,text) VALUES(?,?,?,?);";

static constexpr const char* INSERT_SENTENCE_TOKEN =
    "INSERT INTO sentence_token(sentence_id,position,word,char_offset) VALUES(?,?,?,?);";

static constexpr const char* LIST_SENTENCES =
    "SELECT id,document_id,position,text FROM sentence WHERE document_id=? ORDER BY position, id;";

static constexpr const char* LIST_SENTENCE_TOKENS =
    "SELECT word,char_offset FROM sentence_token WHERE sentence_id=? ORDER BY position;";

// mentions

static constexpr const char* INSERT_MENTION =
    "INSERT INTO mention(type,document_id,sentence_id,char_start,char_end) VALUES(?,?,?,?,?)"
    " ON CONFLICT(type,sentence_id,char_start,char_end) DO NOTHING;";

static constexpr const char* SELECT_MENTION_ID =
    "SELECT id FROM mention WHERE type=? AND sentence_id=? AND char_start=? AND char_end=?;";

static constexpr const char* SELECT_MENTIONS =
    "SELECT id,type,document_id,sentence_id,char_start,char_end FROM mention"
    " WHERE (?1 IS NULL OR type=?1) AND (?2 IS NULL OR document_id=?2) ORDER BY id;";

static constexpr const char* COUNT_MENTIONS =
    "SELECT COUNT(*) FROM mention WHERE (?1 IS NULL OR type=?1) AND (?2 IS NULL OR document_id=?2);";

static constexpr const char* DELETE_MENTION_CANDIDATES =
    "DELETE FROM candidate WHERE id IN (SELECT a.candidate_id FROM candidate_argument a JOIN mention m ON m.id=a.mention_id"
    " WHERE (?1 IS NULL OR m.type=?1) AND (?2 IS NULL OR m.document_id=?2));";

static constexpr const char* DELETE_MENTIONS =
    "DELETE FROM mention WHERE (?1 IS NULL OR type=?1) AND (?2 IS NULL OR document_id=?2);";

// candidates

static constexpr const char* INSERT_CANDIDATE =
    "INSERT INTO candidate(type,split,document_id,arguments) VALUES(?,?,?,?)"
    " ON CONFLICT(type,split,arguments) DO NOTHING;";

static constexpr const char* INSERT_CANDIDATE_ARGUMENT =
    "INSERT INTO candidate_argument(candidate_id,position,mention_id) VALUES(?,?,?);";

static constexpr const char* SELECT_CANDIDATE_ID =
    "SELECT id FROM candidate WHERE type=? AND split=? AND arguments=?;";

static constexpr const char* SELECT_CANDIDATES =
    "SELECT id,type,split,document_id,arguments FROM candidate"
    " WHERE (?1 IS NULL OR type=?1) AND (?2 IS NULL OR split=?2) AND (?3 IS NULL OR document_id=?3) ORDER BY id;";

static constexpr const char* COUNT_CANDIDATES =
    "SELECT COUNT(*) FROM candidate"
    " WHERE (?1 IS NULL OR type=?1) AND (?2 IS NULL OR split=?2) AND (?3 IS NULL OR document_id=?3);";

static constexpr const char* DELETE_CANDIDATES =
    "DELETE FROM candidate"
    " WHERE (?1 IS NULL OR type=?1) AND (?2 IS NULL OR split=?2) AND (?3 IS NULL OR document_id=?3);";

}
