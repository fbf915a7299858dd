#pragma once

#include <string>
#include <vector>

namespace relgen::db::sql {

/*
  Bootstrap DDL per backend.

  candidate.arguments is the canonical comma-joined list of argument
  mention ids in role order; UNIQUE(type, split, arguments) turns a
  racing duplicate insert into an ignored write.

  candidate_argument carries the foreign keys: deleting a mention
  removes its argument rows, and the repository removes the owning
  candidates in the same statement batch.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS document (id INTEGER PRIMARY KEY AUTOINCREMENT, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sentence (id INTEGER PRIMARY KEY AUTOINCREMENT, document_id INTEGER NOT NULL REFERENCES document(id) ON DELETE CASCADE, "
      "position INTEGER NOT NULL, text TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sentence_token (sentence_id INTEGER NOT NULL REFERENCES sentence(id) ON DELETE CASCADE, position INTEGER NOT NULL, "
      "word TEXT NOT NULL, char_offset INTEGER NOT NULL, PRIMARY KEY (sentence_id, position));",
      "CREATE TABLE IF NOT EXISTS mention (id INTEGER PRIMARY KEY AUTOINCREMENT, type TEXT NOT NULL, document_id INTEGER NOT NULL REFERENCES document(id) ON DELETE CASCADE, "
      "sentence_id INTEGER NOT NULL, char_start INTEGER NOT NULL, char_end INTEGER NOT NULL, UNIQUE(type, sentence_id, char_start, char_end));",
      "CREATE INDEX IF NOT EXISTS mention_by_document ON mention(type, document_id, id);",
      "CREATE TABLE IF NOT EXISTS candidate (id INTEGER PRIMARY KEY AUTOINCREMENT, type TEXT NOT NULL, split INTEGER NOT NULL, "
      "document_id INTEGER NOT NULL REFERENCES document(id) ON DELETE CASCADE, arguments TEXT NOT NULL, UNIQUE(type, split, arguments));",
      "CREATE INDEX IF NOT EXISTS candidate_by_document ON candidate(type, split, document_id);",
      "CREATE TABLE IF NOT EXISTS candidate_argument (candidate_id INTEGER NOT NULL REFERENCES candidate(id) ON DELETE CASCADE, position INTEGER NOT NULL, "
      "mention_id INTEGER NOT NULL REFERENCES mention(id) ON DELETE CASCADE, PRIMARY KEY (candidate_id, position));",
      "CREATE INDEX IF NOT EXISTS candidate_argument_by_mention ON candidate_argument(mention_id);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS document (id BIGSERIAL PRIMARY KEY, name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sentence (id BIGSERIAL PRIMARY KEY, document_id BIGINT NOT NULL REFERENCES document(id) ON DELETE CASCADE, "
      "position INTEGER NOT NULL, text TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS sentence_token (sentence_id BIGINT NOT NULL REFERENCES sentence(id) ON DELETE CASCADE, position INTEGER NOT NULL, "
      "word TEXT NOT NULL, char_offset BIGINT NOT NULL, PRIMARY KEY (sentence_id, position));",
      "CREATE TABLE IF NOT EXISTS mention (id BIGSERIAL PRIMARY KEY, type TEXT NOT NULL, document_id BIGINT NOT NULL REFERENCES document(id) ON DELETE CASCADE, "
      "sentence_id BIGINT NOT NULL, char_start BIGINT NOT NULL, char_end BIGINT NOT NULL, UNIQUE(type, sentence_id, char_start, char_end));",
      "CREATE INDEX IF NOT EXISTS mention_by_document ON mention(type, document_id, id);",
      "CREATE TABLE IF NOT EXISTS candidate (id BIGSERIAL PRIMARY KEY, type TEXT NOT NULL, split INTEGER NOT NULL, "
      "document_id BIGINT NOT NULL REFERENCES document(id) ON DELETE CASCADE, arguments TEXT NOT NULL, UNIQUE(type, split, arguments));",
      "CREATE INDEX IF NOT EXISTS candidate_by_document ON candidate(type, split, document_id);",
      "CREATE TABLE IF NOT EXISTS candidate_argument (candidate_id BIGINT NOT NULL REFERENCES candidate(id) ON DELETE CASCADE, position INTEGER NOT NULL, "
      "mention_id BIGINT NOT NULL REFERENCES mention(id) ON DELETE CASCADE, PRIMARY KEY (candidate_id, position));",
      "CREATE INDEX IF NOT EXISTS candidate_argument_by_mention ON candidate_argument(mention_id);"};
  return kSchema;
}

} // namespace relgen::db::sql
