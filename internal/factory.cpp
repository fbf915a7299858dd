#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/extract/matchers.hpp"
#include "internal/extract/ngrams.hpp"
#include "internal/extract/throttlers.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#if RELGEN_DB_SQLITE
#include "internal/db/sqlite/sqlite_pool.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RELGEN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace relgen::factory {

using namespace relgen::runtime::config;

namespace {

constexpr std::size_t kDefaultNgramMax = 5;

#if RELGEN_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqlitePool>& pool) {
  // ":memory:" keeps one pooled connection, so the schema lands where transactions run.
  auto conn = pool->Acquire();
  for (const auto& sql : db::sql::SqliteSchema()) {
    conn->Exec(sql);
  }
  conn->Exec("SELECT id,name FROM document LIMIT 1;");
  conn->Exec("SELECT id,type,document_id,sentence_id,char_start,char_end FROM mention LIMIT 1;");
  conn->Exec("SELECT id,type,split,document_id,arguments FROM candidate LIMIT 1;");
}
#endif

#if RELGEN_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }
  tx.exec("SELECT id,name FROM document LIMIT 1;");
  tx.exec("SELECT id,type,document_id,sentence_id,char_start,char_end FROM mention LIMIT 1;");
  tx.exec("SELECT id,type,split,document_id,arguments FROM candidate LIMIT 1;");
  tx.commit();
}
#endif

std::shared_ptr<const extract::MentionSpace> BuildMentionSpace(const MentionConfig& mention) {
  const auto& ngrams = mention.ngrams();
  std::size_t n_max  = ngrams.n_max() == 0 ? kDefaultNgramMax : ngrams.n_max();
  if (ngrams.split_tokens_size() == 0) return std::make_shared<extract::Ngrams>(n_max);

  std::vector<std::string> tokens(ngrams.split_tokens().begin(), ngrams.split_tokens().end());
  return std::make_shared<extract::Ngrams>(n_max, std::move(tokens));
}

extract::MatcherPtr BuildMatcher(const MentionConfig& mention) {
  const auto& config = mention.matcher();

  std::shared_ptr<extract::Matcher> matcher;
  switch (config.kind_case()) {
    case MatcherConfig::kRegex:
      if (config.regex().pattern().empty()) throw util::ConfigurationError("mention " + mention.type() + ": empty regex pattern");
      matcher = std::make_shared<extract::RegexMatcher>(config.regex().pattern(), config.regex().ignore_case(), config.regex().full_match());
      break;
    case MatcherConfig::kDictionary: {
      std::vector<std::string> terms(config.dictionary().terms().begin(), config.dictionary().terms().end());
      if (terms.empty()) throw util::ConfigurationError("mention " + mention.type() + ": empty dictionary");
      matcher = std::make_shared<extract::DictionaryMatcher>(terms, config.dictionary().ignore_case());
      break;
    }
    case MatcherConfig::KIND_NOT_SET:
      throw util::ConfigurationError("mention " + mention.type() + ": matcher kind not set");
  }

  if (config.has_longest_match_only()) matcher->SetLongestMatchOnly(config.longest_match_only());
  return matcher;
}

extract::ThrottlerPtr BuildThrottler(const RelationConfig& relation) {
  if (!relation.has_throttler()) return nullptr;

  const auto& config = relation.throttler();
  switch (config.kind_case()) {
    case ThrottlerConfig::kSameSentence:
      return std::make_shared<extract::SameSentenceThrottler>();
    case ThrottlerConfig::kOrdered:
      return std::make_shared<extract::OrderedThrottler>();
    case ThrottlerConfig::kMaxCharDistance:
      return std::make_shared<extract::MaxCharDistanceThrottler>(static_cast<int64_t>(config.max_char_distance().max_chars()));
    case ThrottlerConfig::KIND_NOT_SET:
      break;
  }
  throw util::ConfigurationError("relation " + relation.name() + ": throttler kind not set");
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RELGEN_DB_SQLITE
    const auto& sqlite          = database.sqlite();
    const auto  path            = sqlite.path().empty() ? std::string(":memory:") : sqlite.path();
    const auto  max_connections = sqlite.max_connections() == 0 ? 8 : sqlite.max_connections();
    const auto  busy_timeout_ms = sqlite.busy_timeout_ms() == 0 ? 30000 : sqlite.busy_timeout_ms();

    auto pool = std::make_shared<db::sqlite::SqlitePool>(path, max_connections, static_cast<int>(busy_timeout_ms));
    BootstrapSqliteSchema(pool);
    RELGEN_LOG_INFO("sqlite store ready", {observability::StringField("path", path)});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(pool));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RELGEN_DB_POSTGRES
    const auto& postgres        = database.postgres();
    const auto  max_connections = postgres.max_connections() == 0 ? 16 : postgres.max_connections();

    auto pool = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
    BootstrapPostgresSchema(pool);
    RELGEN_LOG_INFO("postgres store ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  RELGEN_LOG_INFO("in-memory store ready");
  return std::make_shared<db::memory::MemoryRepository>();
}

model::FilterPolicy BuildFilterPolicy(const FilterConfig& config) {
  model::FilterPolicy policy;
  if (config.has_self_relations()) policy.self_relations = config.self_relations();
  if (config.has_nested_relations()) policy.nested_relations = config.nested_relations();
  if (config.has_symmetric_relations()) policy.symmetric_relations = config.symmetric_relations();
  return policy;
}

std::unique_ptr<core::MentionExtractor> BuildMentionExtractor(const ExtractionConfig& config, std::shared_ptr<db::Repository> repository) {
  if (config.mentions_size() == 0) return nullptr;

  std::vector<std::string>                                  types;
  std::vector<std::shared_ptr<const extract::MentionSpace>> spaces;
  std::vector<extract::MatcherPtr>                          matchers;
  for (const auto& mention : config.mentions()) {
    types.push_back(mention.type());
    spaces.push_back(BuildMentionSpace(mention));
    matchers.push_back(BuildMatcher(mention));
  }

  return std::make_unique<core::MentionExtractor>(std::move(repository), std::move(types), std::move(spaces), std::move(matchers));
}

std::unique_ptr<core::CandidateExtractor> BuildCandidateExtractor(const ExtractionConfig& config, std::shared_ptr<db::Repository> repository) {
  if (config.relations_size() == 0) return nullptr;

  std::vector<model::RelationSchema> schemas;
  std::vector<extract::ThrottlerPtr> throttlers;
  for (const auto& relation : config.relations()) {
    model::RelationSchema schema;
    schema.name = relation.name();
    for (const auto& argument : relation.arguments()) {
      if (argument.mention_type().empty()) {
        throw util::ConfigurationError("relation " + relation.name() + ": argument " + argument.name() + " has no mention_type");
      }
      schema.argument_names.push_back(argument.name());
      schema.mention_types.push_back(argument.mention_type());
    }
    schemas.push_back(std::move(schema));
    throttlers.push_back(BuildThrottler(relation));
  }

  return std::make_unique<core::CandidateExtractor>(std::move(repository), std::move(schemas), std::move(throttlers),
                                                    BuildFilterPolicy(config.filters()));
}

Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Extractors
  // ------------------------------------------------------------------
  app.mention_extractor   = BuildMentionExtractor(config.extraction(), app.repository);
  app.candidate_extractor = BuildCandidateExtractor(config.extraction(), app.repository);

  return app;
}

} // namespace relgen::factory
