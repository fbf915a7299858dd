#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/candidate_extractor.hpp"
#include "internal/core/mention_extractor.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/factory.hpp"
#include "tests/support/test_corpus.hpp"

#if RELGEN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace {

using relgen::db::CandidateFilter;
using relgen::db::ErrorCode;
using relgen::db::MentionFilter;
using relgen::db::Repository;
using relgen::db::model::CandidateRecord;
using relgen::db::model::DocumentRecord;
using relgen::db::model::MentionRecord;
using relgen::model::Span;
using namespace relgen::testing;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  std::size_t                                       parallelism = 4;
  // two open write transactions on one thread do not block each other
  bool                                              interleaved_writers = false;
};

void VerifyDocumentsAndSentences(Repository& repo, const std::string& prefix) {
  auto tx = repo.Begin();

  DocumentRecord doc;
  doc.name = prefix + "-doc";
  assert(repo.InsertDocument(*tx, doc));
  assert(doc.id != 0);

  // inserted out of order, read back by position
  auto second = MakeSentence(doc.id, 1, "Second sentence here");
  auto first  = MakeSentence(doc.id, 0, "First one");
  assert(repo.InsertSentence(*tx, second));
  assert(repo.InsertSentence(*tx, first));

  auto sentences = repo.ListSentences(*tx, doc.id);
  assert(sentences.size() == 2);
  assert(sentences[0].text == "First one");
  assert(sentences[1].words.size() == 3);
  assert(sentences[1].words[2] == "here");
  assert(sentences[1].char_offsets[2] == 16);

  auto read = repo.GetDocument(*tx, doc.id);
  assert(read.has_value());
  assert(read->name == doc.name);
  assert(!repo.GetDocument(*tx, doc.id + 100000).has_value());

  tx->Commit();
}

void VerifyMentionInsertOrIgnore(Repository& repo, const std::string& prefix) {
  auto doc      = AddDocument(repo, prefix + "-mentions");
  auto sentence = AddSentence(repo, doc.id, 0, "Alice met Bob");

  auto tx = repo.Begin();

  MentionRecord alice{0, "person", doc.id, Span{sentence.id, 0, 5}};
  MentionRecord bob{0, "person", doc.id, Span{sentence.id, 10, 13}};
  assert(repo.InsertMention(*tx, alice));
  assert(repo.InsertMention(*tx, bob));
  assert(alice.id != 0 && alice.id < bob.id);

  MentionRecord duplicate{0, "person", doc.id, Span{sentence.id, 0, 5}};
  auto          again = repo.InsertMention(*tx, duplicate);
  assert(!again);
  assert(again.code == ErrorCode::AlreadyExists);

  // same span under another type is a different mention
  MentionRecord as_org{0, "org", doc.id, Span{sentence.id, 0, 5}};
  assert(repo.InsertMention(*tx, as_org));

  assert(repo.FindMention(*tx, "person", Span{sentence.id, 0, 5}) == alice.id);
  assert(!repo.FindMention(*tx, "person", Span{sentence.id, 0, 4}).has_value());

  MentionFilter people;
  people.type        = "person";
  people.document_id = doc.id;
  auto listed        = repo.ListMentions(*tx, people);
  assert(listed.size() == 2);
  assert(listed[0].id == alice.id);
  assert(listed[1].span == bob.span);
  assert(repo.CountMentions(*tx, people) == 2);

  MentionFilter in_document;
  in_document.document_id = doc.id;
  assert(repo.CountMentions(*tx, in_document) == 3);

  tx->Commit();
}

void VerifyCandidateInsertOrIgnore(Repository& repo, const std::string& prefix) {
  auto doc      = AddDocument(repo, prefix + "-candidates");
  auto sentence = AddSentence(repo, doc.id, 0, "Alice met Bob");
  auto alice    = AddMention(repo, "person", doc.id, sentence.id, 0, 5);
  auto bob      = AddMention(repo, "person", doc.id, sentence.id, 10, 13);

  auto tx = repo.Begin();

  CandidateRecord meets{0, "Meets", 0, doc.id, {alice.id, bob.id}};
  assert(repo.InsertCandidate(*tx, meets));
  assert(meets.id != 0);

  CandidateRecord duplicate{0, "Meets", 0, doc.id, {alice.id, bob.id}};
  auto            again = repo.InsertCandidate(*tx, duplicate);
  assert(again.code == ErrorCode::AlreadyExists);

  // reversed roles and another split are distinct rows
  CandidateRecord reversed{0, "Meets", 0, doc.id, {bob.id, alice.id}};
  CandidateRecord dev{0, "Meets", 1, doc.id, {alice.id, bob.id}};
  assert(repo.InsertCandidate(*tx, reversed));
  assert(repo.InsertCandidate(*tx, dev));

  assert(repo.FindCandidate(*tx, "Meets", 0, {alice.id, bob.id}) == meets.id);
  assert(!repo.FindCandidate(*tx, "Meets", 2, {alice.id, bob.id}).has_value());

  CandidateFilter train;
  train.type        = "Meets";
  train.split       = 0;
  train.document_id = doc.id;
  assert(repo.CountCandidates(*tx, train) == 2);

  auto listed = repo.ListCandidates(*tx, train);
  assert(listed.size() == 2);
  assert(listed[0].id == meets.id);
  assert((listed[1].mention_ids == std::vector<int64_t>{bob.id, alice.id}));

  tx->Commit();
}

// Writers racing on the same (type, split, arguments) all succeed and leave one row.
void VerifyConcurrentCandidateInsert(Repository& repo, const std::string& prefix) {
  auto doc      = AddDocument(repo, prefix + "-race");
  auto sentence = AddSentence(repo, doc.id, 0, "Alice met Bob");
  auto alice    = AddMention(repo, "person", doc.id, sentence.id, 0, 5);
  auto bob      = AddMention(repo, "person", doc.id, sentence.id, 10, 13);

  constexpr int     kWriters = 4;
  std::atomic<bool> go{false};
  std::atomic<int>  inserted{0};
  std::atomic<int>  duplicates{0};
  std::atomic<int>  errors{0};

  std::vector<std::thread> writers;
  for (int i = 0; i < kWriters; ++i) {
    writers.emplace_back([&] {
      while (!go) std::this_thread::yield();
      try {
        auto            tx = repo.Begin();
        CandidateRecord candidate{0, "Meets", 5, doc.id, {alice.id, bob.id}};
        auto            result = repo.InsertCandidate(*tx, candidate);
        if (result) {
          ++inserted;
        } else if (result.IsDuplicate()) {
          ++duplicates;
        } else {
          ++errors;
        }
        tx->Commit();
      } catch (const std::exception&) {
        ++errors;
      }
    });
  }
  go = true;
  for (auto& writer : writers) writer.join();

  assert(errors == 0);
  assert(inserted + duplicates == kWriters);
  assert(inserted >= 1);

  CandidateFilter raced;
  raced.type        = "Meets";
  raced.split       = 5;
  raced.document_id = doc.id;
  auto tx           = repo.Begin();
  assert(repo.CountCandidates(*tx, raced) == 1);
  tx->Commit();
}

// Both transactions see their own insert succeed; the second commit drops its copy.
void VerifyInterleavedCandidateInsert(Repository& repo, const std::string& prefix) {
  auto doc      = AddDocument(repo, prefix + "-interleaved");
  auto sentence = AddSentence(repo, doc.id, 0, "Alice met Bob");
  auto alice    = AddMention(repo, "person", doc.id, sentence.id, 0, 5);
  auto bob      = AddMention(repo, "person", doc.id, sentence.id, 10, 13);

  auto first  = repo.Begin();
  auto second = repo.Begin();

  CandidateRecord a{0, "Meets", 6, doc.id, {alice.id, bob.id}};
  CandidateRecord b{0, "Meets", 6, doc.id, {alice.id, bob.id}};
  assert(repo.InsertCandidate(*first, a));
  assert(repo.InsertCandidate(*second, b));

  first->Commit();
  second->Commit();
  assert(second->IsCommitted());

  CandidateFilter interleaved;
  interleaved.type        = "Meets";
  interleaved.split       = 6;
  interleaved.document_id = doc.id;
  auto tx                 = repo.Begin();
  assert(repo.CountCandidates(*tx, interleaved) == 1);
  assert(repo.FindCandidate(*tx, "Meets", 6, {alice.id, bob.id}) == a.id);
  tx->Commit();
}

void VerifyDeleteCascades(Repository& repo, const std::string& prefix) {
  auto doc      = AddDocument(repo, prefix + "-cascade");
  auto sentence = AddSentence(repo, doc.id, 0, "Alice joined Acme");
  auto alice    = AddMention(repo, "person", doc.id, sentence.id, 0, 5);
  auto acme     = AddMention(repo, "org", doc.id, sentence.id, 13, 17);
  auto alias    = AddMention(repo, "alias", doc.id, sentence.id, 0, 5);

  {
    auto            tx = repo.Begin();
    CandidateRecord works{0, "WorksAt", 0, doc.id, {alice.id, acme.id}};
    CandidateRecord known{0, "KnownAs", 0, doc.id, {alice.id, alias.id}};
    assert(repo.InsertCandidate(*tx, works));
    assert(repo.InsertCandidate(*tx, known));
    tx->Commit();
  }

  CandidateFilter in_doc;
  in_doc.document_id = doc.id;

  // deleting candidates never touches mentions
  {
    auto            tx = repo.Begin();
    CandidateFilter known;
    known.type        = "KnownAs";
    known.document_id = doc.id;
    assert(repo.DeleteCandidates(*tx, known));
    MentionFilter mentions;
    mentions.document_id = doc.id;
    assert(repo.ListMentions(*tx, mentions).size() == 3);
    assert(repo.CountCandidates(*tx, in_doc) == 1);
    tx->Commit();
  }

  // deleting a mention removes the candidates referencing it
  {
    auto          tx = repo.Begin();
    MentionFilter orgs;
    orgs.type        = "org";
    orgs.document_id = doc.id;
    assert(repo.DeleteMentions(*tx, orgs));
    assert(repo.CountCandidates(*tx, in_doc) == 0);
    assert(!repo.FindMention(*tx, "org", acme.span).has_value());
    assert(repo.FindMention(*tx, "person", alice.span).has_value());
    tx->Commit();
  }
}

void VerifyRollbackBehavior(Repository& repo, const std::string& prefix) {
  auto doc      = AddDocument(repo, prefix + "-rollback");
  auto sentence = AddSentence(repo, doc.id, 0, "Alice");

  {
    auto          tx = repo.Begin();
    MentionRecord m{0, "person", doc.id, Span{sentence.id, 0, 5}};
    assert(repo.InsertMention(*tx, m));
    tx->Rollback();
    tx->Rollback();
    assert(!tx->IsOpen());
    assert(!tx->IsCommitted());

    bool commit_rejected = false;
    try {
      tx->Commit();
    } catch (const std::runtime_error&) {
      commit_rejected = true;
    }
    assert(commit_rejected);
  }
  {
    auto          tx = repo.Begin();
    MentionRecord m{0, "person", doc.id, Span{sentence.id, 0, 5}};
    assert(repo.InsertMention(*tx, m));
    // destroyed without commit
  }

  auto tx = repo.Begin();
  assert(!repo.FindMention(*tx, "person", Span{sentence.id, 0, 5}).has_value());
  tx->Commit();
  assert(tx->IsCommitted());
  // rollback after commit changes nothing
  tx->Rollback();
  assert(tx->IsCommitted());
}

std::vector<DocumentRecord> SeedNews(Repository& repo, const std::string& prefix, int documents) {
  std::vector<DocumentRecord> out;
  for (int i = 0; i < documents; ++i) {
    auto doc = AddDocument(repo, prefix + "-news-" + std::to_string(i));
    AddSentence(repo, doc.id, 0, "Barack Obama visited Paris and Berlin");
    AddSentence(repo, doc.id, 1, "Angela Merkel met Barack Obama in Berlin");
    out.push_back(doc);
  }
  return out;
}

void VerifyExtractionEndToEnd(const std::shared_ptr<Repository>& repo, const std::string& prefix, std::size_t parallelism) {
  auto documents = SeedNews(*repo, prefix, 6);

  auto space = std::make_shared<relgen::extract::Ngrams>(3);
  relgen::core::MentionExtractor mentions(
      repo, {"person", "city"}, {space, space},
      {std::make_shared<relgen::extract::DictionaryMatcher>(std::vector<std::string>{"Barack Obama", "Angela Merkel"}, false),
       std::make_shared<relgen::extract::RegexMatcher>("Paris|Berlin")});

  auto mention_report = mentions.Apply(documents, true, parallelism);
  assert(mention_report.Ok());
  // per document: 3 people and 3 cities
  assert(mention_report.records_written == 6 * 6);

  const relgen::model::RelationSchema visits{"Visits", {"who", "where"}, {"person", "city"}};
  relgen::core::CandidateExtractor    candidates(repo, {visits}, std::vector<relgen::extract::ThrottlerPtr>{
                                                              std::make_shared<relgen::extract::SameSentenceThrottler>()});

  auto first = candidates.Apply(documents, 3, false, parallelism);
  assert(first.Ok());
  // sentence 0: 1 person x 2 cities, sentence 1: 2 people x 1 city
  assert(first.records_written == 6 * 4);

  auto rerun = candidates.Apply(documents, 3, false, parallelism);
  assert(rerun.records_written == 0);

  auto per_schema = candidates.GetCandidates(documents, 3, true);
  assert(per_schema[0].size() == 6 * 4);

  candidates.Clear(3);
  assert(candidates.GetCandidates(documents, 3)[0].empty());

  auto regenerated = candidates.Apply(documents, 3, true, parallelism);
  assert(regenerated.records_written == 6 * 4);

  // re-extracting mentions with clear cascades away their candidates
  (void)mentions.Apply(documents, true, parallelism);
  assert(candidates.GetCandidates(documents, 3)[0].empty());
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo     = backend.make_repository();
  auto doc      = AddDocument(*repo, prefix + "-durable");
  auto sentence = AddSentence(*repo, doc.id, 0, "Alice met Bob");
  auto alice    = AddMention(*repo, "person", doc.id, sentence.id, 0, 5);
  auto bob      = AddMention(*repo, "person", doc.id, sentence.id, 10, 13);
  {
    auto            tx = repo->Begin();
    CandidateRecord meets{0, "Meets", 7, doc.id, {alice.id, bob.id}};
    assert(repo->InsertCandidate(*tx, meets));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetDocument(*tx, doc.id).has_value());
  assert(repo->ListSentences(*tx, doc.id)[0].words.size() == 3);
  assert(repo->FindCandidate(*tx, "Meets", 7, {alice.id, bob.id}).has_value());
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  relgen::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_memory();

  return BackendFactory{
      .name             = "memory",
      .make_repository  = [config]() { return relgen::factory::BuildRepository(config); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup             = []() {},
      .parallelism         = 4,
      .interleaved_writers = true,
  };
}

#if RELGEN_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("relgen_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  relgen::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);
  config.mutable_database()->mutable_sqlite()->set_max_connections(4);

  auto make_repo = [config]() { return relgen::factory::BuildRepository(config); };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .parallelism = 3,
  };
}
#endif

#if RELGEN_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RELGEN_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RELGEN_TEST_POSTGRES_URI is not set");
  }

  relgen::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_postgres()->set_connection_uri(uri);

  auto make_repo = [config]() { return relgen::factory::BuildRepository(config); };

  // start from empty tables
  auto repo = make_repo();
  {
    auto       pool = std::make_shared<relgen::db::postgres::PgPool>(uri, 1);
    auto       conn = pool->Acquire();
    pqxx::work tx(*conn);
    tx.exec("TRUNCATE candidate_argument, candidate, mention, sentence_token, sentence, document RESTART IDENTITY CASCADE;");
    tx.commit();
  }

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
      .parallelism      = 4,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyDocumentsAndSentences(*repo, backend.name);
  VerifyMentionInsertOrIgnore(*repo, backend.name);
  VerifyCandidateInsertOrIgnore(*repo, backend.name);
  VerifyConcurrentCandidateInsert(*repo, backend.name);
  if (backend.interleaved_writers) VerifyInterleavedCandidateInsert(*repo, backend.name);
  VerifyDeleteCascades(*repo, backend.name);
  VerifyRollbackBehavior(*repo, backend.name);
  VerifyExtractionEndToEnd(repo, backend.name, 1);
  VerifyExtractionEndToEnd(repo, backend.name + "-parallel", backend.parallelism);

  VerifyRestartDurability(backend, backend.name);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RELGEN_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RELGEN_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "relgen_integration_repository_parity: pass\n";
  return 0;
}
