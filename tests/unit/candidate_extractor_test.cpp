#include "internal/core/candidate_extractor.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <tuple>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/extract/throttlers.hpp"
#include "internal/util/errors.hpp"
#include "tests/support/test_corpus.hpp"

namespace {

using relgen::core::CandidateExtractor;
using relgen::db::memory::MemoryRepository;
using relgen::db::model::CandidateRecord;
using relgen::db::model::DocumentRecord;
using relgen::extract::LambdaThrottler;
using relgen::extract::MentionTuple;
using relgen::extract::ThrottlerPtr;
using relgen::model::FilterPolicy;
using relgen::model::RelationSchema;
using namespace relgen::testing;

const RelationSchema kMeets{"Meets", {"a", "b"}, {"person", "person"}};
const RelationSchema kWorksAt{"WorksAt", {"person", "org"}, {"person", "org"}};

struct Corpus {
  std::shared_ptr<MemoryRepository> repo = std::make_shared<MemoryRepository>();
  std::vector<DocumentRecord>       documents;
};

// Per document: two people and one organization in one sentence.
Corpus MakeCorpus(int documents) {
  Corpus corpus;
  for (int i = 0; i < documents; ++i) {
    auto doc      = AddDocument(*corpus.repo, "doc-" + std::to_string(i));
    auto sentence = AddSentence(*corpus.repo, doc.id, 0, "Alice and Bob joined Acme");
    AddMention(*corpus.repo, "person", doc.id, sentence.id, 0, 5);
    AddMention(*corpus.repo, "person", doc.id, sentence.id, 10, 13);
    AddMention(*corpus.repo, "org", doc.id, sentence.id, 21, 25);
    corpus.documents.push_back(doc);
  }
  return corpus;
}

// Candidate content independent of ids: (type, split, "doc:type@start-end,...").
using Content = std::set<std::tuple<std::string, int32_t, std::string>>;

Content ContentOf(MemoryRepository& repo, int32_t split) {
  auto tx = repo.Begin();

  std::map<int64_t, std::string> names;
  for (const auto& doc : repo.ListDocuments(*tx)) names[doc.id] = doc.name;

  std::map<int64_t, std::string> mentions;
  for (const auto& m : repo.ListMentions(*tx, relgen::db::MentionFilter{})) {
    mentions[m.id] = m.type + "@" + std::to_string(m.span.char_start) + "-" + std::to_string(m.span.char_end);
  }

  relgen::db::CandidateFilter filter;
  filter.split = split;

  Content content;
  for (const auto& c : repo.ListCandidates(*tx, filter)) {
    std::string arguments = names[c.document_id] + ":";
    for (auto id : c.mention_ids) arguments += mentions[id] + ",";
    content.emplace(c.type, c.split, arguments);
  }
  tx->Rollback();
  return content;
}

template <typename Fn>
bool ThrowsConfigurationError(Fn fn) {
  try {
    fn();
  } catch (const relgen::util::ConfigurationError&) {
    return true;
  }
  return false;
}

void TestConstructionValidation() {
  auto repo = std::make_shared<MemoryRepository>();

  // N schemas, M != N throttlers
  assert(ThrowsConfigurationError([&] {
    CandidateExtractor extractor(repo, {kMeets, kWorksAt}, std::vector<ThrottlerPtr>{nullptr});
  }));

  // argument names vs mention sources
  assert(ThrowsConfigurationError([&] {
    CandidateExtractor extractor(repo, {RelationSchema{"Broken", {"a", "b"}, {"person"}}});
  }));

  assert(ThrowsConfigurationError([&] { CandidateExtractor extractor(repo, {RelationSchema{"Empty", {}, {}}}); }));
  assert(ThrowsConfigurationError([&] { CandidateExtractor extractor(repo, {kMeets, kMeets}); }));

  CandidateExtractor ok(repo, {kMeets, kWorksAt}, std::vector<ThrottlerPtr>{nullptr, nullptr});
  CandidateExtractor defaults(repo, {kMeets, kWorksAt});
  assert(defaults.Schemas().size() == 2);
}

void TestFailsBeforeTouchingDocuments() {
  auto corpus = MakeCorpus(2);
  bool threw  = ThrowsConfigurationError([&] {
    CandidateExtractor extractor(corpus.repo, {kMeets}, std::vector<ThrottlerPtr>{nullptr, nullptr});
    (void)extractor.Apply(corpus.documents);
  });
  assert(threw);
  assert(CountCandidates(*corpus.repo) == 0);
}

void TestApplyWithDefaultPolicy() {
  auto               corpus = MakeCorpus(3);
  CandidateExtractor extractor(corpus.repo, {kMeets, kWorksAt});

  auto report = extractor.Apply(corpus.documents, 0, true, 2);
  assert(report.Ok());
  assert(report.documents_processed == 3);

  // Meets: (Alice,Bob) and (Bob,Alice); WorksAt: (Alice,Acme), (Bob,Acme)
  assert(report.records_written == 3 * 4);

  auto per_schema = extractor.GetCandidates(std::nullopt, 0, true);
  assert(per_schema.size() == 2);
  assert(per_schema[0].size() == 6);
  assert(per_schema[1].size() == 6);
  for (std::size_t i = 1; i < per_schema[0].size(); ++i) assert(per_schema[0][i - 1].mention_ids < per_schema[0][i].mention_ids);

  auto first_doc = extractor.GetCandidates(std::vector<DocumentRecord>{corpus.documents[0]}, 0);
  assert(first_doc[0].size() == 2);
  assert(first_doc[1].size() == 2);
}

void TestSymmetricPolicyKeepsLowerIdFirst() {
  auto         corpus = MakeCorpus(1);
  FilterPolicy policy;
  policy.symmetric_relations = false;

  CandidateExtractor extractor(corpus.repo, {kMeets}, std::nullopt, policy);
  (void)extractor.Apply(corpus.documents);

  auto meets = extractor.GetCandidates(std::nullopt, 0)[0];
  assert(meets.size() == 1);
  assert(meets[0].mention_ids[0] < meets[0].mention_ids[1]);
}

void TestIncrementalApplyIsIdempotent() {
  auto               corpus = MakeCorpus(4);
  CandidateExtractor extractor(corpus.repo, {kMeets, kWorksAt});

  auto first = extractor.Apply(corpus.documents, 0, false, 1);
  const auto count = CountCandidates(*corpus.repo);

  auto second = extractor.Apply(corpus.documents, 0, false, 4);
  assert(second.Ok());
  assert(second.records_written == 0);
  assert(first.records_written == count);
  assert(CountCandidates(*corpus.repo) == count);
}

void TestClearThenApplyReproducesContent() {
  auto               fresh = MakeCorpus(3);
  CandidateExtractor once(fresh.repo, {kMeets, kWorksAt});
  (void)once.Apply(fresh.documents, 1);

  auto               rerun = MakeCorpus(3);
  CandidateExtractor twice(rerun.repo, {kMeets, kWorksAt});
  (void)twice.Apply(rerun.documents, 1);
  twice.Clear(1);
  assert(CountCandidates(*rerun.repo) == 0);
  (void)twice.Apply(rerun.documents, 1);

  assert(ContentOf(*fresh.repo, 1) == ContentOf(*rerun.repo, 1));

  // Apply with clear regenerates in place rather than duplicating.
  (void)twice.Apply(rerun.documents, 1, true, 3);
  assert(ContentOf(*fresh.repo, 1) == ContentOf(*rerun.repo, 1));
}

void TestClearIsScopedBySplitAndSchema() {
  auto               corpus = MakeCorpus(2);
  CandidateExtractor both(corpus.repo, {kMeets, kWorksAt});
  CandidateExtractor meets_only(corpus.repo, {kMeets});

  (void)both.Apply(corpus.documents, 0);
  (void)both.Apply(corpus.documents, 1);
  assert(CountCandidates(*corpus.repo) == 2 * 2 * 4);

  meets_only.Clear(0);
  relgen::db::CandidateFilter split0;
  split0.split = 0;
  relgen::db::CandidateFilter split1;
  split1.split = 1;
  assert(CountCandidates(*corpus.repo, split0) == 2 * 2);
  assert(CountCandidates(*corpus.repo, split1) == 2 * 4);

  meets_only.ClearAll(1);
  assert(CountCandidates(*corpus.repo, split1) == 0);
  assert(CountCandidates(*corpus.repo, split0) == 2 * 2);
}

void TestThrottlersPerSchema() {
  auto corpus = MakeCorpus(2);

  auto none = std::make_shared<LambdaThrottler>([](const MentionTuple&) { return false; });
  auto ordered = std::make_shared<relgen::extract::OrderedThrottler>();

  CandidateExtractor extractor(corpus.repo, {kMeets, kWorksAt}, std::vector<ThrottlerPtr>{ordered, none});
  auto               report = extractor.Apply(corpus.documents);

  auto per_schema = extractor.GetCandidates(std::nullopt, 0);
  assert(per_schema[0].size() == 2); // (Alice,Bob) only
  assert(per_schema[1].empty());
  assert(report.records_written == 2);
}

void TestParallelismDoesNotChangeContent() {
  auto a = MakeCorpus(10);
  auto b = MakeCorpus(10);

  CandidateExtractor sequential(a.repo, {kMeets, kWorksAt});
  CandidateExtractor parallel(b.repo, {kMeets, kWorksAt});
  (void)sequential.Apply(a.documents, 0, true, 1);
  (void)parallel.Apply(b.documents, 0, true, 4);

  assert(ContentOf(*a.repo, 0) == ContentOf(*b.repo, 0));
}

} // namespace

int main() {
  TestConstructionValidation();
  TestFailsBeforeTouchingDocuments();
  TestApplyWithDefaultPolicy();
  TestSymmetricPolicyKeepsLowerIdFirst();
  TestIncrementalApplyIsIdempotent();
  TestClearThenApplyReproducesContent();
  TestClearIsScopedBySplitAndSchema();
  TestThrottlersPerSchema();
  TestParallelismDoesNotChangeContent();

  std::cout << "relgen_unit_candidate_extractor: pass\n";
  return 0;
}
