#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/candidate_extractor.hpp"
#include "internal/core/mention_extractor.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/extract/matchers.hpp"
#include "internal/extract/ngrams.hpp"
#include "internal/extract/throttlers.hpp"

namespace {

// Whitespace tokenizer standing in for the NLP preprocessing step.
relgen::db::model::SentenceRecord Tokenize(int64_t document_id, int32_t position, const std::string& text) {
  relgen::db::model::SentenceRecord sentence;
  sentence.document_id = document_id;
  sentence.position    = position;
  sentence.text        = text;

  std::size_t pos = 0;
  while (pos < text.size()) {
    auto end = text.find(' ', pos);
    if (end == std::string::npos) end = text.size();
    if (end > pos) {
      sentence.words.push_back(text.substr(pos, end - pos));
      sentence.char_offsets.push_back(static_cast<int64_t>(pos));
    }
    pos = end + 1;
  }
  return sentence;
}

} // namespace

int main() {
  auto repository = std::make_shared<relgen::db::memory::MemoryRepository>();

  // Ingest a tiny corpus.
  const std::vector<std::vector<std::string>> corpus = {
      {"The BC547 transistor has a collector current of 100 mA", "Its maximum voltage is 45 V"},
      {"The 2N3904 is rated for 200 mA", "The 2N3904 handles 40 V"},
  };

  std::vector<relgen::db::model::DocumentRecord> documents;
  {
    auto tx = repository->Begin();
    for (std::size_t d = 0; d < corpus.size(); ++d) {
      relgen::db::model::DocumentRecord document;
      document.name = "datasheet-" + std::to_string(d);
      if (!repository->InsertDocument(*tx, document)) return 1;
      for (std::size_t s = 0; s < corpus[d].size(); ++s) {
        auto sentence = Tokenize(document.id, static_cast<int32_t>(s), corpus[d][s]);
        if (!repository->InsertSentence(*tx, sentence)) return 1;
      }
      documents.push_back(document);
    }
    tx->Commit();
  }

  // Mentions: part numbers and currents.
  auto space = std::make_shared<relgen::extract::Ngrams>(2);
  relgen::core::MentionExtractor mentions(
      repository, {"part", "current"}, {space, space},
      {std::make_shared<relgen::extract::RegexMatcher>("(BC|2N)[0-9]+"), std::make_shared<relgen::extract::RegexMatcher>("[0-9]+ mA")});

  auto mention_report = mentions.Apply(documents, true, 2);
  std::cout << "mentions written: " << mention_report.records_written << '\n';

  // Candidates: (part, current) pairs in the same sentence.
  const relgen::model::RelationSchema part_current{"PartCurrent", {"part", "current"}, {"part", "current"}};
  relgen::core::CandidateExtractor    candidates(repository, {part_current},
                                                 std::vector<relgen::extract::ThrottlerPtr>{std::make_shared<relgen::extract::SameSentenceThrottler>()});

  auto report = candidates.Apply(documents, 0, true, 2);
  std::cout << "candidates written: " << report.records_written << " over " << report.documents_processed << " documents\n";

  auto tx = repository->Begin();
  for (const auto& candidate : candidates.GetCandidates(std::nullopt, 0, true)[0]) {
    std::cout << candidate.type << "(";
    for (std::size_t i = 0; i < candidate.mention_ids.size(); ++i) {
      relgen::db::MentionFilter filter;
      filter.document_id = candidate.document_id;
      for (const auto& mention : repository->ListMentions(*tx, filter)) {
        if (mention.id != candidate.mention_ids[i]) continue;
        for (const auto& sentence : repository->ListSentences(*tx, candidate.document_id)) {
          if (sentence.id != mention.span.sentence_id) continue;
          std::cout << (i ? ", " : "") << sentence.text.substr(mention.span.char_start, mention.span.Length());
        }
      }
    }
    std::cout << ")\n";
  }
  tx->Rollback();

  return report.Ok() ? 0 : 1;
}
