#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "relgen_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

const char* kFullConfig = R"(logging:
  level: debug
database:
  sqlite:
    path: "C:\\relgen\\\"quoted\"\\db.sqlite"
    busy_timeout_ms: 5000
extraction:
  parallelism: 4
  split: 2
  clear: false
  filters:
    symmetric_relations: false
  mentions:
    - type: person
      ngrams:
        n_max: 3
      matcher:
        dictionary:
          terms: ["Barack Obama", "42"]
          ignore_case: true
    - type: year
      ngrams:
        n_max: 1
        split_tokens: ["-"]
      matcher:
        regex:
          pattern: "[0-9]{4}"
          full_match: true
        longest_match_only: false
  relations:
    - name: BornIn
      arguments:
        - name: who
          mention_type: person
        - name: when
          mention_type: year
      throttler:
        max_char_distance:
          max_chars: 40
)";

void TestLoadsExtractionSection() {
  const auto yaml_path = WriteYaml("full", kFullConfig);

  auto config = relgen::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.database().sqlite().path() == "C:\\relgen\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 5000);

  const auto& extraction = config.extraction();
  assert(extraction.parallelism() == 4);
  assert(extraction.split() == 2);
  assert(!extraction.clear());
  assert(extraction.mentions_size() == 2);
  assert(extraction.mentions(0).matcher().dictionary().terms(1) == "42");
  assert(extraction.mentions(1).matcher().has_longest_match_only());
  assert(extraction.relations(0).arguments_size() == 2);
  assert(extraction.relations(0).throttler().max_char_distance().max_chars() == 40);
}

void TestFilterPolicyDefaults() {
  auto config = relgen::config::ConfigLoader::LoadFromString("extraction:\n  filters:\n    symmetric_relations: false\n");
  auto policy = relgen::factory::BuildFilterPolicy(config.extraction().filters());
  assert(!policy.self_relations);
  assert(!policy.nested_relations);
  assert(!policy.symmetric_relations);

  auto empty          = relgen::config::ConfigLoader::LoadFromString("logging:\n  level: info\n");
  auto default_policy = relgen::factory::BuildFilterPolicy(empty.extraction().filters());
  assert(!default_policy.self_relations);
  assert(!default_policy.nested_relations);
  assert(default_policy.symmetric_relations);
}

void TestBuildsExtractorsFromConfig() {
  auto config = relgen::config::ConfigLoader::LoadFromString(kFullConfig);
  config.mutable_database()->mutable_memory();

  auto app = relgen::factory::Build(config);
  assert(app.repository);
  assert(app.mention_extractor);
  assert(app.mention_extractor->Types().size() == 2);
  assert(app.candidate_extractor);
  assert(app.candidate_extractor->Schemas()[0].mention_types[1] == "year");
}

void TestIncompleteMatcherIsConfigurationError() {
  auto config = relgen::config::ConfigLoader::LoadFromString(R"(extraction:
  mentions:
    - type: person
      ngrams:
        n_max: 2
)");

  bool threw = false;
  try {
    (void)relgen::factory::BuildMentionExtractor(config.extraction(), relgen::factory::BuildRepository(config));
  } catch (const relgen::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(logging:
  level: info
unknown_field: 123
extraction:
  parallelism: 1
)");

  bool threw = false;
  try {
    (void)relgen::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)relgen::config::ConfigLoader::LoadFromYaml("/nonexistent/relgen.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestLoadsExtractionSection();
  TestFilterPolicyDefaults();
  TestBuildsExtractorsFromConfig();
  TestIncompleteMatcherIsConfigurationError();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsReported();

  std::cout << "relgen_unit_config_loader: pass\n";
  return 0;
}
