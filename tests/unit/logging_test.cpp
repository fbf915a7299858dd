#include "internal/observability/logging.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"

namespace {

void TestFormatFieldsQuotesOnlyWhenNeeded() {
  using namespace relgen::observability;

  assert(FormatFields({}) == "");
  assert(FormatFields({IntField("document_id", 7), BoolField("cancelled", false)}) == "document_id=7 cancelled=false");
  assert(FormatFields({StringField("document", "news 1")}) == "document=\"news 1\"");
  assert(FormatFields({StringField("error", "bad \"span\"")}) == "error=\"bad \\\"span\\\"\"");
  assert(FormatFields({StringField("task", "")}) == "task=\"\"");
  assert(FormatFields({StringField("filter", "a=b")}) == "filter=\"a=b\"");
}

void TestFileSinkReceivesLeveledLines() {
  ::unsetenv("RELGEN_LOG_LEVEL");
  ::unsetenv("RELGEN_LOG_PATTERN");
  ::unsetenv("RELGEN_LOG_FILE");

  const auto dir = std::filesystem::temp_directory_path() / "relgen_logging_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "run.log";
  std::filesystem::remove(path);

  relgen::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_pattern("[%l] %v");
  config.mutable_logging()->set_file(path.string());

  relgen::observability::InitializeLogging(config);
  RELGEN_LOG_DEBUG("hidden detail");
  RELGEN_LOG_INFO("run finished", {relgen::observability::IntField("documents", 3)});
  RELGEN_LOG_ERROR("document failed", {relgen::observability::StringField("document", "doc a")});
  relgen::observability::ShutdownLogging();

  std::ifstream     in(path);
  std::stringstream content;
  content << in.rdbuf();
  const auto text = content.str();

  assert(text.find("hidden detail") == std::string::npos);
  assert(text.find("[info] run finished documents=3") != std::string::npos);
  assert(text.find("[error] document failed document=\"doc a\"") != std::string::npos);
}

} // namespace

int main() {
  TestFormatFieldsQuotesOnlyWhenNeeded();
  TestFileSinkReceivesLeveledLines();

  std::cout << "relgen_unit_logging: pass\n";
  return 0;
}
