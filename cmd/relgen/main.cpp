#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using relgen::factory::Application;
using relgen::runner::RunReport;

static volatile std::sig_atomic_t g_interrupted = 0;

void HandleSignal(int) {
  g_interrupted = 1;
}

static void Usage() {
  std::cerr << "Usage:\n"
            << "  relgen --config <config.yaml> mentions    run mention extraction over every stored document\n"
            << "  relgen --config <config.yaml> candidates  run candidate extraction over every stored document\n"
            << "  relgen --config <config.yaml> clear       clear configured relations in the configured split\n"
            << "  relgen --config <config.yaml> stats       print mention and candidate counts\n";
}

static void PrintReport(const std::string& what, const RunReport& report) {
  std::cout << what << ": documents=" << report.documents_processed << " failed=" << report.documents_failed
            << " written=" << report.records_written << (report.cancelled ? " (cancelled)" : "") << "\n";
  for (const auto& failure : report.failures) {
    std::cout << "  failed document " << failure.document_id << " (" << failure.document_name << ") task=" << failure.task
              << ": " << failure.error << "\n";
  }
}

/*
  Runs fn while a watcher thread turns SIGINT/SIGTERM into Cancel().
*/
template <typename Extractor, typename Fn>
static RunReport RunCancellable(Extractor& extractor, Fn fn) {
  std::atomic<bool> done{false};
  std::thread       watcher([&] {
    bool forwarded = false;
    while (!done) {
      if (g_interrupted && !forwarded) {
        extractor.Cancel();
        forwarded = true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  struct StopWatcher {
    std::atomic<bool>& done;
    std::thread&       watcher;
    ~StopWatcher() {
      done = true;
      watcher.join();
    }
  } stop{done, watcher};

  return fn();
}

static std::vector<relgen::db::model::DocumentRecord> StoredDocuments(relgen::db::Repository& repository) {
  auto tx        = repository.Begin();
  auto documents = repository.ListDocuments(*tx);
  tx->Rollback();
  return documents;
}

static int RunMentions(Application& app, const relgen::runtime::config::ExtractionConfig& extraction) {
  if (!app.mention_extractor) throw relgen::util::ConfigurationError("no mention types configured");

  const auto documents   = StoredDocuments(*app.repository);
  const auto parallelism = extraction.parallelism() == 0 ? 1u : extraction.parallelism();
  auto       report      = RunCancellable(*app.mention_extractor,
                                          [&] { return app.mention_extractor->Apply(documents, extraction.clear(), parallelism); });
  PrintReport("mentions", report);
  return report.Ok() ? 0 : 3;
}

static int RunCandidates(Application& app, const relgen::runtime::config::ExtractionConfig& extraction) {
  if (!app.candidate_extractor) throw relgen::util::ConfigurationError("no relations configured");

  const auto documents   = StoredDocuments(*app.repository);
  const auto parallelism = extraction.parallelism() == 0 ? 1u : extraction.parallelism();
  auto       report      = RunCancellable(*app.candidate_extractor, [&] {
    return app.candidate_extractor->Apply(documents, extraction.split(), extraction.clear(), parallelism);
  });
  PrintReport("candidates", report);
  return report.Ok() ? 0 : 3;
}

static int RunClear(Application& app, const relgen::runtime::config::ExtractionConfig& extraction) {
  if (!app.candidate_extractor) throw relgen::util::ConfigurationError("no relations configured");

  app.candidate_extractor->Clear(extraction.split());
  std::cout << "cleared split " << extraction.split() << "\n";
  return 0;
}

static int RunStats(Application& app, const relgen::runtime::config::ExtractionConfig& extraction) {
  auto& repository = *app.repository;
  auto  tx         = repository.Begin();

  std::cout << "documents: " << repository.ListDocuments(*tx).size() << "\n";

  if (app.mention_extractor) {
    for (const auto& type : app.mention_extractor->Types()) {
      relgen::db::MentionFilter filter;
      filter.type = type;
      std::cout << "mention " << type << ": " << repository.CountMentions(*tx, filter) << "\n";
    }
  }

  if (app.candidate_extractor) {
    for (const auto& schema : app.candidate_extractor->Schemas()) {
      relgen::db::CandidateFilter filter;
      filter.type  = schema.name;
      filter.split = extraction.split();
      std::cout << "relation " << schema.name << " (split " << extraction.split() << "): " << repository.CountCandidates(*tx, filter)
                << "\n";
    }
  }

  tx->Rollback();
  return 0;
}

int main(int argc, char** argv) {
  if (argc != 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string command     = argv[3];
  if (command != "mentions" && command != "candidates" && command != "clear" && command != "stats") {
    std::cerr << "unknown command: " << command << "\n";
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = relgen::config::ConfigLoader::LoadFromYaml(config_path);

    relgen::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = relgen::factory::Build(config);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    int code = 0;
    if (command == "mentions") {
      code = RunMentions(app, config.extraction());
    } else if (command == "candidates") {
      code = RunCandidates(app, config.extraction());
    } else if (command == "clear") {
      code = RunClear(app, config.extraction());
    } else {
      code = RunStats(app, config.extraction());
    }

    relgen::observability::ShutdownLogging();
    return code;
  } catch (const std::exception& e) {
    RELGEN_LOG_ERROR("Fatal error", {relgen::observability::StringField("error", e.what())});
    std::cerr << "relgen: " << e.what() << "\n";
    relgen::observability::ShutdownLogging();
    return 2;
  }
}
