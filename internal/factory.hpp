#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/candidate_extractor.hpp"
#include "internal/core/mention_extractor.hpp"
#include "internal/db/api/repository.hpp"

namespace relgen::factory {

/*
  Application

  Everything the CLI needs for one run, built from RuntimeConfig.
  Extractors are null when the config declares no mention types or
  no relations.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::unique_ptr<core::MentionExtractor>   mention_extractor;
  std::unique_ptr<core::CandidateExtractor> candidate_extractor;
};

/*
  Build

  Composition root: the ONLY place that knows concrete store types.
  Opens the configured backend, bootstraps its schema and translates
  the extraction section into extractors. Configuration mistakes throw
  util::ConfigurationError before any document is touched.
*/
Application Build(const relgen::runtime::config::RuntimeConfig& config);

// Defaults to the in-memory store when no backend is set.
std::shared_ptr<db::Repository> BuildRepository(const relgen::runtime::config::RuntimeConfig& config);

model::FilterPolicy BuildFilterPolicy(const relgen::runtime::config::FilterConfig& config);

std::unique_ptr<core::MentionExtractor> BuildMentionExtractor(const relgen::runtime::config::ExtractionConfig& config,
                                                              std::shared_ptr<db::Repository> repository);

std::unique_ptr<core::CandidateExtractor> BuildCandidateExtractor(const relgen::runtime::config::ExtractionConfig& config,
                                                                  std::shared_ptr<db::Repository> repository);

} // namespace relgen::factory
