#include "candidate_generator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace relgen::extract {

namespace {

std::string Describe(const MentionTuple& tuple) {
  std::string out;
  for (const auto* m : tuple) {
    if (!out.empty()) out += ",";
    out += std::to_string(m->id);
  }
  return out;
}

void LogSkipped(const char* message, const std::string& relation, const MentionTuple& tuple) {
  if (!spdlog::should_log(spdlog::level::debug)) return;
  RELGEN_LOG_DEBUG(message, {observability::StringField("relation", relation), observability::StringField("mentions", Describe(tuple))});
}

} // namespace

CandidateGenerator::CandidateGenerator(db::Repository& repository, db::Transaction& tx, const model::RelationSchema& schema,
                                       const Throttler* throttler, const model::FilterPolicy& policy, int32_t split, bool clear,
                                       int64_t document_id)
    : repository_(repository),
      tx_(tx),
      schema_(schema),
      throttler_(throttler),
      policy_(policy),
      split_(split),
      clear_(clear),
      document_id_(document_id) {
  if (schema_.Arity() == 0 || schema_.mention_types.size() != schema_.Arity()) {
    throw util::ConfigurationError("relation " + schema_.name + ": " + std::to_string(schema_.Arity()) + " arguments but " +
                                   std::to_string(schema_.mention_types.size()) + " mention sources");
  }

  role_mentions_.reserve(schema_.Arity());
  for (const auto& type : schema_.mention_types) {
    db::MentionFilter filter;
    filter.type        = type;
    filter.document_id = document_id_;
    auto mentions      = repository_.ListMentions(tx_, filter);
    std::sort(mentions.begin(), mentions.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
    role_mentions_.push_back(std::move(mentions));
  }

  Reset();
}

void CandidateGenerator::Reset() {
  cursor_.assign(role_mentions_.size(), 0);
  exhausted_ = std::any_of(role_mentions_.begin(), role_mentions_.end(), [](const auto& list) { return list.empty(); });
  stats_     = Stats{};
}

uint64_t CandidateGenerator::ProductSize() const {
  uint64_t size = 1;
  for (const auto& list : role_mentions_) size *= list.size();
  return size;
}

void CandidateGenerator::Advance() {
  for (std::size_t role = cursor_.size(); role-- > 0;) {
    if (++cursor_[role] < role_mentions_[role].size()) return;
    cursor_[role] = 0;
  }
  exhausted_ = true;
}

bool CandidateGenerator::Survives(const MentionTuple& tuple, const std::vector<std::size_t>& positions) {
  if (throttler_ && !throttler_->Accept(tuple)) {
    ++stats_.skipped_throttled;
    LogSkipped("throttled", schema_.name, tuple);
    return false;
  }

  // Higher arities are not filtered.
  if (tuple.size() != 2) return true;

  const auto& first  = tuple[0]->span;
  const auto& second = tuple[1]->span;

  if (!policy_.self_relations && first == second) {
    ++stats_.skipped_self;
    LogSkipped("self relation skipped", schema_.name, tuple);
    return false;
  }

  if (!policy_.nested_relations && first.IsNestedWith(second)) {
    ++stats_.skipped_nested;
    LogSkipped("nested relation skipped", schema_.name, tuple);
    return false;
  }

  // positions follow mention id order, so the lower id comes first
  if (!policy_.symmetric_relations && positions[0] > positions[1]) {
    ++stats_.skipped_symmetric;
    LogSkipped("symmetric relation skipped", schema_.name, tuple);
    return false;
  }

  return true;
}

std::optional<db::model::CandidateRecord> CandidateGenerator::Next() {
  MentionTuple tuple(role_mentions_.size());

  while (!exhausted_) {
    const auto positions = cursor_;
    for (std::size_t role = 0; role < positions.size(); ++role) {
      tuple[role] = &role_mentions_[role][positions[role]];
    }
    Advance();

    if (!Survives(tuple, positions)) continue;

    db::model::CandidateRecord record;
    record.type        = schema_.name;
    record.split       = split_;
    record.document_id = document_id_;
    record.mention_ids.reserve(tuple.size());
    for (const auto* m : tuple) record.mention_ids.push_back(m->id);

    if (!clear_ && repository_.FindCandidate(tx_, record.type, record.split, record.mention_ids)) {
      ++stats_.skipped_existing;
      LogSkipped("candidate exists", schema_.name, tuple);
      continue;
    }

    ++stats_.emitted;
    return record;
  }

  return std::nullopt;
}

} // namespace relgen::extract
