#include "matchers.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "internal/util/errors.hpp"

namespace relgen::extract {

namespace {

std::string Lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

void CheckChildren(const std::vector<MatcherPtr>& children, const char* kind) {
  if (children.empty()) {
    throw util::ConfigurationError(std::string(kind) + " matcher needs at least one child");
  }
  for (const auto& child : children) {
    if (!child) throw util::ConfigurationError(std::string(kind) + " matcher has a null child");
  }
}

} // namespace

std::vector<TemporarySpan> Matcher::Apply(const std::vector<TemporarySpan>& spans) const {
  std::vector<TemporarySpan> matched;
  for (const auto& span : spans) {
    if (longest_match_only_) {
      bool inside = std::any_of(matched.begin(), matched.end(), [&](const TemporarySpan& m) { return m.Contains(span); });
      if (inside) continue;
    }
    if (Matches(span)) matched.push_back(span);
  }
  return matched;
}

// ------------------------------------------------------------------
// Regex
// ------------------------------------------------------------------

RegexMatcher::RegexMatcher(const std::string& pattern, bool ignore_case, bool full_match) : full_match_(full_match) {
  auto flags = std::regex::ECMAScript;
  if (ignore_case) flags |= std::regex::icase;
  try {
    regex_ = std::regex(pattern, flags);
  } catch (const std::regex_error& e) {
    throw util::ConfigurationError("invalid regex '" + pattern + "': " + e.what());
  }
}

bool RegexMatcher::Matches(const TemporarySpan& span) const {
  const std::string text = span.Text();
  return full_match_ ? std::regex_match(text, regex_) : std::regex_search(text, regex_);
}

// ------------------------------------------------------------------
// Dictionary
// ------------------------------------------------------------------

DictionaryMatcher::DictionaryMatcher(const std::vector<std::string>& terms, bool ignore_case) : ignore_case_(ignore_case) {
  for (const auto& term : terms) {
    terms_.insert(ignore_case_ ? Lower(term) : term);
  }
}

bool DictionaryMatcher::Matches(const TemporarySpan& span) const {
  return terms_.contains(ignore_case_ ? Lower(span.Text()) : span.Text());
}

// ------------------------------------------------------------------
// Lambda and combinators
// ------------------------------------------------------------------

LambdaMatcher::LambdaMatcher(Function fn) : fn_(std::move(fn)) {
  if (!fn_) throw util::ConfigurationError("lambda matcher needs a callable");
}

bool LambdaMatcher::Matches(const TemporarySpan& span) const {
  return fn_(span);
}

UnionMatcher::UnionMatcher(std::vector<MatcherPtr> children) : children_(std::move(children)) {
  CheckChildren(children_, "union");
}

bool UnionMatcher::Matches(const TemporarySpan& span) const {
  return std::any_of(children_.begin(), children_.end(), [&](const MatcherPtr& m) { return m->Matches(span); });
}

IntersectMatcher::IntersectMatcher(std::vector<MatcherPtr> children) : children_(std::move(children)) {
  CheckChildren(children_, "intersect");
}

bool IntersectMatcher::Matches(const TemporarySpan& span) const {
  return std::all_of(children_.begin(), children_.end(), [&](const MatcherPtr& m) { return m->Matches(span); });
}

InverseMatcher::InverseMatcher(MatcherPtr child) : child_(std::move(child)) {
  if (!child_) throw util::ConfigurationError("inverse matcher has a null child");
}

bool InverseMatcher::Matches(const TemporarySpan& span) const {
  return !child_->Matches(span);
}

} // namespace relgen::extract
