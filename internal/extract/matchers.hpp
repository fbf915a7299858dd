#pragma once

#include <functional>
#include <memory>
#include <regex>
#include <string>
#include <unordered_set>
#include <vector>

#include "temporary_span.hpp"

namespace relgen::extract {

/*
  Matcher predicate over one span.

  Matches() must be pure; a matcher is shared by every worker.
  Apply() filters an ordered span list. With longest_match_only a
  span inside an already matched span is dropped, so spans should
  arrive longest first (as Ngrams produces them).
*/
class Matcher {
 public:
  virtual ~Matcher() = default;

  virtual bool Matches(const TemporarySpan& span) const = 0;

  std::vector<TemporarySpan> Apply(const std::vector<TemporarySpan>& spans) const;

  void SetLongestMatchOnly(bool enabled) {
    longest_match_only_ = enabled;
  }
  bool LongestMatchOnly() const {
    return longest_match_only_;
  }

 private:
  bool longest_match_only_ = true;
};

using MatcherPtr = std::shared_ptr<const Matcher>;

class RegexMatcher final : public Matcher {
 public:
  // full_match=false searches anywhere in the span text.
  explicit RegexMatcher(const std::string& pattern, bool ignore_case = false, bool full_match = true);

  bool Matches(const TemporarySpan& span) const override;

 private:
  std::regex regex_;
  bool       full_match_;
};

class DictionaryMatcher final : public Matcher {
 public:
  explicit DictionaryMatcher(const std::vector<std::string>& terms, bool ignore_case = true);

  bool Matches(const TemporarySpan& span) const override;

 private:
  std::unordered_set<std::string> terms_;
  bool                            ignore_case_;
};

class LambdaMatcher final : public Matcher {
 public:
  using Function = std::function<bool(const TemporarySpan&)>;

  explicit LambdaMatcher(Function fn);

  bool Matches(const TemporarySpan& span) const override;

 private:
  Function fn_;
};

// Matches when any child matches.
class UnionMatcher final : public Matcher {
 public:
  explicit UnionMatcher(std::vector<MatcherPtr> children);

  bool Matches(const TemporarySpan& span) const override;

 private:
  std::vector<MatcherPtr> children_;
};

// Matches when every child matches.
class IntersectMatcher final : public Matcher {
 public:
  explicit IntersectMatcher(std::vector<MatcherPtr> children);

  bool Matches(const TemporarySpan& span) const override;

 private:
  std::vector<MatcherPtr> children_;
};

class InverseMatcher final : public Matcher {
 public:
  explicit InverseMatcher(MatcherPtr child);

  bool Matches(const TemporarySpan& span) const override;

 private:
  MatcherPtr child_;
};

} // namespace relgen::extract
