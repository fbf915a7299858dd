#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "internal/db/model/mention_record.hpp"

namespace relgen::extract {

// One mention per argument role, in role order.
using MentionTuple = std::vector<const db::model::MentionRecord*>;

/*
  Throttle predicate over a full argument tuple.

  Accept() must be pure: no store access, no side effects. It is
  called exactly once per enumerated tuple and concurrently from
  every worker.
*/
class Throttler {
 public:
  virtual ~Throttler() = default;

  virtual bool Accept(const MentionTuple& mentions) const = 0;
};

using ThrottlerPtr = std::shared_ptr<const Throttler>;

class LambdaThrottler final : public Throttler {
 public:
  using Function = std::function<bool(const MentionTuple&)>;

  explicit LambdaThrottler(Function fn);

  bool Accept(const MentionTuple& mentions) const override;

 private:
  Function fn_;
};

// Every argument lies in the same sentence.
class SameSentenceThrottler final : public Throttler {
 public:
  bool Accept(const MentionTuple& mentions) const override;
};

// Same sentence, and each argument ends before the next one starts.
class OrderedThrottler final : public Throttler {
 public:
  bool Accept(const MentionTuple& mentions) const override;
};

/*
  Same sentence, and consecutive arguments are at most max_chars
  apart (gap between the end of one span and the start of the other;
  overlapping spans have gap 0).
*/
class MaxCharDistanceThrottler final : public Throttler {
 public:
  explicit MaxCharDistanceThrottler(int64_t max_chars);

  bool Accept(const MentionTuple& mentions) const override;

 private:
  int64_t max_chars_;
};

} // namespace relgen::extract
