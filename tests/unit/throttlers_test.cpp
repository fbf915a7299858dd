#include "internal/extract/throttlers.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using namespace relgen::extract;
using relgen::db::model::MentionRecord;

MentionRecord Mention(int64_t id, int64_t sentence, int64_t start, int64_t end) {
  MentionRecord m;
  m.id   = id;
  m.type = "t";
  m.span = relgen::model::Span{sentence, start, end};
  return m;
}

void TestSameSentence() {
  const auto a = Mention(1, 10, 0, 3);
  const auto b = Mention(2, 10, 5, 9);
  const auto c = Mention(3, 11, 0, 3);

  SameSentenceThrottler throttler;
  assert(throttler.Accept({&a, &b}));
  assert(!throttler.Accept({&a, &c}));
  assert(throttler.Accept({&a, &b, &a}));
}

void TestOrdered() {
  const auto a = Mention(1, 10, 0, 3);
  const auto b = Mention(2, 10, 5, 9);
  const auto overlap = Mention(3, 10, 2, 6);

  OrderedThrottler throttler;
  assert(throttler.Accept({&a, &b}));
  assert(!throttler.Accept({&b, &a}));
  assert(!throttler.Accept({&a, &overlap}));
}

void TestMaxCharDistance() {
  const auto a    = Mention(1, 10, 0, 3);
  const auto near = Mention(2, 10, 5, 9);
  const auto far  = Mention(3, 10, 30, 35);
  const auto elsewhere = Mention(4, 11, 4, 6);

  MaxCharDistanceThrottler throttler(5);
  assert(throttler.Accept({&a, &near}));
  assert(throttler.Accept({&near, &a}));
  assert(!throttler.Accept({&a, &far}));
  assert(!throttler.Accept({&a, &elsewhere}));

  bool threw = false;
  try {
    MaxCharDistanceThrottler bad(-1);
  } catch (const relgen::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestLambda() {
  const auto a = Mention(1, 10, 0, 3);
  const auto b = Mention(2, 10, 5, 9);

  int calls = 0;
  LambdaThrottler throttler([&calls](const MentionTuple& tuple) {
    ++calls;
    return tuple[0]->id < tuple[1]->id;
  });
  assert(throttler.Accept({&a, &b}));
  assert(!throttler.Accept({&b, &a}));
  assert(calls == 2);
}

} // namespace

int main() {
  TestSameSentence();
  TestOrdered();
  TestMaxCharDistance();
  TestLambda();

  std::cout << "relgen_unit_throttlers: pass\n";
  return 0;
}
