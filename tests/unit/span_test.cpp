#include <cassert>
#include <iostream>
#include <vector>

#include "internal/db/model/candidate_record.hpp"
#include "internal/model/span.hpp"

namespace {

using relgen::model::Span;

void TestContainment() {
  const Span outer{1, 0, 10};
  const Span inner{1, 2, 5};
  const Span other_sentence{2, 2, 5};

  assert(outer.Contains(inner));
  assert(!inner.Contains(outer));
  assert(outer.Contains(outer));
  assert(!outer.Contains(other_sentence));
  assert(inner.Length() == 3);
}

void TestNestingIsStrict() {
  const Span a{1, 0, 10};
  const Span b{1, 2, 5};
  const Span same{1, 0, 10};
  const Span overlap{1, 8, 12};

  assert(a.IsNestedWith(b));
  assert(b.IsNestedWith(a));
  assert(!a.IsNestedWith(same));
  assert(!a.IsNestedWith(overlap));
}

void TestOrdering() {
  assert((Span{1, 0, 3} < Span{1, 0, 4}));
  assert((Span{1, 5, 6} < Span{2, 0, 1}));
  assert((Span{1, 0, 3} != Span{1, 0, 4}));
  assert(relgen::model::ToString(Span{7, 2, 9}) == "7[2,9)");
}

void TestArgumentKey() {
  const std::vector<int64_t> ids{12, 57, 3};
  assert(relgen::db::model::ArgumentKey(ids) == "12,57,3");
  assert(relgen::db::model::ParseArgumentKey("12,57,3") == ids);
  assert(relgen::db::model::ParseArgumentKey("").empty());
}

} // namespace

int main() {
  TestContainment();
  TestNestingIsStrict();
  TestOrdering();
  TestArgumentKey();

  std::cout << "relgen_unit_span: pass\n";
  return 0;
}
