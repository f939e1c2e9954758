#include "internal/identity/platform.hpp"

#include <cassert>
#include <iostream>
#include <vector>

namespace {

using resource::identity::ComposePlatform;
using resource::identity::DecomposePlatform;
using resource::identity::IsEqualOrMoreSpecific;
using resource::identity::PlatformDecl;
using resource::identity::ReducePlatform;
using resource::identity::ReductionChain;

uint64_t Tag(int platform, int render_api_group, int render_api, int quality_level, int custom) {
  PlatformDecl decl;
  decl.platform         = platform;
  decl.render_api_group = render_api_group;
  decl.render_api       = render_api;
  decl.quality_level    = quality_level;
  decl.custom           = custom;
  return ComposePlatform(decl);
}

void TestComposeStoresValuePlusOne() {
  assert(ComposePlatform(PlatformDecl{}) == 0);
  assert(Tag(3, -1, -1, -1, -1) == 4);
  assert(Tag(-1, 0, -1, -1, -1) == (1ULL << 7));
  assert(Tag(-1, -1, 0, -1, -1) == (1ULL << 12));
  assert(Tag(-1, -1, -1, 0, -1) == (1ULL << 19));
  assert(Tag(-1, -1, -1, -1, 0) == (1ULL << 23));
}

void TestOutOfRangeFieldsStayUnspecified() {
  // 7 bit field: 126 is the largest encodable value
  assert(Tag(126, -1, -1, -1, -1) == 127);
  assert(Tag(127, -1, -1, -1, -1) == 0);
  assert(Tag(-5, -1, -1, -1, -1) == 0);
  assert(Tag(-1, -1, -1, 15, -1) == 0);
}

void TestDecomposeInvertsCompose() {
  const auto decl = DecomposePlatform(Tag(2, 1, 5, 3, 9));
  assert(decl.platform == 2);
  assert(decl.render_api_group == 1);
  assert(decl.render_api == 5);
  assert(decl.quality_level == 3);
  assert(decl.custom == 9);

  const auto empty = DecomposePlatform(0);
  assert(empty.platform == -1 && empty.render_api_group == -1 && empty.render_api == -1);
  assert(empty.quality_level == -1 && empty.custom == -1);
}

void TestEqualOrMoreSpecific() {
  const auto full    = Tag(2, 1, 5, 3, 9);
  const auto generic = Tag(2, -1, -1, -1, -1);

  assert(IsEqualOrMoreSpecific(full, generic));
  assert(!IsEqualOrMoreSpecific(generic, full));
  assert(IsEqualOrMoreSpecific(full, full));
  assert(IsEqualOrMoreSpecific(full, 0));
  assert(!IsEqualOrMoreSpecific(Tag(4, 1, 5, 3, 9), generic));
}

void TestReduceStripsCustomFirst() {
  const auto full = Tag(2, 1, 5, -1, 9);
  assert(ReducePlatform(full, full) == Tag(2, 1, 5, -1, -1));
}

void TestReduceReintroducesLessSpecificFields() {
  const auto full  = Tag(1, -1, -1, -1, 2);
  const auto chain = ReductionChain(full);

  const std::vector<uint64_t> expected = {full, Tag(1, -1, -1, -1, -1), Tag(-1, -1, -1, -1, 2), 0};
  assert(chain == expected);
}

void TestQualityLevelStepsDownOneAtATime() {
  const auto full  = Tag(1, -1, -1, 2, -1);
  const auto chain = ReductionChain(full);

  const std::vector<uint64_t> expected = {
      full,
      Tag(1, -1, -1, 1, -1),
      Tag(1, -1, -1, 0, -1),
      Tag(1, -1, -1, -1, -1),
      Tag(-1, -1, -1, 2, -1),
      Tag(-1, -1, -1, 1, -1),
      Tag(-1, -1, -1, 0, -1),
      0,
  };
  assert(chain == expected);
}

void TestChainAlwaysEndsAtGeneric() {
  for (const auto full : {Tag(2, 1, 5, 3, 9), Tag(-1, 4, -1, -1, -1), Tag(7, -1, 2, -1, -1), uint64_t{0}}) {
    const auto chain = ReductionChain(full);
    assert(chain.front() == full);
    assert(chain.back() == 0);
    for (size_t i = 1; i + 1 < chain.size(); ++i) {
      assert(chain[i] != 0);
    }
  }
}

} // namespace

int main() {
  TestComposeStoresValuePlusOne();
  TestOutOfRangeFieldsStayUnspecified();
  TestDecomposeInvertsCompose();
  TestEqualOrMoreSpecific();
  TestReduceStripsCustomFirst();
  TestReduceReintroducesLessSpecificFields();
  TestQualityLevelStepsDownOneAtATime();
  TestChainAlwaysEndsAtGeneric();

  std::cout << "resource_unit_platform: pass\n";
  return 0;
}
