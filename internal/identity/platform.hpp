#pragma once

#include <cstdint>
#include <vector>

namespace resource::identity {

/*
  Platform tags.

  A platform tag packs five optional fields into a u64:

    bits   field             variants
    0-6    platform          128
    7-11   render api group  32
    12-18  render api        128
    19-22  quality level     16
    23-30  custom            256

  Each field stores value + 1, so 0 means "any". Tag 0 matches every
  platform and is the last step of every reduction chain.
*/

struct PlatformDecl {
  int platform         = -1;
  int render_api_group = -1;
  int render_api       = -1;
  int quality_level    = -1;
  int custom           = -1;
};

// Fields that are negative or out of range stay unspecified.
uint64_t ComposePlatform(const PlatformDecl& decl);

// Unspecified fields decode to -1.
PlatformDecl DecomposePlatform(uint64_t platform);

// True if every field set in reference is set to the same value in platform.
bool IsEqualOrMoreSpecific(uint64_t platform, uint64_t reference);

// One step towards the generic tag. Repeated application starting from
// full_platform ends at 0.
uint64_t ReducePlatform(uint64_t platform, uint64_t full_platform);

// full_platform followed by every reduction step, ending with 0.
std::vector<uint64_t> ReductionChain(uint64_t full_platform);

} // namespace resource::identity
