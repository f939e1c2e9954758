#include "platform.hpp"

namespace resource::identity {

namespace {

struct Field {
  uint64_t shift;
  uint64_t bits;

  constexpr uint64_t Mask() const {
    return (1ULL << bits) - 1ULL;
  }
  constexpr uint64_t InPlace() const {
    return Mask() << shift;
  }
  constexpr uint64_t ToBits(uint64_t value) const {
    return (value & Mask()) << shift;
  }
  constexpr int FromBits(uint64_t tag) const {
    return static_cast<int>((tag >> shift) & Mask());
  }
  constexpr bool EqualOrMoreSpecific(uint64_t test, uint64_t ref) const {
    return !(ref & InPlace()) || ((test & InPlace()) == (ref & InPlace()));
  }
};

constexpr Field kPlatform{0, 7};
constexpr Field kRenderApiGroup{kPlatform.shift + kPlatform.bits, 5};
constexpr Field kRenderApi{kRenderApiGroup.shift + kRenderApiGroup.bits, 7};
constexpr Field kQualityLevel{kRenderApi.shift + kRenderApi.bits, 4};
constexpr Field kCustom{kQualityLevel.shift + kQualityLevel.bits, 8};

uint64_t Encode(const Field& field, int value) {
  if (value < 0 || static_cast<uint64_t>(value) >= field.Mask()) return 0;
  return field.ToBits(static_cast<uint64_t>(value) + 1);
}

} // namespace

uint64_t ComposePlatform(const PlatformDecl& decl) {
  return Encode(kPlatform, decl.platform) | Encode(kRenderApiGroup, decl.render_api_group) | Encode(kRenderApi, decl.render_api) |
         Encode(kQualityLevel, decl.quality_level) | Encode(kCustom, decl.custom);
}

PlatformDecl DecomposePlatform(uint64_t platform) {
  PlatformDecl decl;
  decl.platform         = kPlatform.FromBits(platform) - 1;
  decl.render_api_group = kRenderApiGroup.FromBits(platform) - 1;
  decl.render_api       = kRenderApi.FromBits(platform) - 1;
  decl.quality_level    = kQualityLevel.FromBits(platform) - 1;
  decl.custom           = kCustom.FromBits(platform) - 1;
  return decl;
}

bool IsEqualOrMoreSpecific(uint64_t platform, uint64_t reference) {
  return kPlatform.EqualOrMoreSpecific(platform, reference) && kRenderApiGroup.EqualOrMoreSpecific(platform, reference) &&
         kRenderApi.EqualOrMoreSpecific(platform, reference) && kQualityLevel.EqualOrMoreSpecific(platform, reference) &&
         kCustom.EqualOrMoreSpecific(platform, reference);
}

uint64_t ReducePlatform(uint64_t platform, uint64_t full_platform) {
  if (platform & kCustom.InPlace()) return platform & ~kCustom.InPlace();

  // quality level steps down one level at a time
  if (platform & kQualityLevel.InPlace()) {
    const int level = kQualityLevel.FromBits(platform) - 1;
    return (platform & ~kQualityLevel.InPlace()) | kQualityLevel.ToBits(static_cast<uint64_t>(level));
  }
  platform |= (full_platform & kCustom.InPlace()) | (full_platform & kQualityLevel.InPlace());

  if (platform & kRenderApi.InPlace()) return platform & ~kRenderApi.InPlace();
  if (platform & kRenderApiGroup.InPlace()) return platform & ~kRenderApiGroup.InPlace();
  platform |= (full_platform & kRenderApi.InPlace()) | (full_platform & kRenderApiGroup.InPlace());

  if (platform & kPlatform.InPlace()) return platform & ~kPlatform.InPlace();

  return 0;
}

std::vector<uint64_t> ReductionChain(uint64_t full_platform) {
  std::vector<uint64_t> chain;
  uint64_t              current = full_platform;
  while (current != 0) {
    chain.push_back(current);
    current = ReducePlatform(current, full_platform);
  }
  chain.push_back(0);
  return chain;
}

} // namespace resource::identity
