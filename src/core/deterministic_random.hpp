#ifndef CAMLINK_CORE_DETERMINISTIC_RANDOM_HPP_
#define CAMLINK_CORE_DETERMINISTIC_RANDOM_HPP_

#include <cstdint>

namespace camlink::core {

constexpr std::uint64_t kSplitMixIncrement = 0x9e3779b97f4a7c15ULL;

inline std::uint64_t SplitMix64(std::uint64_t value) {
  std::uint64_t state = value + kSplitMixIncrement;
  state = (state ^ (state >> 30)) * 0xbf58476d1ce4e5b9ULL;
  state = (state ^ (state >> 27)) * 0x94d049bb133111ebULL;
  return state ^ (state >> 31);
}

// Reproducible "percent chance" for event number `index` under `seed`,
// salted so independent knobs sharing a seed do not fire together.
inline bool DeterministicPercentHit(std::uint64_t seed, std::uint64_t salt, std::uint64_t index,
                                    std::uint32_t percent) {
  if (percent == 0U) {
    return false;
  }
  if (percent >= 100U) {
    return true;
  }
  const std::uint64_t mixed = SplitMix64((seed ^ salt) + index * kSplitMixIncrement);
  return (mixed % 100ULL) < static_cast<std::uint64_t>(percent);
}

// Value in [0, bound) for event `index`; 0 when bound is 0.
inline std::uint64_t DeterministicBelow(std::uint64_t seed, std::uint64_t salt,
                                        std::uint64_t index, std::uint64_t bound) {
  if (bound == 0U) {
    return 0U;
  }
  return SplitMix64((seed ^ salt) + index * kSplitMixIncrement) % bound;
}

} // namespace camlink::core

#endif // CAMLINK_CORE_DETERMINISTIC_RANDOM_HPP_
