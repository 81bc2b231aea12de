#pragma once

#include <cstdint>
#include <limits>

namespace geocity {

// SplitMix64 step. Used both as the RNG core and to derive sub-seeds.
inline std::uint64_t SplitMix64Next(std::uint64_t& state)
{
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// Fold a 64-bit world seed into the 32-bit seed used by the lattice hash.
inline std::uint32_t FoldSeed32(std::uint64_t seed)
{
  return static_cast<std::uint32_t>(seed) ^ static_cast<std::uint32_t>(seed >> 32);
}

// Derive an independent stream seed from a world seed and a salt.
inline std::uint64_t DeriveSeed(std::uint64_t seed, std::uint64_t salt)
{
  std::uint64_t s = seed ^ (salt * 0xD1B54A32D192ED03ULL);
  return SplitMix64Next(s);
}

// Deterministic generator for everything in world generation that is not noise
// (patch placement, lake scatter). Same seed => same sequence on every platform.
struct RNG {
  std::uint64_t state = 0;

  explicit RNG(std::uint64_t seed)
      : state(seed ? seed : 0x12345678ABCDEF00ULL)
  {}

  std::uint64_t nextU64() { return SplitMix64Next(state); }

  std::uint32_t nextU32() { return static_cast<std::uint32_t>(nextU64() >> 32); }

  // Uniform integer in [0, maxExclusive), rejection sampled.
  std::uint32_t rangeU32(std::uint32_t maxExclusive)
  {
    if (maxExclusive <= 1u) return 0u;

    const std::uint32_t threshold = static_cast<std::uint32_t>((std::uint64_t{1} << 32) % maxExclusive);
    while (true) {
      const std::uint32_t r = nextU32();
      if (r >= threshold) return r % maxExclusive;
    }
  }

  // [0, 1) with 24 bits of resolution.
  float nextF01()
  {
    const std::uint32_t u = nextU32() >> 8;
    return static_cast<float>(u) / static_cast<float>(1u << 24);
  }

  // Uniform integer in [minInclusive, maxInclusive]. Returns minInclusive for empty ranges.
  int rangeInt(int minInclusive, int maxInclusive)
  {
    if (maxInclusive <= minInclusive) return minInclusive;
    const std::int64_t span = static_cast<std::int64_t>(maxInclusive) - static_cast<std::int64_t>(minInclusive) + 1;
    if (span > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
      return static_cast<int>(minInclusive + static_cast<std::int64_t>(nextU64() % static_cast<std::uint64_t>(span)));
    }
    return static_cast<int>(minInclusive + static_cast<std::int64_t>(rangeU32(static_cast<std::uint32_t>(span))));
  }

  float rangeFloat(float minInclusive, float maxExclusive)
  {
    return minInclusive + (maxExclusive - minInclusive) * nextF01();
  }

  bool chance(float p) { return nextF01() < p; }
};

// Deterministic 2D integer hash -> uint32.
// Backs the noise lattice and all per-tile variation (trees, deposits, patch heights).
inline std::uint32_t HashCoords32(int x, int y, std::uint32_t seed)
{
  std::uint64_t v = static_cast<std::uint64_t>(static_cast<std::uint32_t>(x));
  v |= (static_cast<std::uint64_t>(static_cast<std::uint32_t>(y)) << 32);
  v ^= (static_cast<std::uint64_t>(seed) * 0xD6E8FEB86659FD93ULL);

  v ^= v >> 30;
  v *= 0xBF58476D1CE4E5B9ULL;
  v ^= v >> 27;
  v *= 0x94D049BB133111EBULL;
  v ^= v >> 31;

  return static_cast<std::uint32_t>(v & 0xFFFFFFFFu);
}

// Per-tile uniform value in [0, 1) keyed by coordinate, seed and a salt that
// separates independent uses (tree roll, deposit size, ...).
inline float TileUniform01(int x, int y, std::uint32_t seed, std::uint32_t salt)
{
  const std::uint32_t h = HashCoords32(x, y, seed ^ (salt * 0x9E3779B9u));
  return static_cast<float>(h >> 8) / 16777216.0f;
}

} // namespace geocity
