#pragma once

#include "geocity/Random.hpp"

#include <cstdint>

namespace geocity {

inline float Lerp(float a, float b, float t) { return a + (b - a) * t; }

inline float SmoothStep(float t) { return t * t * (3.0f - 2.0f * t); }

// One derived noise field: sample coordinates are (x * frequency + offset).
//
// The large offsets only exist to decorrelate fields that share the same lattice;
// without them the mountain and river fields would trace the same shapes.
struct NoiseLayer {
  float frequency = 0.02f;
  float offset = 0.0f;
  int octaves = 5;
};

// Five octaves of unit-amplitude value noise sum to at most ~1.94; in practice the
// output stays below ~1.8, which is what the normalized variant divides by.
constexpr float kFbmAmplitudeCeiling = 1.8f;

// Seeded 2D value noise with fractal (multi-octave) combination.
//
// A NoiseField is an explicit context: two fields with different seeds never
// interfere, and every sample is a pure function of (seed, x, y).
class NoiseField {
public:
  NoiseField() = default;
  explicit NoiseField(std::uint64_t seed) : m_seed(seed), m_seed32(FoldSeed32(seed)) {}

  std::uint64_t seed() const { return m_seed; }

  // Hash of an integer lattice point in [0, 1).
  float hash(int ix, int iy) const;

  // Bilinear interpolation of the four hashed lattice corners with smoothstep easing, in [0, 1).
  float valueNoise(float x, float y) const;

  // Sum of valueNoise at doubling frequency and halving amplitude (first octave amplitude 1).
  // Unnormalized: range is [0, 2 - 2^(1-octaves)).
  float fbm(float x, float y, int octaves = 5) const;

  // fbm() rescaled by kFbmAmplitudeCeiling and clamped to [0, 1].
  float fbmNormalized(float x, float y, int octaves = 5) const;

  // Normalized fbm sampled through a layer's frequency and offset.
  float sample(float x, float y, const NoiseLayer& layer) const;

private:
  std::uint64_t m_seed = 1;
  std::uint32_t m_seed32 = FoldSeed32(1);
};

// The five world fields and their default decorrelation parameters.
struct TerrainNoiseLayers {
  NoiseLayer terrain{0.02f, 0.0f, 5};
  NoiseLayer ocean{0.008f, 2500.0f, 5};
  NoiseLayer lake{0.08f, 500.0f, 5};
  NoiseLayer mountain{0.015f, 1000.0f, 5};
  NoiseLayer river{0.05f, 100.0f, 5};
};

// Samples the five derived fields for one seed.
class TerrainNoise {
public:
  TerrainNoise(std::uint64_t seed, const TerrainNoiseLayers& layers) : m_field(seed), m_layers(layers) {}

  const NoiseField& field() const { return m_field; }
  const TerrainNoiseLayers& layers() const { return m_layers; }

  float terrain(int x, int y) const { return sampleLayer(x, y, m_layers.terrain); }
  float ocean(int x, int y) const { return sampleLayer(x, y, m_layers.ocean); }
  float lake(int x, int y) const { return sampleLayer(x, y, m_layers.lake); }
  float mountain(int x, int y) const { return sampleLayer(x, y, m_layers.mountain); }
  float river(int x, int y) const { return sampleLayer(x, y, m_layers.river); }

  // True when the river field lies within +/- width of its midpoint 0.5.
  bool isRiverAt(int x, int y, float width) const;

private:
  float sampleLayer(int x, int y, const NoiseLayer& layer) const
  {
    return m_field.sample(static_cast<float>(x), static_cast<float>(y), layer);
  }

  NoiseField m_field;
  TerrainNoiseLayers m_layers;
};

} // namespace geocity
