#pragma once

#include "geocity/Noise.hpp"
#include "geocity/World.hpp"

#include <cstdint>

namespace geocity {

// Elevation derived from the height and ocean fields.
struct ElevationConfig {
  float bias = 0.0f;            // added (x10) before rounding
  float ceiling = 9.0f;         // non-mountain land never exceeds this
  float oceanThreshold = 0.42f; // ocean field below this lowers the land
  float oceanDepth = 25.0f;     // elevation lost per unit below the threshold
};

// round(heightNoise*100 + bias*10)/10, minus the ocean basin term, clamped to [0, ceiling].
float ElevationFromNoise(float heightNoise, float oceanNoise, const ElevationConfig& cfg);

struct ClassifierConfig {
  float mountainThreshold = 0.68f; // mountain field
  float mountainHeightMin = 0.55f; // height field must also exceed this
  float mountainElevationMin = 9.0f;
  float mountainElevationSpan = 2.0f; // drawn in [min, min+span), then capped at 10

  float deepBelowSea = 1.5f;   // elevation < sea - this => DeepOcean
  float waterBelowSea = 0.5f;  // elevation < sea - this => Water

  float lakeThreshold = 0.30f; // lake field
  float lakeBand = 0.5f;       // lakes fill land in [sea, sea + band)

  float riverWidth = 0.012f;   // |river - 0.5| < width

  float grassMax = 7.0f;
  float forestMax = 8.0f;
  float rockMax = 8.75f;
};

struct TerrainClass {
  Terrain terrain = Terrain::Grass;
  float elevation = 0.0f;
};

// Assigns terrain and final elevation to one tile through an ordered cascade:
//
//   1) mountain  (skips all water logic)
//   2) deep ocean
//   3) water
//   4) lake      (not on high ground)
//   5) elevation bands: Sand, Grass, Forest, Rock, Snow
//   6) river     (carved over land that is not high ground or mountain)
//
// The order matters: an earlier match always wins.
class TerrainClassifier {
public:
  TerrainClassifier(const TerrainNoise& noise, const ClassifierConfig& cfg)
      : m_noise(noise), m_cfg(cfg), m_seed32(FoldSeed32(noise.field().seed()))
  {}

  const ClassifierConfig& config() const { return m_cfg; }

  TerrainClass classify(int x, int y, float elevation, float seaLevel, float heightNoise, bool isHighGround) const;

  // Land band for an elevation, ignoring every water rule except Sand at or below sea level.
  Terrain bandFor(float elevation, float seaLevel) const;

private:
  const TerrainNoise& m_noise;
  ClassifierConfig m_cfg;
  std::uint32_t m_seed32 = 0;
};

// Salts for per-tile hashed draws.
constexpr std::uint32_t kSaltMountainElevation = 0x4D4F554Eu;
constexpr std::uint32_t kSaltHighGround = 0x48494748u;
constexpr std::uint32_t kSaltTree = 0x54524545u;
constexpr std::uint32_t kSaltStoneDeposit = 0x53544F4Eu;

} // namespace geocity
