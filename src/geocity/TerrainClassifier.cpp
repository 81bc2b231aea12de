#include "geocity/TerrainClassifier.hpp"

#include <algorithm>
#include <cmath>

namespace geocity {

float ElevationFromNoise(float heightNoise, float oceanNoise, const ElevationConfig& cfg)
{
  float e = std::round(heightNoise * 100.0f + cfg.bias * 10.0f) / 10.0f;
  if (oceanNoise < cfg.oceanThreshold) {
    e -= (cfg.oceanThreshold - oceanNoise) * cfg.oceanDepth;
  }
  return std::clamp(e, 0.0f, std::max(0.0f, cfg.ceiling));
}

Terrain TerrainClassifier::bandFor(float elevation, float seaLevel) const
{
  if (elevation <= seaLevel) return Terrain::Sand;
  if (elevation < m_cfg.grassMax) return Terrain::Grass;
  if (elevation < m_cfg.forestMax) return Terrain::Forest;
  if (elevation < m_cfg.rockMax) return Terrain::Rock;
  return Terrain::Snow;
}

TerrainClass TerrainClassifier::classify(int x, int y, float elevation, float seaLevel, float heightNoise,
                                         bool isHighGround) const
{
  TerrainClass out;
  out.elevation = elevation;

  // Mountains stand regardless of the sea.
  if (m_noise.mountain(x, y) > m_cfg.mountainThreshold && heightNoise > m_cfg.mountainHeightMin) {
    const float u = TileUniform01(x, y, m_seed32, kSaltMountainElevation);
    out.terrain = Terrain::Stone;
    out.elevation = std::min(10.0f, m_cfg.mountainElevationMin + m_cfg.mountainElevationSpan * u);
    return out;
  }

  if (elevation < seaLevel - m_cfg.deepBelowSea) {
    out.terrain = Terrain::DeepOcean;
    out.elevation = std::max(0.0f, elevation);
    return out;
  }

  if (elevation < seaLevel - m_cfg.waterBelowSea) {
    out.terrain = Terrain::Water;
    return out;
  }

  if (!isHighGround && m_noise.lake(x, y) < m_cfg.lakeThreshold && elevation >= seaLevel &&
      elevation < seaLevel + m_cfg.lakeBand) {
    out.terrain = Terrain::Water;
    out.elevation = seaLevel - m_cfg.waterBelowSea;
    return out;
  }

  out.terrain = bandFor(elevation, seaLevel);

  // Everything reaching this point is land that is not a mountain.
  if (!isHighGround && m_noise.isRiverAt(x, y, m_cfg.riverWidth)) {
    out.terrain = Terrain::River;
    out.elevation = seaLevel;
  }

  return out;
}

} // namespace geocity
