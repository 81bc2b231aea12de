#pragma once

#include "geocity/World.hpp"

#include <array>
#include <cstdint>

namespace geocity {

// Water, DeepOcean or River.
inline bool IsWaterTerrain(Terrain t)
{
  return t == Terrain::Water || t == Terrain::DeepOcean || t == Terrain::River;
}

// Rivers are fordable; open water and mountains are not.
inline bool IsPassableTerrain(Terrain t)
{
  return t != Terrain::Water && t != Terrain::DeepOcean && t != Terrain::Stone;
}

inline bool IsBuildableTerrain(Terrain t)
{
  return t == Terrain::Grass || t == Terrain::Sand || t == Terrain::Forest;
}

// Walking cost multiplier. Returns a negative value for impassable terrain.
float TerrainMoveCost(Terrain t);

struct TerrainStats {
  int width = 0;
  int height = 0;

  std::array<int, kTerrainCount> counts{};

  int landTiles = 0;
  int waterTiles = 0; // IsWaterTerrain()

  int treeTiles = 0;
  int resourceTiles = 0;

  float minElevation = 0.0f;
  float maxElevation = 0.0f;
  double meanElevation = 0.0;

  int count(Terrain t) const { return counts[static_cast<std::size_t>(t)]; }

  float landPercent() const;
  float waterPercent() const;
};

TerrainStats ComputeTerrainStats(const World& world);

} // namespace geocity
