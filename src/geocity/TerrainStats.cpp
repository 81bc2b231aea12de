#include "geocity/TerrainStats.hpp"

#include <algorithm>

namespace geocity {

float TerrainMoveCost(Terrain t)
{
  switch (t) {
  case Terrain::Grass: return 1.0f;
  case Terrain::Sand: return 1.2f;
  case Terrain::Forest: return 1.5f;
  case Terrain::Snow: return 1.5f;
  case Terrain::Rock: return 2.0f;
  case Terrain::River: return 2.0f;
  case Terrain::Stone:
  case Terrain::Water:
  case Terrain::DeepOcean: return -1.0f;
  default: return 1.0f;
  }
}

float TerrainStats::landPercent() const
{
  const int total = width * height;
  if (total <= 0) return 0.0f;
  return 100.0f * static_cast<float>(landTiles) / static_cast<float>(total);
}

float TerrainStats::waterPercent() const
{
  const int total = width * height;
  if (total <= 0) return 0.0f;
  return 100.0f * static_cast<float>(waterTiles) / static_cast<float>(total);
}

TerrainStats ComputeTerrainStats(const World& world)
{
  TerrainStats s;
  s.width = world.width();
  s.height = world.height();
  if (world.empty()) return s;

  s.minElevation = world.atIndex(0).elevation;
  s.maxElevation = world.atIndex(0).elevation;

  double sum = 0.0;
  for (std::size_t i = 0; i < world.tileCount(); ++i) {
    const Tile& t = world.atIndex(i);
    s.counts[static_cast<std::size_t>(t.terrain)]++;
    if (IsWaterTerrain(t.terrain)) {
      s.waterTiles++;
    } else {
      s.landTiles++;
    }
    if (t.tree) s.treeTiles++;
    if (t.resource) s.resourceTiles++;

    s.minElevation = std::min(s.minElevation, t.elevation);
    s.maxElevation = std::max(s.maxElevation, t.elevation);
    sum += static_cast<double>(t.elevation);
  }

  s.meanElevation = sum / static_cast<double>(world.tileCount());
  return s;
}

} // namespace geocity
