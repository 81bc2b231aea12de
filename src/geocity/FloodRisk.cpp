#include "geocity/FloodRisk.hpp"

#include "geocity/Flood.hpp"

#include <cstdio>

namespace geocity {

const char* ToString(FloodRiskLevel l)
{
  switch (l) {
  case FloodRiskLevel::Safe: return "safe";
  case FloodRiskLevel::Warning: return "warning";
  case FloodRiskLevel::Danger: return "danger";
  case FloodRiskLevel::Flooding: return "flooding";
  default: return "unknown";
  }
}

FloodRiskLevel ClassifyFloodRisk(float elevation, float seaLevel, float margin)
{
  const float diff = elevation - seaLevel;
  if (diff < 0.0f) return FloodRiskLevel::Flooding;
  if (diff <= margin) return FloodRiskLevel::Danger;
  if (diff <= margin * 2.0f) return FloodRiskLevel::Warning;
  return FloodRiskLevel::Safe;
}

TileElevationInfo DescribeTileElevation(float elevation, float seaLevel, float margin)
{
  TileElevationInfo info;
  info.elevation = elevation;
  info.seaLevel = seaLevel;
  info.level = ClassifyFloodRisk(elevation, seaLevel, margin);

  switch (info.level) {
  case FloodRiskLevel::Flooding: info.description = "Underwater"; break;
  case FloodRiskLevel::Danger: info.description = "Flood risk! Build higher."; break;
  case FloodRiskLevel::Warning: info.description = "Low elevation - monitor water levels"; break;
  default: info.description = "Safe elevation"; break;
  }

  info.atRisk = info.level == FloodRiskLevel::Danger || info.level == FloodRiskLevel::Warning;
  return info;
}

std::string FormatElevationMargin(float elevation, float seaLevel)
{
  const float diff = elevation - seaLevel;
  if (diff < 0.0f) return "FLOODING!";

  char buf[32];
  std::snprintf(buf, sizeof(buf), "+%.1f safe", static_cast<double>(diff));
  return std::string(buf);
}

FloodRiskReport ComputeFloodRisk(const World& world, const BuildingList& buildings, float seaLevel, float margin)
{
  FloodRiskReport rep;
  rep.width = world.width();
  rep.height = world.height();
  rep.seaLevel = seaLevel;
  rep.margin = margin;
  rep.levels.assign(world.tileCount(), FloodRiskLevel::Safe);

  for (std::size_t i = 0; i < world.tileCount(); ++i) {
    const Tile& t = world.atIndex(i);
    FloodRiskLevel l = FloodRiskLevel::Safe;
    if (!IsStandingWater(t.terrain) && t.elevation > kSeaFloorElevation && t.elevation < kPermanentLandElevation) {
      l = ClassifyFloodRisk(t.elevation, seaLevel, margin);
    }
    rep.levels[i] = l;
    rep.tierCounts[static_cast<std::size_t>(l)]++;
  }

  for (const Building& b : buildings.entries()) {
    bool risky = false;
    const int s = b.size();
    for (int y = b.y; y < b.y + s && !risky; ++y) {
      for (int x = b.x; x < b.x + s; ++x) {
        if (!world.inBounds(x, y)) continue;
        const FloodRiskLevel l = rep.levels[world.index(x, y)];
        if (l == FloodRiskLevel::Danger || l == FloodRiskLevel::Flooding) {
          risky = true;
          break;
        }
      }
    }
    if (!risky) continue;
    rep.structuresAtRisk++;
    rep.populationAtRisk += b.population > 0 ? b.population : 0;
    if (b.kind == BuildingKind::Well) rep.wellsAtRisk++;
  }

  return rep;
}

} // namespace geocity
