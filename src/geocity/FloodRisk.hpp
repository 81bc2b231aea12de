#pragma once

#include "geocity/Buildings.hpp"
#include "geocity/World.hpp"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace geocity {

// Flood-risk assessment for a given (current or projected) sea level.
//
// Read-only over the world; intended for UI overlays, build-site checks and the
// CLI summary.

enum class FloodRiskLevel : std::uint8_t {
  Safe = 0,
  Warning = 1, // within two margins of the sea
  Danger = 2,  // within one margin
  Flooding = 3, // below the sea
};

constexpr std::size_t kFloodRiskLevelCount = 4;

const char* ToString(FloodRiskLevel l);

// Tier of a tile at `elevation` against `seaLevel`:
//   elevation - sea < 0         => Flooding
//   elevation - sea <= margin   => Danger
//   elevation - sea <= 2*margin => Warning
//   otherwise                   => Safe
FloodRiskLevel ClassifyFloodRisk(float elevation, float seaLevel, float margin);

struct TileElevationInfo {
  float elevation = 0.0f;
  float seaLevel = 0.0f;
  FloodRiskLevel level = FloodRiskLevel::Safe;
  const char* description = "";
  bool atRisk = false; // Danger or Warning
};

TileElevationInfo DescribeTileElevation(float elevation, float seaLevel, float margin);

// "+1.2 safe" or "FLOODING!".
std::string FormatElevationMargin(float elevation, float seaLevel);

struct FloodRiskReport {
  int width = 0;
  int height = 0;
  float seaLevel = 0.0f;
  float margin = 0.0f;

  // Per tile, row-major. Permanent land (elevation >= 8) and current standing water are Safe.
  std::vector<FloodRiskLevel> levels;

  std::array<int, kFloodRiskLevelCount> tierCounts{};

  // Structures with any footprint tile at Danger or Flooding.
  int structuresAtRisk = 0;
  int populationAtRisk = 0;
  int wellsAtRisk = 0;

  int count(FloodRiskLevel l) const { return tierCounts[static_cast<std::size_t>(l)]; }
};

FloodRiskReport ComputeFloodRisk(const World& world, const BuildingList& buildings, float seaLevel, float margin);

} // namespace geocity
