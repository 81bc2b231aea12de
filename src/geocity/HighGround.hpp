#pragma once

#include "geocity/Random.hpp"

#include <vector>

namespace geocity {

// Square region forced to high elevation so every map has flood-safe land.
struct HighGroundPatch {
  int x = 0;
  int y = 0;
  int size = 0;

  bool contains(int px, int py) const { return px >= x && py >= y && px < x + size && py < y + size; }
};

struct HighGroundConfig {
  int patchSize = 8;          // side length in tiles
  int tilesPerPatch = 2500;   // one patch per this many tiles
  int minPatches = 1;
  int edgeMargin = 5;         // keep patches off the map border when the map allows it
  float elevationMin = 7.0f;  // patch tiles draw elevation in [min, max)
  float elevationMax = 8.5f;
};

// max(minPatches, floor(w*h / tilesPerPatch)); 0 for an empty map.
int HighGroundQuota(int width, int height, const HighGroundConfig& cfg);

// Places HighGroundQuota() patches with the given generator. Patches may overlap.
// Every patch lies fully inside the map; on maps smaller than the patch size the
// patch is clipped to the map.
std::vector<HighGroundPatch> PlanHighGround(int width, int height, const HighGroundConfig& cfg, RNG& rng);

bool IsInHighGroundPatch(int x, int y, const std::vector<HighGroundPatch>& patches);

// Maps a uniform [0, 1) draw to the configured patch elevation range.
inline float HighGroundElevation(float u01, const HighGroundConfig& cfg)
{
  return cfg.elevationMin + (cfg.elevationMax - cfg.elevationMin) * u01;
}

} // namespace geocity
