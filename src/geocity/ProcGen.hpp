#pragma once

#include "geocity/HighGround.hpp"
#include "geocity/Noise.hpp"
#include "geocity/TerrainClassifier.hpp"
#include "geocity/World.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace geocity {

// Optional lakes and ponds scattered over the finished terrain.
struct WaterFeaturesConfig {
  bool enabled = false;

  float lakesPerTile = 0.00015f;
  int lakeRadiusMin = 4;
  int lakeRadiusMax = 9;
  float lakeRimNoise = 2.0f; // rim jitter in tiles, scaled by the terrain field

  float pondsPerTile = 0.0004f;
  int pondRadiusMin = 1;
  int pondRadiusMax = 3;
};

struct WorldGenConfig {
  TerrainNoiseLayers noise{};

  float seaLevel = 3.0f; // sea level the terrain is classified against

  ElevationConfig elevation{};
  HighGroundConfig highGround{};
  ClassifierConfig classifier{};

  float treeChance = 0.2f;     // Grass, Forest and Snow
  int stoneDepositMin = 1000000;
  int stoneDepositMax = 1500000; // exclusive
  float stoneMetalYield = 0.2f;

  WaterFeaturesConfig waterFeatures{};
};

bool ValidateWorldGenConfig(const WorldGenConfig& cfg, std::string& outError);

// Deterministic: the same (width, height, seed, cfg) always yields the same world.
// Non-positive dimensions yield an empty world.
//
// If outPatches is non-null it receives the high ground patches used.
World GenerateWorld(int width, int height, std::uint64_t seed, const WorldGenConfig& cfg = {},
                    std::vector<HighGroundPatch>* outPatches = nullptr);

} // namespace geocity
