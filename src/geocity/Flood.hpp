#pragma once

#include "geocity/Buildings.hpp"
#include "geocity/Geology.hpp"
#include "geocity/World.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace geocity {

// Tiles at or below this elevation are permanent sea floor, at or above
// kPermanentLandElevation permanent land. Neither floods nor drains.
constexpr float kSeaFloorElevation = 0.0f;
constexpr float kPermanentLandElevation = 8.0f;

// Standing water at or below this elevation never drains.
constexpr float kDeepFloorElevation = 1.0f;

// Settlement-wide totals owned by the economy layer.
struct Settlement {
  int population = 0;
  int wellCount = 0;
};

// The player entity as the flood pass sees it.
struct PlayerView {
  bool present = false;
  int x = 0;
  int y = 0;
  int population = 0; // attributed to the player; all of it drowns with them
};

// The player living in the structure that covers (x, y).
//
// The whole settlement drowns with the player. The home's own residents are
// already counted through the structure, so the player carries the rest of
// the settlement population. Not present when nothing covers (x, y).
PlayerView PlayerViewAtHome(const BuildingList& buildings, const Settlement& settlement, int x, int y);

struct LostStructure {
  int x = 0;
  int y = 0;
  BuildingKind kind = BuildingKind::Residential;
  int population = 0;
};

struct FloodResult {
  float seaLevel = 0.0f;

  int tilesFlooded = 0;
  int tilesDrained = 0;

  // One entry per destroyed structure, however many of its tiles flooded.
  std::vector<LostStructure> buildingsLost;

  // Zoned tiles without a structure that went under.
  int zonesLost = 0;

  int populationDrowned = 0;
  int wellsLost = 0;
  bool playerDrowned = false;
};

// Everything one flood pass would change, computed without touching the world.
struct FloodPlan {
  int width = 0;
  int height = 0;
  std::size_t buildingCount = 0; // list size the plan was computed against

  std::vector<std::size_t> floodTiles; // row-major tile indices
  std::vector<std::size_t> drainTiles;

  // Building-list indices to erase, sorted descending and unique.
  std::vector<std::size_t> removeIndices;

  // Tile-only structures (not in the list) that were destroyed.
  std::vector<BuildingId> removedTileOnlyIds;

  FloodResult result;
};

// Single read-only pass over the grid at the given sea level.
//
// Each structure is recorded once, keyed by identity: a 2x2 building whose tiles
// flood together (or that is referenced from both its tiles and the list)
// contributes its population a single time.
FloodPlan PlanFlood(const World& world, const BuildingList& buildings, const PlayerView& player, float seaLevel);

// Applies a plan computed against the same, unchanged world and list.
// Returns false (and changes nothing) when the plan does not match their dimensions.
bool CommitFlood(World& world, BuildingList& buildings, const FloodPlan& plan, std::string& outError);

// PlanFlood() followed by CommitFlood().
FloodResult RunFloodPass(World& world, BuildingList& buildings, const PlayerView& player, float seaLevel);

// Settles a pass on the owners of the totals: population (clamped at zero),
// wells, and the geology lifetime counters.
void ApplyFloodOutcome(const FloodResult& result, Settlement& settlement, GeologyState& geology);

} // namespace geocity
