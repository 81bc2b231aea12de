#include "geocity/Flood.hpp"

#include <algorithm>
#include <functional>
#include <sstream>
#include <unordered_set>

namespace geocity {

namespace {

bool IsTransitionElevation(float e)
{
  return e > kSeaFloorElevation && e < kPermanentLandElevation;
}

void ClearStructures(Tile& t)
{
  t.zone = Zone::None;
  t.building.reset();
  t.road = false;
  t.tree = false;
  t.stoneDeposit = 0;
  t.berry = false;
}

void ApplyPlan(World& world, BuildingList& buildings, const FloodPlan& plan)
{
  for (std::size_t idx : plan.floodTiles) {
    Tile& t = world.atIndex(idx);
    ClearStructures(t);
    t.terrain = Terrain::Water;
  }

  for (std::size_t idx : plan.drainTiles) {
    Tile& t = world.atIndex(idx);
    t.terrain = DrainedTerrain(t);
  }

  // Footprint tiles that stayed dry must not keep pointing at a removed building.
  const std::vector<Building> removed = buildings.removeIndices(plan.removeIndices);
  for (const Building& b : removed) ClearFootprint(world, b);

  if (!plan.removedTileOnlyIds.empty()) {
    const std::unordered_set<BuildingId> gone(plan.removedTileOnlyIds.begin(), plan.removedTileOnlyIds.end());
    for (std::size_t i = 0; i < world.tileCount(); ++i) {
      Tile& t = world.atIndex(i);
      if (t.building && gone.count(t.building->id)) t.building.reset();
    }
  }
}

} // namespace

FloodPlan PlanFlood(const World& world, const BuildingList& buildings, const PlayerView& player, float seaLevel)
{
  FloodPlan plan;
  plan.width = world.width();
  plan.height = world.height();
  plan.buildingCount = buildings.size();

  FloodResult& r = plan.result;
  r.seaLevel = seaLevel;

  std::vector<std::uint8_t> listMarked(buildings.size(), 0);
  std::unordered_set<BuildingId> tileOnlySeen;

  auto markListEntry = [&](std::size_t i) {
    if (listMarked[i]) return;
    listMarked[i] = 1;
    plan.removeIndices.push_back(i);

    const Building& b = buildings[i];
    const int pop = std::max(0, b.population);
    r.buildingsLost.push_back(LostStructure{b.x, b.y, b.kind, pop});
    r.populationDrowned += pop;
    if (b.kind == BuildingKind::Well) r.wellsLost++;
  };

  for (int y = 0; y < world.height(); ++y) {
    for (int x = 0; x < world.width(); ++x) {
      const Tile& t = world.at(x, y);
      if (!IsTransitionElevation(t.elevation)) continue;

      const bool wet = IsStandingWater(t.terrain);

      if (!wet && t.elevation < seaLevel) {
        plan.floodTiles.push_back(world.index(x, y));
        r.tilesFlooded++;

        if (t.building) {
          const TileBuilding& ref = *t.building;
          const int idx = buildings.findIndex(ref.id);
          if (idx >= 0) {
            markListEntry(static_cast<std::size_t>(idx));
          } else if (ref.id == kNoBuilding || tileOnlySeen.insert(ref.id).second) {
            const int pop = std::max(0, ref.population);
            r.buildingsLost.push_back(LostStructure{x, y, ref.kind, pop});
            r.populationDrowned += pop;
            if (ref.kind == BuildingKind::Well) r.wellsLost++;
            if (ref.id != kNoBuilding) plan.removedTileOnlyIds.push_back(ref.id);
          }
        } else if (t.zone != Zone::None) {
          r.zonesLost++;
        }

        for (std::size_t i = 0; i < buildings.size(); ++i) {
          if (buildings[i].covers(x, y)) markListEntry(i);
        }

        if (player.present && !r.playerDrowned && player.x == x && player.y == y) {
          r.populationDrowned += std::max(0, player.population);
          r.playerDrowned = true;
        }
      } else if (wet && t.elevation >= seaLevel && t.elevation > kDeepFloorElevation) {
        plan.drainTiles.push_back(world.index(x, y));
        r.tilesDrained++;
      }
    }
  }

  std::sort(plan.removeIndices.begin(), plan.removeIndices.end(), std::greater<std::size_t>());
  return plan;
}

bool CommitFlood(World& world, BuildingList& buildings, const FloodPlan& plan, std::string& outError)
{
  if (plan.width != world.width() || plan.height != world.height()) {
    std::ostringstream oss;
    oss << "flood plan is for a " << plan.width << "x" << plan.height << " world, not " << world.width() << "x"
        << world.height();
    outError = oss.str();
    return false;
  }
  if (plan.buildingCount != buildings.size()) {
    std::ostringstream oss;
    oss << "flood plan expected " << plan.buildingCount << " buildings, list has " << buildings.size();
    outError = oss.str();
    return false;
  }

  ApplyPlan(world, buildings, plan);
  return true;
}

FloodResult RunFloodPass(World& world, BuildingList& buildings, const PlayerView& player, float seaLevel)
{
  const FloodPlan plan = PlanFlood(world, buildings, player, seaLevel);
  ApplyPlan(world, buildings, plan);
  return plan.result;
}

PlayerView PlayerViewAtHome(const BuildingList& buildings, const Settlement& settlement, int x, int y)
{
  PlayerView p;
  const int home = buildings.findCovering(x, y);
  if (home < 0) return p;

  p.present = true;
  p.x = x;
  p.y = y;
  p.population = std::max(0, settlement.population - buildings[static_cast<std::size_t>(home)].population);
  return p;
}

void ApplyFloodOutcome(const FloodResult& result, Settlement& settlement, GeologyState& geology)
{
  settlement.population = std::max(0, settlement.population - result.populationDrowned);
  settlement.wellCount = std::max(0, settlement.wellCount - result.wellsLost);

  geology.tilesFlooded += result.tilesFlooded;
  geology.tilesDrained += result.tilesDrained;
  geology.populationDrowned += result.populationDrowned;
}

} // namespace geocity
