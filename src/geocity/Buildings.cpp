#include "geocity/Buildings.hpp"

#include "geocity/TerrainStats.hpp"

#include <algorithm>
#include <functional>

namespace geocity {

namespace {

Zone ZoneFor(BuildingKind k)
{
  switch (k) {
  case BuildingKind::Residential: return Zone::Residential;
  case BuildingKind::Commercial: return Zone::Commercial;
  case BuildingKind::Industrial: return Zone::Industrial;
  default: return Zone::None;
  }
}

} // namespace

BuildingId BuildingList::add(BuildingKind kind, int x, int y, int population)
{
  Building b;
  b.id = m_nextId++;
  b.kind = kind;
  b.x = x;
  b.y = y;
  b.population = std::max(0, population);
  m_entries.push_back(b);
  return b.id;
}

bool BuildingList::insert(const Building& b)
{
  if (b.id == kNoBuilding) return false;
  if (findIndex(b.id) >= 0) return false;
  m_entries.push_back(b);
  m_nextId = std::max(m_nextId, b.id + 1);
  return true;
}

int BuildingList::findIndex(BuildingId id) const
{
  if (id == kNoBuilding) return -1;
  for (std::size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].id == id) return static_cast<int>(i);
  }
  return -1;
}

const Building* BuildingList::find(BuildingId id) const
{
  const int idx = findIndex(id);
  return idx >= 0 ? &m_entries[static_cast<std::size_t>(idx)] : nullptr;
}

int BuildingList::findCovering(int x, int y) const
{
  for (std::size_t i = 0; i < m_entries.size(); ++i) {
    if (m_entries[i].covers(x, y)) return static_cast<int>(i);
  }
  return -1;
}

std::vector<Building> BuildingList::removeIndices(std::vector<std::size_t> indices)
{
  std::sort(indices.begin(), indices.end(), std::greater<std::size_t>());
  indices.erase(std::unique(indices.begin(), indices.end()), indices.end());

  std::vector<Building> removed;
  removed.reserve(indices.size());
  for (std::size_t idx : indices) {
    if (idx >= m_entries.size()) continue;
    removed.push_back(m_entries[idx]);
    m_entries.erase(m_entries.begin() + static_cast<std::ptrdiff_t>(idx));
  }
  return removed;
}

int BuildingList::countKind(BuildingKind k) const
{
  int n = 0;
  for (const Building& b : m_entries) {
    if (b.kind == k) ++n;
  }
  return n;
}

int BuildingList::totalPopulation() const
{
  int n = 0;
  for (const Building& b : m_entries) n += std::max(0, b.population);
  return n;
}

const char* ToString(PlaceResult r)
{
  switch (r) {
  case PlaceResult::Placed: return "Placed";
  case PlaceResult::OutOfBounds: return "OutOfBounds";
  case PlaceResult::BlockedWater: return "BlockedWater";
  case PlaceResult::BlockedTerrain: return "BlockedTerrain";
  case PlaceResult::BlockedOccupied: return "BlockedOccupied";
  default: return "UnknownPlaceResult";
  }
}

PlaceResult PlaceBuilding(World& world, BuildingList& buildings, BuildingKind kind, int x, int y, int population,
                          BuildingId* outId)
{
  const int s = FootprintSize(kind);

  for (int yy = y; yy < y + s; ++yy) {
    for (int xx = x; xx < x + s; ++xx) {
      if (!world.inBounds(xx, yy)) return PlaceResult::OutOfBounds;
    }
  }

  for (int yy = y; yy < y + s; ++yy) {
    for (int xx = x; xx < x + s; ++xx) {
      const Tile& t = world.at(xx, yy);
      if (IsWaterTerrain(t.terrain)) return PlaceResult::BlockedWater;
      if (!IsBuildableTerrain(t.terrain)) return PlaceResult::BlockedTerrain;
      if (world.isOccupied(xx, yy) || buildings.findCovering(xx, yy) >= 0) return PlaceResult::BlockedOccupied;
    }
  }

  const BuildingId id = buildings.add(kind, x, y, population);
  const Zone zone = ZoneFor(kind);

  for (int yy = y; yy < y + s; ++yy) {
    for (int xx = x; xx < x + s; ++xx) {
      Tile& t = world.at(xx, yy);
      TileBuilding ref;
      ref.id = id;
      ref.kind = kind;
      t.building = ref;
      t.tree = false;
      if (zone != Zone::None) t.zone = zone;
    }
  }

  if (outId) *outId = id;
  return PlaceResult::Placed;
}

void ClearFootprint(World& world, const Building& b)
{
  const int s = b.size();
  for (int yy = b.y; yy < b.y + s; ++yy) {
    for (int xx = b.x; xx < b.x + s; ++xx) {
      Tile* t = world.tryAt(xx, yy);
      if (t && t->building && t->building->id == b.id) t->building.reset();
    }
  }
}

} // namespace geocity
