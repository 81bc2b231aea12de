#pragma once

#include "geocity/World.hpp"

#include <cstddef>
#include <vector>

namespace geocity {

// Side length of a building's square footprint, anchored at its top-left tile.
inline int FootprintSize(BuildingKind k)
{
  switch (k) {
  case BuildingKind::Well:
  case BuildingKind::Commercial:
  case BuildingKind::Industrial: return 1;
  default: return 2;
  }
}

struct Building {
  BuildingId id = kNoBuilding;
  BuildingKind kind = BuildingKind::Residential;

  // Top-left footprint tile.
  int x = 0;
  int y = 0;

  int population = 0;

  int size() const { return FootprintSize(kind); }
  bool covers(int tx, int ty) const
  {
    const int s = size();
    return tx >= x && ty >= y && tx < x + s && ty < y + s;
  }
};

// Owning list of placed structures.
//
// Entries are addressed by index for iteration and by BuildingId for identity;
// ids are never reused within one list.
class BuildingList {
public:
  BuildingList() = default;

  // Appends a new structure and returns its freshly allocated id.
  BuildingId add(BuildingKind kind, int x, int y, int population = 0);

  // Re-inserts an entry with a known id (save/load, tests).
  // Fails when the id is kNoBuilding or already present.
  bool insert(const Building& b);

  std::size_t size() const { return m_entries.size(); }
  bool empty() const { return m_entries.empty(); }

  const Building& operator[](std::size_t i) const { return m_entries[i]; }
  Building& operator[](std::size_t i) { return m_entries[i]; }

  const std::vector<Building>& entries() const { return m_entries; }

  // -1 when absent.
  int findIndex(BuildingId id) const;
  const Building* find(BuildingId id) const;

  // Index of the first entry whose footprint covers (x, y), or -1.
  int findCovering(int x, int y) const;

  // Removes the entries at the given indices and returns them, in removal order.
  //
  // Indices are deduplicated and erased from the highest down, so erasing one
  // entry never shifts an index still waiting to be removed. Out-of-range
  // indices are ignored.
  std::vector<Building> removeIndices(std::vector<std::size_t> indices);

  int countKind(BuildingKind k) const;
  int totalPopulation() const;

  BuildingId nextId() const { return m_nextId; }

private:
  std::vector<Building> m_entries;
  BuildingId m_nextId = 1;
};

enum class PlaceResult : std::uint8_t {
  Placed = 0,
  OutOfBounds,
  BlockedWater,
  BlockedTerrain,
  BlockedOccupied,
};

const char* ToString(PlaceResult r);

// Places a structure: validates the whole footprint, appends it to the list,
// and writes the tile references (plus the matching zone for zoned kinds).
PlaceResult PlaceBuilding(World& world, BuildingList& buildings, BuildingKind kind, int x, int y, int population,
                          BuildingId* outId = nullptr);

// Clears every tile reference to `b` inside its footprint. Zones are kept.
void ClearFootprint(World& world, const Building& b);

} // namespace geocity
