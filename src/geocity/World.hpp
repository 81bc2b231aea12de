#pragma once

#include "geocity/Types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geocity {

enum class Terrain : std::uint8_t {
  DeepOcean = 0,
  Water = 1,
  River = 2,
  Sand = 3,
  Grass = 4,
  Forest = 5,
  Rock = 6,
  Stone = 7, // impassable mountain massif
  Snow = 8,
};

constexpr std::uint8_t kTerrainCount = 9;

enum class Zone : std::uint8_t {
  None = 0,
  Residential = 1,
  Commercial = 2,
  Industrial = 3,
};

enum class BuildingKind : std::uint8_t {
  Well = 0,
  Residential = 1,
  Commercial = 2,
  Industrial = 3,
  Chief = 4,
  ClanChief = 5,
  Dock = 6,
  Storage = 7,
};

constexpr std::uint8_t kBuildingKindCount = 8;

enum class ResourceKind : std::uint8_t {
  Stone = 0,
  Metal = 1,
};

// Identity of a structure. 0 is reserved for "no building".
using BuildingId = std::uint32_t;
constexpr BuildingId kNoBuilding = 0;

// Structure reference embedded in a tile.
//
// When `id` names an entry of the BuildingList, the list entry is authoritative
// and `population` here is ignored. Otherwise this is a tile-only structure and
// `population` counts its residents (shared by every tile carrying the same id).
struct TileBuilding {
  BuildingId id = kNoBuilding;
  BuildingKind kind = BuildingKind::Residential;
  int population = 0;
};

struct ResourceDeposit {
  ResourceKind kind = ResourceKind::Stone;
  int amount = 0;
  float metalYield = 0.0f;
};

struct Tile {
  Terrain terrain = Terrain::Grass;

  // Terrain restored when a flooded tile drains. Never Water or DeepOcean.
  Terrain original = Terrain::Sand;

  // Fixed at generation, 0..10.
  float elevation = 0.0f;

  bool explored = false;
  bool tree = false;
  bool road = false;
  bool berry = false;

  Zone zone = Zone::None;
  std::optional<TileBuilding> building;

  // Mountain ore body (Stone tiles).
  std::optional<ResourceDeposit> resource;

  // Loose stone lying on the tile; 0 = none.
  int stoneDeposit = 0;
};

const char* ToString(Terrain t);
const char* ToString(Zone z);
const char* ToString(BuildingKind k);
const char* ToString(ResourceKind k);

// Case-insensitive. Accepts the ToString() names plus a few aliases ("deep", "ocean", "mountain").
bool ParseTerrain(const std::string& s, Terrain& out);
bool ParseBuildingKind(const std::string& s, BuildingKind& out);

// Water or DeepOcean: the two terrain types the flood pass treats as submerged.
inline bool IsStandingWater(Terrain t) { return t == Terrain::Water || t == Terrain::DeepOcean; }

// Terrain a tile reverts to when it drains.
inline Terrain DrainedTerrain(const Tile& t)
{
  return IsStandingWater(t.original) ? Terrain::Sand : t.original;
}

class World {
public:
  World() = default;
  World(int w, int h, std::uint64_t seed);

  int width() const { return m_w; }
  int height() const { return m_h; }
  std::uint64_t seed() const { return m_seed; }
  bool empty() const { return m_tiles.empty(); }

  bool inBounds(int x, int y) const { return x >= 0 && y >= 0 && x < m_w && y < m_h; }

  std::size_t index(int x, int y) const { return static_cast<std::size_t>(y) * static_cast<std::size_t>(m_w) + static_cast<std::size_t>(x); }
  Point pointAt(std::size_t idx) const
  {
    return Point{static_cast<int>(idx % static_cast<std::size_t>(m_w)), static_cast<int>(idx / static_cast<std::size_t>(m_w))};
  }

  // Unchecked access; callers iterate valid coordinates.
  Tile& at(int x, int y) { return m_tiles[index(x, y)]; }
  const Tile& at(int x, int y) const { return m_tiles[index(x, y)]; }

  Tile& atIndex(std::size_t idx) { return m_tiles[idx]; }
  const Tile& atIndex(std::size_t idx) const { return m_tiles[idx]; }

  // Checked access: nullptr when (x, y) is outside the grid.
  Tile* tryAt(int x, int y) { return inBounds(x, y) ? &at(x, y) : nullptr; }
  const Tile* tryAt(int x, int y) const { return inBounds(x, y) ? &at(x, y) : nullptr; }

  // Read accessors for presentation layers. Return false outside the grid.
  bool terrainAt(int x, int y, Terrain& out) const;
  bool elevationAt(int x, int y, float& out) const;
  bool exploredAt(int x, int y) const;

  std::size_t tileCount() const { return m_tiles.size(); }

  // Sets the current terrain and, for non-water terrain, the drain target too.
  void setTerrain(int x, int y, Terrain t);

  // Reveals every tile within `radius` (Chebyshev) of (x, y). Returns the number of newly explored tiles.
  int explore(int x, int y, int radius);

  bool isBuildable(int x, int y) const; // buildable terrain, nothing built
  bool isOccupied(int x, int y) const;  // zone or building present

private:
  int m_w = 0;
  int m_h = 0;
  std::uint64_t m_seed = 0;
  std::vector<Tile> m_tiles;
};

} // namespace geocity
