#include "geocity/World.hpp"

#include "geocity/TerrainStats.hpp"

#include <algorithm>
#include <cctype>

namespace geocity {

namespace {

std::string Lower(const std::string& s)
{
  std::string out = s;
  for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

} // namespace

const char* ToString(Terrain t)
{
  switch (t) {
  case Terrain::DeepOcean: return "DeepOcean";
  case Terrain::Water: return "Water";
  case Terrain::River: return "River";
  case Terrain::Sand: return "Sand";
  case Terrain::Grass: return "Grass";
  case Terrain::Forest: return "Forest";
  case Terrain::Rock: return "Rock";
  case Terrain::Stone: return "Stone";
  case Terrain::Snow: return "Snow";
  default: return "UnknownTerrain";
  }
}

const char* ToString(Zone z)
{
  switch (z) {
  case Zone::None: return "None";
  case Zone::Residential: return "Residential";
  case Zone::Commercial: return "Commercial";
  case Zone::Industrial: return "Industrial";
  default: return "UnknownZone";
  }
}

const char* ToString(BuildingKind k)
{
  switch (k) {
  case BuildingKind::Well: return "Well";
  case BuildingKind::Residential: return "Residential";
  case BuildingKind::Commercial: return "Commercial";
  case BuildingKind::Industrial: return "Industrial";
  case BuildingKind::Chief: return "Chief";
  case BuildingKind::ClanChief: return "ClanChief";
  case BuildingKind::Dock: return "Dock";
  case BuildingKind::Storage: return "Storage";
  default: return "UnknownBuilding";
  }
}

const char* ToString(ResourceKind k)
{
  switch (k) {
  case ResourceKind::Stone: return "Stone";
  case ResourceKind::Metal: return "Metal";
  default: return "UnknownResource";
  }
}

bool ParseTerrain(const std::string& s, Terrain& out)
{
  const std::string k = Lower(s);
  if (k == "deep" || k == "deepocean" || k == "ocean") {
    out = Terrain::DeepOcean;
    return true;
  }
  if (k == "mountain") {
    out = Terrain::Stone;
    return true;
  }
  for (std::uint8_t i = 0; i < kTerrainCount; ++i) {
    const Terrain t = static_cast<Terrain>(i);
    if (k == Lower(ToString(t))) {
      out = t;
      return true;
    }
  }
  return false;
}

bool ParseBuildingKind(const std::string& s, BuildingKind& out)
{
  const std::string k = Lower(s);
  for (std::uint8_t i = 0; i < kBuildingKindCount; ++i) {
    const BuildingKind b = static_cast<BuildingKind>(i);
    if (k == Lower(ToString(b))) {
      out = b;
      return true;
    }
  }
  return false;
}

World::World(int w, int h, std::uint64_t seed)
    : m_w(std::max(0, w))
    , m_h(std::max(0, h))
    , m_seed(seed)
    , m_tiles(static_cast<std::size_t>(std::max(0, w)) * static_cast<std::size_t>(std::max(0, h)))
{
}

bool World::terrainAt(int x, int y, Terrain& out) const
{
  const Tile* t = tryAt(x, y);
  if (!t) return false;
  out = t->terrain;
  return true;
}

bool World::elevationAt(int x, int y, float& out) const
{
  const Tile* t = tryAt(x, y);
  if (!t) return false;
  out = t->elevation;
  return true;
}

bool World::exploredAt(int x, int y) const
{
  const Tile* t = tryAt(x, y);
  return t && t->explored;
}

void World::setTerrain(int x, int y, Terrain t)
{
  Tile* tile = tryAt(x, y);
  if (!tile) return;
  tile->terrain = t;
  if (!IsStandingWater(t)) tile->original = t;
}

int World::explore(int x, int y, int radius)
{
  int revealed = 0;
  const int r = std::max(0, radius);
  for (int yy = std::max(0, y - r); yy <= std::min(m_h - 1, y + r); ++yy) {
    for (int xx = std::max(0, x - r); xx <= std::min(m_w - 1, x + r); ++xx) {
      Tile& t = at(xx, yy);
      if (!t.explored) {
        t.explored = true;
        ++revealed;
      }
    }
  }
  return revealed;
}

bool World::isOccupied(int x, int y) const
{
  const Tile* t = tryAt(x, y);
  if (!t) return false;
  return t->building.has_value() || t->zone != Zone::None;
}

bool World::isBuildable(int x, int y) const
{
  const Tile* t = tryAt(x, y);
  if (!t) return false;
  return IsBuildableTerrain(t->terrain) && !t->tree && !t->building.has_value() && t->zone == Zone::None;
}

} // namespace geocity
