#include "geocity/Hash.hpp"

#include "geocity/Buildings.hpp"
#include "geocity/Geology.hpp"
#include "geocity/World.hpp"

#include <cstring>

namespace geocity {

namespace {

// 64-bit FNV-1a
constexpr std::uint64_t kFNVOffset = 1469598103934665603ull;
constexpr std::uint64_t kFNVPrime = 1099511628211ull;

inline void HashByte(std::uint64_t& h, std::uint8_t b)
{
  h ^= static_cast<std::uint64_t>(b);
  h *= kFNVPrime;
}

inline void HashU32(std::uint64_t& h, std::uint32_t v)
{
  for (int i = 0; i < 4; ++i) HashByte(h, static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
}

inline void HashU64(std::uint64_t& h, std::uint64_t v)
{
  for (int i = 0; i < 8; ++i) HashByte(h, static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFull));
}

inline void HashI32(std::uint64_t& h, int v)
{
  const std::int32_t sv = static_cast<std::int32_t>(v);
  std::uint32_t uv = 0;
  std::memcpy(&uv, &sv, sizeof(uv));
  HashU32(h, uv);
}

inline void HashF32(std::uint64_t& h, float v)
{
  static_assert(sizeof(float) == 4, "float must be 32-bit");
  std::uint32_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  HashU32(h, bits);
}

inline void HashBool(std::uint64_t& h, bool b) { HashByte(h, static_cast<std::uint8_t>(b ? 1 : 0)); }

inline void HashTile(std::uint64_t& h, const Tile& t)
{
  HashByte(h, static_cast<std::uint8_t>(t.terrain));
  HashByte(h, static_cast<std::uint8_t>(t.original));
  HashF32(h, t.elevation);

  HashByte(h, static_cast<std::uint8_t>((t.explored ? 1u : 0u) | (t.tree ? 2u : 0u) | (t.road ? 4u : 0u) |
                                        (t.berry ? 8u : 0u)));
  HashByte(h, static_cast<std::uint8_t>(t.zone));

  HashBool(h, t.building.has_value());
  if (t.building) {
    HashU32(h, t.building->id);
    HashByte(h, static_cast<std::uint8_t>(t.building->kind));
    HashI32(h, t.building->population);
  }

  HashBool(h, t.resource.has_value());
  if (t.resource) {
    HashByte(h, static_cast<std::uint8_t>(t.resource->kind));
    HashI32(h, t.resource->amount);
    HashF32(h, t.resource->metalYield);
  }

  HashI32(h, t.stoneDeposit);
}

} // namespace

std::uint64_t HashWorld(const World& world)
{
  std::uint64_t h = kFNVOffset;

  HashI32(h, world.width());
  HashI32(h, world.height());
  HashU64(h, world.seed());

  for (int y = 0; y < world.height(); ++y) {
    for (int x = 0; x < world.width(); ++x) {
      HashTile(h, world.at(x, y));
    }
  }

  return h;
}

std::uint64_t HashTerrainGrid(const World& world)
{
  std::uint64_t h = kFNVOffset;
  HashI32(h, world.width());
  HashI32(h, world.height());
  for (std::size_t i = 0; i < world.tileCount(); ++i) HashByte(h, static_cast<std::uint8_t>(world.atIndex(i).terrain));
  return h;
}

std::uint64_t HashBuildings(const BuildingList& buildings)
{
  std::uint64_t h = kFNVOffset;
  HashU64(h, static_cast<std::uint64_t>(buildings.size()));
  for (const Building& b : buildings.entries()) {
    HashU32(h, b.id);
    HashByte(h, static_cast<std::uint8_t>(b.kind));
    HashI32(h, b.x);
    HashI32(h, b.y);
    HashI32(h, b.population);
  }
  return h;
}

std::uint64_t HashGeologyState(const GeologyState& s)
{
  std::uint64_t h = kFNVOffset;
  HashF32(h, s.currentSeaLevel);
  HashI32(h, s.periodIndex);
  HashI32(h, s.centuriesInPeriod);
  HashI32(h, s.lastUpdateYear);
  HashI32(h, s.tilesFlooded);
  HashI32(h, s.tilesDrained);
  HashI32(h, s.populationDrowned);
  return h;
}

} // namespace geocity
