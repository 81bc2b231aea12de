#pragma once

#include <cstdint>

namespace geocity {

class World;
class BuildingList;
struct GeologyState;

// Stable, cross-platform (endianness-independent) 64-bit FNV-1a hashes of core state.
//
// Used by regression tests ("same seed => same world") and the CLI summary.
// The values are not a persistent format: compare two runs of the same build
// rather than hard-coding constants.

std::uint64_t HashWorld(const World& world);
std::uint64_t HashBuildings(const BuildingList& buildings);
std::uint64_t HashGeologyState(const GeologyState& state);

// Terrain types only (row-major), ignoring elevation and occupancy.
std::uint64_t HashTerrainGrid(const World& world);

} // namespace geocity
