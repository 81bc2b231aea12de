#pragma once

#include "geocity/Buildings.hpp"
#include "geocity/Flood.hpp"
#include "geocity/Geology.hpp"
#include "geocity/Narrative.hpp"
#include "geocity/World.hpp"

#include <optional>
#include <string>
#include <vector>

namespace geocity {

// Everything one geological step did.
struct GeologyStepReport {
  int year = 0;

  // Period entered on this step (copied so the report outlives config changes).
  std::optional<GeologicalPeriod> enteredPeriod;

  float seaLevelBefore = 0.0f;
  float seaLevelAfter = 0.0f;

  // The flood pass only runs when the level moved.
  bool floodPassRan = false;
  FloodResult flood;

  // Transition, rising water (on a rise only; a falling level is silent), flood, wells lost.
  std::vector<NarrativeEvent> events;
};

// Drives the geological cycle from the surrounding turn loop.
//
// The simulator owns the GeologyClock; the world, building list and settlement
// totals are owned by the caller and passed in for each call. Calls must be
// serialized: a step mutates the grid and the list in one pass.
class GeologySimulator {
public:
  GeologySimulator() = default;

  bool configure(const GeologyConfig& cfg, std::string& outError);

  // Runs one step if updateIntervalYears have elapsed since the last update.
  // Returns true (and fills outReport if non-null) when a step ran.
  bool advanceToYear(int year, World& world, BuildingList& buildings, Settlement& settlement, const PlayerView& player,
                     GeologyStepReport* outReport = nullptr);

  // Unconditional step: tick the clock, move the sea level, flood/drain when it
  // moved, then settle the outcome on the settlement and the geology counters.
  GeologyStepReport stepOnce(int year, World& world, BuildingList& buildings, Settlement& settlement,
                             const PlayerView& player);

  // Floods and drains a freshly generated world to where the restored state left
  // it, typically right after clock().restore(). The result is not applied: the
  // restored counters already include those floods.
  FloodResult syncToSeaLevel(World& world, BuildingList& buildings) const;

  const GeologyClock& clock() const { return m_clock; }
  GeologyClock& clock() { return m_clock; }

private:
  GeologyClock m_clock;
};

} // namespace geocity
