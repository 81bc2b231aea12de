#include "geocity/Sim.hpp"

#include <utility>

namespace geocity {

bool GeologySimulator::configure(const GeologyConfig& cfg, std::string& outError)
{
  return m_clock.configure(cfg, outError);
}

bool GeologySimulator::advanceToYear(int year, World& world, BuildingList& buildings, Settlement& settlement,
                                     const PlayerView& player, GeologyStepReport* outReport)
{
  if (!m_clock.dueForUpdate(year)) return false;

  GeologyStepReport rep = stepOnce(year, world, buildings, settlement, player);
  if (outReport) *outReport = std::move(rep);
  return true;
}

FloodResult GeologySimulator::syncToSeaLevel(World& world, BuildingList& buildings) const
{
  if (!m_clock.configured()) return FloodResult{};

  // Zero counters mean every pass so far was a no-op and the generated world is
  // already current. Otherwise the last pass ran at the current level.
  const GeologyState& st = m_clock.state();
  if (st.tilesFlooded == 0 && st.tilesDrained == 0) return FloodResult{};
  return RunFloodPass(world, buildings, PlayerView{}, m_clock.state().currentSeaLevel);
}

GeologyStepReport GeologySimulator::stepOnce(int year, World& world, BuildingList& buildings, Settlement& settlement,
                                             const PlayerView& player)
{
  GeologyStepReport rep;
  rep.year = year;
  rep.seaLevelBefore = m_clock.state().currentSeaLevel;
  rep.seaLevelAfter = rep.seaLevelBefore;

  if (!m_clock.configured()) return rep;

  m_clock.markUpdated(year);

  if (const GeologicalPeriod* entered = m_clock.tick()) {
    rep.enteredPeriod = *entered;
    rep.events.push_back(MakePeriodTransitionEvent(rep.seaLevelBefore, *entered));
  }

  rep.seaLevelAfter = m_clock.stepSeaLevel();
  if (rep.seaLevelAfter == rep.seaLevelBefore) return rep;

  if (rep.seaLevelAfter > rep.seaLevelBefore && CrossesTenth(rep.seaLevelBefore, rep.seaLevelAfter)) {
    rep.events.push_back(MakeRisingWaterEvent());
  }

  rep.flood = RunFloodPass(world, buildings, player, rep.seaLevelAfter);
  rep.floodPassRan = true;
  ApplyFloodOutcome(rep.flood, settlement, m_clock.state());

  if (rep.flood.populationDrowned > 0) {
    const GeologicalPeriod* p = m_clock.currentPeriod();
    rep.events.push_back(MakeFloodEvent(rep.flood.populationDrowned, p ? p->name : std::string()));
  }
  if (rep.flood.wellsLost > 0) rep.events.push_back(MakeWellsLostEvent(rep.flood.wellsLost));

  return rep;
}

} // namespace geocity
