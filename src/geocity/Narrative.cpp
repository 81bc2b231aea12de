#include "geocity/Narrative.hpp"

#include <cmath>
#include <sstream>

namespace geocity {

const char* NarrativeToneName(NarrativeTone t)
{
  switch (t) {
  case NarrativeTone::Good: return "good";
  case NarrativeTone::Neutral: return "neutral";
  case NarrativeTone::Bad: return "bad";
  case NarrativeTone::Alert: return "alert";
  default: return "neutral";
  }
}

const char* ToString(FloodSeverity s)
{
  switch (s) {
  case FloodSeverity::Minor: return "minor";
  case FloodSeverity::Severe: return "severe";
  case FloodSeverity::Catastrophe: return "catastrophe";
  default: return "minor";
  }
}

FloodSeverity ClassifyFloodSeverity(int populationDrowned)
{
  if (populationDrowned > 100) return FloodSeverity::Catastrophe;
  if (populationDrowned > 20) return FloodSeverity::Severe;
  return FloodSeverity::Minor;
}

NarrativeEvent MakePeriodTransitionEvent(float seaLevelAtTransition, const GeologicalPeriod& entered)
{
  NarrativeEvent ev;
  std::ostringstream oss;
  oss << entered.name << " begins";

  switch (TrendToward(seaLevelAtTransition, entered.targetSeaLevel)) {
  case SeaLevelTrend::Rising:
    oss << "! Waters are rising as ice melts...";
    ev.tone = NarrativeTone::Alert;
    ev.tag = "period.rising";
    ev.durationMs = 5000;
    break;
  case SeaLevelTrend::Receding:
    oss << "! Waters recede as glaciers grow...";
    ev.tone = NarrativeTone::Good;
    ev.tag = "period.receding";
    ev.durationMs = 5000;
    break;
  default:
    oss << ".";
    ev.tone = NarrativeTone::Neutral;
    ev.tag = "period.stable";
    ev.durationMs = 3000;
    break;
  }

  ev.headline = oss.str();
  return ev;
}

NarrativeEvent MakeFloodEvent(int populationDrowned, const std::string& periodName)
{
  NarrativeEvent ev;
  std::ostringstream oss;

  switch (ClassifyFloodSeverity(populationDrowned)) {
  case FloodSeverity::Catastrophe:
    oss << "CATASTROPHE! " << populationDrowned << " perished in the great flood! The " << periodName
        << " brought destruction. Where you build matters...";
    ev.tone = NarrativeTone::Alert;
    ev.tag = "flood.catastrophe";
    ev.durationMs = 8000;
    break;
  case FloodSeverity::Severe:
    oss << populationDrowned << " drowned in rising waters! Some areas may be safer than others...";
    ev.tone = NarrativeTone::Bad;
    ev.tag = "flood.severe";
    ev.durationMs = 6000;
    break;
  default:
    oss << populationDrowned << " lost to rising waters. Perhaps higher ground would be wiser...";
    ev.tone = NarrativeTone::Bad;
    ev.tag = "flood.minor";
    ev.durationMs = 5000;
    break;
  }

  ev.headline = oss.str();
  return ev;
}

NarrativeEvent MakeWellsLostEvent(int wellsLost)
{
  NarrativeEvent ev;
  std::ostringstream oss;
  oss << wellsLost << " well" << (wellsLost > 1 ? "s" : "") << " swallowed by the sea!";
  ev.tone = NarrativeTone::Bad;
  ev.tag = "flood.wells";
  ev.headline = oss.str();
  ev.durationMs = 4000;
  return ev;
}

NarrativeEvent MakeRisingWaterEvent()
{
  NarrativeEvent ev;
  ev.tone = NarrativeTone::Neutral;
  ev.tag = "sea.creep";
  ev.headline = "The waters creep higher. Coastal areas at risk.";
  ev.durationMs = 4000;
  return ev;
}

bool CrossesTenth(float oldLevel, float newLevel)
{
  return std::floor(oldLevel * 10.0f) != std::floor(newLevel * 10.0f);
}

} // namespace geocity
