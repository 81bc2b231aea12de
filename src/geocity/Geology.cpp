#include "geocity/Geology.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geocity {

std::vector<GeologicalPeriod> DefaultGeologicalPeriods()
{
  return {
      {"Warm Interglacial", 100, 3.0f},
      {"Early Glaciation", 50, 2.5f},
      {"Ice Age Peak", 80, 1.5f},
      {"Glacial Melt", 30, 3.5f},
      {"Flood Period", 20, 4.0f},
      {"Stabilization", 50, 3.0f},
  };
}

bool ValidateGeologyConfig(const GeologyConfig& cfg, std::string& outError)
{
  if (cfg.periods.empty()) {
    outError = "geology needs at least one geological period";
    return false;
  }
  for (std::size_t i = 0; i < cfg.periods.size(); ++i) {
    const GeologicalPeriod& p = cfg.periods[i];
    if (p.duration < 1) {
      std::ostringstream oss;
      oss << "period " << i << " ('" << p.name << "') must last at least 1 tick";
      outError = oss.str();
      return false;
    }
    if (!std::isfinite(p.targetSeaLevel)) {
      std::ostringstream oss;
      oss << "period " << i << " ('" << p.name << "') has a non-finite target sea level";
      outError = oss.str();
      return false;
    }
  }
  if (!(cfg.seaLevelMin <= cfg.seaLevelMax)) {
    outError = "sea_level_min must be <= sea_level_max";
    return false;
  }
  if (!(cfg.changeRate > 0.0f)) {
    outError = "change_rate must be > 0";
    return false;
  }
  if (cfg.updateIntervalYears < 1) {
    outError = "update_interval_years must be >= 1";
    return false;
  }
  if (cfg.floodWarningMargin < 0.0f) {
    outError = "flood_warning_margin must be >= 0";
    return false;
  }
  return true;
}

bool operator==(const GeologyState& a, const GeologyState& b)
{
  return a.currentSeaLevel == b.currentSeaLevel && a.periodIndex == b.periodIndex &&
         a.centuriesInPeriod == b.centuriesInPeriod && a.lastUpdateYear == b.lastUpdateYear &&
         a.tilesFlooded == b.tilesFlooded && a.tilesDrained == b.tilesDrained &&
         a.populationDrowned == b.populationDrowned;
}

GeologyState MakeInitialGeologyState(const GeologyConfig& cfg)
{
  GeologyState s;
  s.periodIndex = 0;
  s.centuriesInPeriod = 0;
  s.lastUpdateYear = 0;
  s.currentSeaLevel = std::clamp(cfg.periods.front().targetSeaLevel, cfg.seaLevelMin, cfg.seaLevelMax);
  return s;
}

PeriodAdvance AdvancePeriod(const GeologyState& state, const std::vector<GeologicalPeriod>& periods)
{
  PeriodAdvance out;
  out.next = state;
  out.next.centuriesInPeriod++;

  const GeologicalPeriod& cur = periods[static_cast<std::size_t>(state.periodIndex)];
  if (out.next.centuriesInPeriod >= cur.duration) {
    out.next.periodIndex = (state.periodIndex + 1) % static_cast<int>(periods.size());
    out.next.centuriesInPeriod = 0;
    out.entered = &periods[static_cast<std::size_t>(out.next.periodIndex)];
  }
  return out;
}

float StepSeaLevel(float current, float target, float rate, float minLevel, float maxLevel)
{
  float next = current;
  if (current < target) {
    next = std::min(target, current + rate);
  } else if (current > target) {
    next = std::max(target, current - rate);
  }
  return std::clamp(next, minLevel, maxLevel);
}

SeaLevelTrend TrendToward(float current, float target)
{
  if (target > current) return SeaLevelTrend::Rising;
  if (target < current) return SeaLevelTrend::Receding;
  return SeaLevelTrend::Stable;
}

const char* ToString(SeaLevelTrend t)
{
  switch (t) {
  case SeaLevelTrend::Rising: return "rising";
  case SeaLevelTrend::Receding: return "receding";
  case SeaLevelTrend::Stable: return "stable";
  default: return "unknown";
  }
}

float ElevationCostMultiplier(float elevation, float threshold, float perLevel)
{
  const float level = std::floor(elevation);
  if (level < threshold) return 1.0f;
  return 1.0f + (level - threshold) * perLevel;
}

bool GeologyClock::configure(const GeologyConfig& cfg, std::string& outError)
{
  if (!ValidateGeologyConfig(cfg, outError)) return false;
  m_cfg = cfg;
  m_state = MakeInitialGeologyState(m_cfg);
  m_configured = true;
  return true;
}

bool GeologyClock::restore(const GeologyState& state, std::string& outError)
{
  if (!m_configured) {
    outError = "geology clock is not configured";
    return false;
  }
  if (state.periodIndex < 0 || state.periodIndex >= static_cast<int>(m_cfg.periods.size())) {
    std::ostringstream oss;
    oss << "period_index " << state.periodIndex << " out of range (" << m_cfg.periods.size() << " periods)";
    outError = oss.str();
    return false;
  }
  if (state.centuriesInPeriod < 0) {
    outError = "centuries_in_period must be >= 0";
    return false;
  }
  if (!std::isfinite(state.currentSeaLevel) || state.currentSeaLevel < m_cfg.seaLevelMin ||
      state.currentSeaLevel > m_cfg.seaLevelMax) {
    outError = "current_sea_level outside the configured bounds";
    return false;
  }
  m_state = state;
  return true;
}

const GeologicalPeriod* GeologyClock::tick()
{
  if (!m_configured) return nullptr;
  const PeriodAdvance adv = AdvancePeriod(m_state, m_cfg.periods);
  m_state = adv.next;
  return adv.entered;
}

float GeologyClock::stepSeaLevel()
{
  if (!m_configured) return m_state.currentSeaLevel;
  m_state.currentSeaLevel =
      StepSeaLevel(m_state.currentSeaLevel, targetSeaLevel(), m_cfg.changeRate, m_cfg.seaLevelMin, m_cfg.seaLevelMax);
  return m_state.currentSeaLevel;
}

const GeologicalPeriod* GeologyClock::currentPeriod() const
{
  if (!m_configured) return nullptr;
  return &m_cfg.periods[static_cast<std::size_t>(m_state.periodIndex)];
}

float GeologyClock::targetSeaLevel() const
{
  const GeologicalPeriod* p = currentPeriod();
  return p ? p->targetSeaLevel : m_state.currentSeaLevel;
}

SeaLevelTrend GeologyClock::trend() const
{
  return TrendToward(m_state.currentSeaLevel, targetSeaLevel());
}

bool GeologyClock::dueForUpdate(int year) const
{
  if (!m_configured || !m_cfg.enabled) return false;
  return year - m_state.lastUpdateYear >= m_cfg.updateIntervalYears;
}

} // namespace geocity
