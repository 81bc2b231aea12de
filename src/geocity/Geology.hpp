#pragma once

#include <string>
#include <vector>

namespace geocity {

// Named phase of the sea-level cycle.
struct GeologicalPeriod {
  std::string name;
  int duration = 1;             // in geological ticks (centuries)
  float targetSeaLevel = 3.0f;
};

// Warm Interglacial -> Early Glaciation -> Ice Age Peak -> Glacial Melt -> Flood Period -> Stabilization.
std::vector<GeologicalPeriod> DefaultGeologicalPeriods();

struct GeologyConfig {
  bool enabled = true;

  std::vector<GeologicalPeriod> periods = DefaultGeologicalPeriods();

  float seaLevelMin = 1.0f;
  float seaLevelMax = 6.0f;
  float changeRate = 0.1f; // sea level change per tick

  int updateIntervalYears = 100; // one tick per interval

  float floodWarningMargin = 1.0f;

  // Building cost grows by costIncreasePerLevel per whole elevation level above costThreshold.
  float costThreshold = 4.0f;
  float costIncreasePerLevel = 0.10f;
};

bool ValidateGeologyConfig(const GeologyConfig& cfg, std::string& outError);

struct GeologyState {
  float currentSeaLevel = 3.0f;
  int periodIndex = 0;
  int centuriesInPeriod = 0;
  int lastUpdateYear = 0;

  // Lifetime counters.
  int tilesFlooded = 0;
  int tilesDrained = 0;
  int populationDrowned = 0;
};

bool operator==(const GeologyState& a, const GeologyState& b);
inline bool operator!=(const GeologyState& a, const GeologyState& b) { return !(a == b); }

// Index 0 with period 0's target (clamped to the bounds) as the starting level.
// Requires a non-empty period list.
GeologyState MakeInitialGeologyState(const GeologyConfig& cfg);

struct PeriodAdvance {
  GeologyState next;

  // The period entered on this tick, or nullptr when no boundary was crossed.
  // Points into the period list passed to AdvancePeriod().
  const GeologicalPeriod* entered = nullptr;

  bool crossed() const { return entered != nullptr; }
};

// Pure transition: one tick of period time. Requires a non-empty list and a
// valid periodIndex.
PeriodAdvance AdvancePeriod(const GeologyState& state, const std::vector<GeologicalPeriod>& periods);

// Moves `current` toward `target` by at most `rate` without overshooting, then
// clamps to [minLevel, maxLevel].
float StepSeaLevel(float current, float target, float rate, float minLevel, float maxLevel);

enum class SeaLevelTrend : unsigned char {
  Rising = 0,
  Receding,
  Stable,
};

SeaLevelTrend TrendToward(float current, float target);
const char* ToString(SeaLevelTrend t);

// 1.0 below the threshold, then +perLevel for every whole level above it.
float ElevationCostMultiplier(float elevation, float threshold, float perLevel);

// Drives the period cycle and the sea level.
//
// A default-constructed clock is inert until configure() succeeds: tick() returns
// nullptr and stepSeaLevel() leaves the level unchanged.
class GeologyClock {
public:
  GeologyClock() = default;

  // Validates the config and resets the state to MakeInitialGeologyState().
  bool configure(const GeologyConfig& cfg, std::string& outError);

  // Replaces the state (save/load). Rejects snapshots that do not fit the configured periods.
  bool restore(const GeologyState& state, std::string& outError);

  bool configured() const { return m_configured; }

  // One century: returns the period entered, or nullptr.
  const GeologicalPeriod* tick();

  // Applies one rate-limited step toward the active target and returns the new level.
  float stepSeaLevel();

  const GeologicalPeriod* currentPeriod() const;
  float targetSeaLevel() const;
  SeaLevelTrend trend() const;

  // True when at least updateIntervalYears have elapsed since the last update.
  bool dueForUpdate(int year) const;
  void markUpdated(int year) { m_state.lastUpdateYear = year; }

  const GeologyConfig& config() const { return m_cfg; }

  const GeologyState& state() const { return m_state; }
  GeologyState& state() { return m_state; }

private:
  GeologyConfig m_cfg;
  GeologyState m_state;
  bool m_configured = false;
};

} // namespace geocity
