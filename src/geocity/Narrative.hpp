#pragma once

#include "geocity/Geology.hpp"

#include <cstdint>
#include <string>

namespace geocity {

// Player-facing messages derived from geological events.
// Plain value objects; presentation (toasts, logs, dossiers) is up to the caller.

enum class NarrativeTone : std::uint8_t {
  Good = 0,
  Neutral = 1,
  Bad = 2,
  Alert = 3,
};

const char* NarrativeToneName(NarrativeTone t);

enum class FloodSeverity : std::uint8_t {
  Minor = 0,
  Severe = 1,
  Catastrophe = 2,
};

const char* ToString(FloodSeverity s);

struct NarrativeEvent {
  NarrativeTone tone = NarrativeTone::Neutral;
  std::string tag; // stable machine-readable key, e.g. "flood.severe"
  std::string headline;
  int durationMs = 4000; // suggested on-screen time
};

// > 100 drowned => Catastrophe, > 20 => Severe, otherwise Minor.
FloodSeverity ClassifyFloodSeverity(int populationDrowned);

// Announces a new period. The wording follows the direction from the level at
// the moment of transition to the new period's target.
NarrativeEvent MakePeriodTransitionEvent(float seaLevelAtTransition, const GeologicalPeriod& entered);

NarrativeEvent MakeFloodEvent(int populationDrowned, const std::string& periodName);

NarrativeEvent MakeWellsLostEvent(int wellsLost);

NarrativeEvent MakeRisingWaterEvent();

// True when a rise moved the level into a new tenth (floor(level*10) changed).
bool CrossesTenth(float oldLevel, float newLevel);

} // namespace geocity
