#pragma once

#include "geocity/Geology.hpp"
#include "geocity/Json.hpp"
#include "geocity/ProcGen.hpp"

#include <string>

namespace geocity {

// JSON helpers for WorldGenConfig, GeologyConfig and GeologyState.
//
// Configs use merge semantics: missing keys leave the existing value unchanged,
// keys of the wrong type are errors. Field names are snake_case.

JsonValue WorldGenConfigToJsonValue(const WorldGenConfig& cfg);
JsonValue GeologyConfigToJsonValue(const GeologyConfig& cfg);

std::string WorldGenConfigToJson(const WorldGenConfig& cfg, int indentSpaces = 2);
std::string GeologyConfigToJson(const GeologyConfig& cfg, int indentSpaces = 2);
std::string CombinedConfigToJson(const WorldGenConfig& worldgen, const GeologyConfig& geology, int indentSpaces = 2);

bool ApplyWorldGenConfigJson(const JsonValue& root, WorldGenConfig& ioCfg, std::string& outError);

// A present "periods" array replaces the whole period list.
bool ApplyGeologyConfigJson(const JsonValue& root, GeologyConfig& ioCfg, std::string& outError);

// {"worldgen": {...}, "geology": {...}}; either section may be absent.
struct CombinedConfig {
  WorldGenConfig worldgen{};
  GeologyConfig geology{};
  bool hasWorldGen = false;
  bool hasGeology = false;
};

// Sections are merged into fresh default configs.
bool ParseCombinedConfigJson(const JsonValue& root, CombinedConfig& outCfg, std::string& outError);
bool LoadCombinedConfigJsonFile(const std::string& path, CombinedConfig& outCfg, std::string& outError);

bool WriteCombinedConfigJsonFile(const std::string& path, const WorldGenConfig& worldgen, const GeologyConfig& geology,
                                 std::string& outError);

// GeologyState snapshot. Every field is required on read; floats round-trip exactly.
JsonValue GeologyStateToJsonValue(const GeologyState& state);
bool ParseGeologyStateJson(const JsonValue& root, GeologyState& outState, std::string& outError);

bool WriteGeologyStateJsonFile(const std::string& path, const GeologyState& state, std::string& outError);
bool LoadGeologyStateJsonFile(const std::string& path, GeologyState& outState, std::string& outError);

} // namespace geocity
