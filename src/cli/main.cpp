#include "cli/CliParse.hpp"

#include "geocity/Buildings.hpp"
#include "geocity/ConfigIO.hpp"
#include "geocity/FloodRisk.hpp"
#include "geocity/Hash.hpp"
#include "geocity/Json.hpp"
#include "geocity/LogTee.hpp"
#include "geocity/ProcGen.hpp"
#include "geocity/Random.hpp"
#include "geocity/Sim.hpp"
#include "geocity/TerrainStats.hpp"
#include "geocity/Version.hpp"

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace geocity;
using geocity::cli::EnsureParentDir;
using geocity::cli::HexU64;
using geocity::cli::ParseBool01;
using geocity::cli::ParseF32;
using geocity::cli::ParseI32;
using geocity::cli::ParseU64;
using geocity::cli::ParseWxH;

constexpr std::uint64_t kSaltSettle = 0x534554544C45ULL;

void PrintHelp()
{
  std::cout
      << "geocity_cli (headless world generation + geological cycle runner)\n\n"
      << "Usage:\n"
      << "  geocity_cli [--seed <u64>] [--size <WxH>] [--years <N>] [--config <cfg.json>]\n"
      << "              [--sea-level <F>] [--water-features <0|1>] [--settle <N>]\n"
      << "              [--state-in <state.json>] [--state-out <state.json>]\n"
      << "              [--write-config <cfg.json>] [--json <summary.json|->] [--quiet]\n"
      << "              [--log <file>] [--log-keep <N>] [--version]\n\n"
      << "Notes:\n"
      << "  - The world is generated from (--seed, --size) and the worldgen section of --config.\n"
      << "  - --years advances the geological simulator year by year; a step runs every\n"
      << "    update_interval_years (geology section). Years count from the snapshot's\n"
      << "    last update when --state-in is given.\n"
      << "  - --settle places N seeded demo households (2x2 residential + a well) so floods\n"
      << "    have something to destroy.\n"
      << "  - The summary carries stable 64-bit hashes of the final world, buildings and\n"
      << "    geology state.\n";
}

struct SettleResult {
  int households = 0;
  int wells = 0;

  // The player lives in the first household.
  bool hasHome = false;
  int homeX = 0;
  int homeY = 0;
};

// Deterministic demo settlement: households land on random buildable sites.
SettleResult SettleDemo(World& world, BuildingList& buildings, std::uint64_t seed, int households)
{
  SettleResult out;
  if (households <= 0 || world.empty()) return out;

  RNG rng(DeriveSeed(seed, kSaltSettle));
  const int maxAttempts = households * 200;
  for (int attempt = 0; attempt < maxAttempts && out.households < households; ++attempt) {
    const int x = rng.rangeInt(0, world.width() - 1);
    const int y = rng.rangeInt(0, world.height() - 1);
    const int pop = rng.rangeInt(4, 16);

    if (PlaceBuilding(world, buildings, BuildingKind::Residential, x, y, pop) != PlaceResult::Placed) continue;
    ++out.households;

    // A well next door if the ground allows it.
    if (PlaceBuilding(world, buildings, BuildingKind::Well, x + 2, y, 0) == PlaceResult::Placed ||
        PlaceBuilding(world, buildings, BuildingKind::Well, x, y + 2, 0) == PlaceResult::Placed) {
      ++out.wells;
    }

    if (!out.hasHome) {
      out.hasHome = true;
      out.homeX = x;
      out.homeY = y;
    }
  }
  return out;
}

JsonValue Num(double v) { return JsonValue::MakeNumber(v); }

JsonValue BuildSummary(const World& world, const BuildingList& buildings, const Settlement& settlement,
                       const SettleResult& settled, bool playerDrowned, const GeologySimulator& sim, int yearsRun,
                       int stepsRun)
{
  const TerrainStats ts = ComputeTerrainStats(world);
  const GeologyClock& clock = sim.clock();
  const GeologyState& st = clock.state();

  JsonValue root = JsonValue::MakeObject();
  root.set("version", JsonValue::MakeString(GeoCityFullVersionString()));
  root.set("width", Num(world.width()));
  root.set("height", Num(world.height()));
  root.set("seed", JsonValue::MakeString(HexU64(world.seed())));

  JsonValue hashes = JsonValue::MakeObject();
  hashes.set("world", JsonValue::MakeString(HexU64(HashWorld(world))));
  hashes.set("terrain", JsonValue::MakeString(HexU64(HashTerrainGrid(world))));
  hashes.set("buildings", JsonValue::MakeString(HexU64(HashBuildings(buildings))));
  hashes.set("geology", JsonValue::MakeString(HexU64(HashGeologyState(st))));
  root.set("hashes", std::move(hashes));

  JsonValue terrain = JsonValue::MakeObject();
  for (std::uint8_t i = 0; i < kTerrainCount; ++i) {
    const Terrain t = static_cast<Terrain>(i);
    terrain.set(ToString(t), Num(ts.count(t)));
  }
  terrain.set("land_percent", Num(ts.landPercent()));
  terrain.set("water_percent", Num(ts.waterPercent()));
  terrain.set("trees", Num(ts.treeTiles));
  terrain.set("resources", Num(ts.resourceTiles));
  terrain.set("min_elevation", Num(ts.minElevation));
  terrain.set("max_elevation", Num(ts.maxElevation));
  terrain.set("mean_elevation", Num(ts.meanElevation));
  root.set("terrain", std::move(terrain));

  JsonValue settle = JsonValue::MakeObject();
  settle.set("structures", Num(static_cast<double>(buildings.size())));
  settle.set("population", Num(settlement.population));
  settle.set("wells", Num(settlement.wellCount));
  root.set("settlement", std::move(settle));

  JsonValue player = JsonValue::MakeObject();
  player.set("settled", JsonValue::MakeBool(settled.hasHome));
  player.set("x", Num(settled.homeX));
  player.set("y", Num(settled.homeY));
  player.set("player_drowned", JsonValue::MakeBool(playerDrowned));
  root.set("player", std::move(player));

  JsonValue geo = JsonValue::MakeObject();
  geo.set("years_run", Num(yearsRun));
  geo.set("steps_run", Num(stepsRun));
  const GeologicalPeriod* period = clock.currentPeriod();
  geo.set("period", JsonValue::MakeString(period ? period->name : std::string()));
  geo.set("target_sea_level", Num(clock.targetSeaLevel()));
  geo.set("trend", JsonValue::MakeString(ToString(clock.trend())));
  geo.set("state", GeologyStateToJsonValue(st));
  root.set("geology", std::move(geo));

  const float margin = clock.config().floodWarningMargin;
  const FloodRiskReport risk = ComputeFloodRisk(world, buildings, clock.targetSeaLevel(), margin);
  JsonValue riskJ = JsonValue::MakeObject();
  riskJ.set("sea_level", Num(risk.seaLevel));
  for (std::size_t i = 0; i < kFloodRiskLevelCount; ++i) {
    const FloodRiskLevel l = static_cast<FloodRiskLevel>(i);
    riskJ.set(ToString(l), Num(risk.count(l)));
  }
  riskJ.set("structures_at_risk", Num(risk.structuresAtRisk));
  riskJ.set("population_at_risk", Num(risk.populationAtRisk));
  riskJ.set("wells_at_risk", Num(risk.wellsAtRisk));
  root.set("flood_risk_at_target", std::move(riskJ));

  return root;
}

void PrintStep(const GeologyStepReport& rep)
{
  std::cout << "geocity_cli: year " << rep.year << " sea " << rep.seaLevelBefore << " -> " << rep.seaLevelAfter;
  if (rep.floodPassRan) {
    std::cout << " flooded " << rep.flood.tilesFlooded << " drained " << rep.flood.tilesDrained << " lost "
              << rep.flood.buildingsLost.size() << " drowned " << rep.flood.populationDrowned;
  }
  std::cout << "\n";
  for (const NarrativeEvent& e : rep.events) {
    std::cout << "geocity_cli:   [" << NarrativeToneName(e.tone) << "] " << e.tag << ": " << e.headline << "\n";
  }
}

} // namespace

int main(int argc, char** argv)
{
  using namespace geocity;

  std::uint64_t seed = 1;
  int w = 96;
  int h = 96;
  int years = 0;
  int settleCount = 0;
  bool quiet = false;

  std::string configPath;
  std::string writeConfigPath;
  std::string stateInPath;
  std::string stateOutPath;
  std::string jsonPath;

  bool seaLevelOverride = false;
  float seaLevel = 0.0f;
  bool waterFeaturesOverride = false;
  bool waterFeatures = false;

  LogTeeOptions logOpt;

  auto requireValue = [&](int& i, std::string& out) -> bool {
    if (i + 1 >= argc) return false;
    out = argv[++i];
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    std::string val;

    if (arg == "--help" || arg == "-h") {
      PrintHelp();
      return 0;
    } else if (arg == "--version") {
      std::cout << "geocity_cli " << GeoCityFullVersionString() << "\n";
      return 0;
    } else if (arg == "--seed") {
      if (!requireValue(i, val) || !ParseU64(val, &seed)) {
        std::cerr << "--seed requires a valid integer (decimal or 0x...)\n";
        return 2;
      }
    } else if (arg == "--size") {
      if (!requireValue(i, val) || !ParseWxH(val, &w, &h)) {
        std::cerr << "--size requires format WxH (e.g. 128x128)\n";
        return 2;
      }
    } else if (arg == "--years") {
      if (!requireValue(i, val) || !ParseI32(val, &years) || years < 0) {
        std::cerr << "--years requires a non-negative integer\n";
        return 2;
      }
    } else if (arg == "--settle") {
      if (!requireValue(i, val) || !ParseI32(val, &settleCount) || settleCount < 0) {
        std::cerr << "--settle requires a non-negative integer\n";
        return 2;
      }
    } else if (arg == "--config") {
      if (!requireValue(i, val)) {
        std::cerr << "--config requires a path\n";
        return 2;
      }
      configPath = val;
    } else if (arg == "--write-config") {
      if (!requireValue(i, val)) {
        std::cerr << "--write-config requires a path\n";
        return 2;
      }
      writeConfigPath = val;
    } else if (arg == "--state-in") {
      if (!requireValue(i, val)) {
        std::cerr << "--state-in requires a path\n";
        return 2;
      }
      stateInPath = val;
    } else if (arg == "--state-out") {
      if (!requireValue(i, val)) {
        std::cerr << "--state-out requires a path\n";
        return 2;
      }
      stateOutPath = val;
    } else if (arg == "--json" || arg == "--out") {
      if (!requireValue(i, val)) {
        std::cerr << arg << " requires a path (or - for stdout)\n";
        return 2;
      }
      jsonPath = val;
    } else if (arg == "--sea-level") {
      if (!requireValue(i, val) || !ParseF32(val, &seaLevel)) {
        std::cerr << "--sea-level requires a number\n";
        return 2;
      }
      seaLevelOverride = true;
    } else if (arg == "--water-features") {
      if (!requireValue(i, val) || !ParseBool01(val, &waterFeatures)) {
        std::cerr << "--water-features requires 0 or 1\n";
        return 2;
      }
      waterFeaturesOverride = true;
    } else if (arg == "--quiet" || arg == "-q") {
      quiet = true;
    } else if (arg == "--log") {
      if (!requireValue(i, val)) {
        std::cerr << "--log requires a path\n";
        return 2;
      }
      logOpt.path = val;
    } else if (arg == "--log-keep") {
      if (!requireValue(i, val) || !ParseI32(val, &logOpt.keepFiles) || logOpt.keepFiles < 0) {
        std::cerr << "--log-keep requires a non-negative integer\n";
        return 2;
      }
    } else {
      std::cerr << "Unknown argument: " << arg << "\n\n";
      PrintHelp();
      return 2;
    }
  }

  LogTee logTee;
  if (!logOpt.path.empty()) {
    std::string err;
    if (!logTee.start(logOpt, err)) {
      std::cerr << "geocity_cli: failed to start log: " << err << "\n";
      return 1;
    }
  }

  CombinedConfig cfg;
  if (!configPath.empty()) {
    std::string err;
    if (!LoadCombinedConfigJsonFile(configPath, cfg, err)) {
      std::cerr << "geocity_cli: failed to load config '" << configPath << "': " << err << "\n";
      return 1;
    }
  }
  if (seaLevelOverride) cfg.worldgen.seaLevel = seaLevel;
  if (waterFeaturesOverride) cfg.worldgen.waterFeatures.enabled = waterFeatures;

  {
    std::string err;
    if (!ValidateWorldGenConfig(cfg.worldgen, err)) {
      std::cerr << "geocity_cli: invalid worldgen config: " << err << "\n";
      return 1;
    }
  }

  if (!writeConfigPath.empty()) {
    std::string err;
    if (!EnsureParentDir(writeConfigPath) ||
        !WriteCombinedConfigJsonFile(writeConfigPath, cfg.worldgen, cfg.geology, err)) {
      std::cerr << "geocity_cli: failed to write config '" << writeConfigPath << "': " << err << "\n";
      return 1;
    }
  }

  GeologySimulator sim;
  {
    std::string err;
    if (!sim.configure(cfg.geology, err)) {
      std::cerr << "geocity_cli: invalid geology config: " << err << "\n";
      return 1;
    }
  }

  if (!stateInPath.empty()) {
    GeologyState st;
    std::string err;
    if (!LoadGeologyStateJsonFile(stateInPath, st, err) || !sim.clock().restore(st, err)) {
      std::cerr << "geocity_cli: failed to load geology state '" << stateInPath << "': " << err << "\n";
      return 1;
    }
  }

  std::vector<HighGroundPatch> patches;
  World world = GenerateWorld(w, h, seed, cfg.worldgen, &patches);

  BuildingList buildings;
  const SettleResult settled = SettleDemo(world, buildings, seed, settleCount);

  // The snapshot's counters already hold the floods that led to its sea level:
  // bring the regenerated world there without counting them again.
  if (!stateInPath.empty()) {
    const FloodResult sync = sim.syncToSeaLevel(world, buildings);
    if (!quiet && (sync.tilesFlooded > 0 || sync.tilesDrained > 0)) {
      std::cout << "geocity_cli: resumed at sea level " << sim.clock().state().currentSeaLevel << " (" << sync.tilesFlooded
                << " tile(s) under water, " << sync.tilesDrained << " drained, " << sync.buildingsLost.size()
                << " structure(s) not rebuilt)\n";
    }
  }

  Settlement settlement;
  settlement.population = buildings.totalPopulation();
  settlement.wellCount = buildings.countKind(BuildingKind::Well);

  if (!quiet) {
    std::cout << "geocity_cli: generated " << world.width() << "x" << world.height() << " world, seed "
              << HexU64(world.seed()) << ", " << patches.size() << " high ground patch(es)\n";
    if (settleCount > 0) {
      std::cout << "geocity_cli: settled " << settled.households << "/" << settleCount << " household(s) and "
                << settled.wells << " well(s), population " << settlement.population << "\n";
    }
  }

  const int startYear = sim.clock().state().lastUpdateYear;
  int stepsRun = 0;
  bool playerDrowned = false;
  for (int year = startYear + 1; year <= startYear + years; ++year) {
    PlayerView player;
    if (settled.hasHome && !playerDrowned) player = PlayerViewAtHome(buildings, settlement, settled.homeX, settled.homeY);

    GeologyStepReport rep;
    if (!sim.advanceToYear(year, world, buildings, settlement, player, &rep)) continue;
    ++stepsRun;
    if (rep.flood.playerDrowned) {
      playerDrowned = true;
      if (!quiet) std::cout << "geocity_cli: year " << rep.year << " the player drowned with the settlement\n";
    }
    if (!quiet && (rep.floodPassRan || !rep.events.empty())) PrintStep(rep);
  }

  if (!stateOutPath.empty()) {
    std::string err;
    if (!EnsureParentDir(stateOutPath) || !WriteGeologyStateJsonFile(stateOutPath, sim.clock().state(), err)) {
      std::cerr << "geocity_cli: failed to write geology state '" << stateOutPath << "': " << err << "\n";
      return 1;
    }
  }

  const JsonValue summary = BuildSummary(world, buildings, settlement, settled, playerDrowned, sim, years, stepsRun);
  if (jsonPath == "-") {
    std::string err;
    if (!WriteJson(std::cout, summary, err)) {
      std::cerr << "geocity_cli: failed to write JSON summary: " << err << "\n";
      return 1;
    }
    std::cout << "\n";
  } else if (!jsonPath.empty()) {
    std::string err;
    if (!EnsureParentDir(jsonPath) || !WriteJsonFile(jsonPath, summary, err)) {
      std::cerr << "geocity_cli: failed to write JSON summary '" << jsonPath << "': " << err << "\n";
      return 1;
    }
  }

  if (!quiet) {
    const GeologyState& st = sim.clock().state();
    std::cout << "geocity_cli: " << stepsRun << " geological step(s), sea level " << st.currentSeaLevel
              << ", flooded " << st.tilesFlooded << ", drained " << st.tilesDrained << ", drowned "
              << st.populationDrowned << "\n";
    std::cout << "geocity_cli: world hash " << HexU64(HashWorld(world)) << "\n";
  }

  return 0;
}
