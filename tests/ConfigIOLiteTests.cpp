#include "geocity/ConfigIO.hpp"
#include "geocity/Geology.hpp"
#include "geocity/Json.hpp"
#include "geocity/ProcGen.hpp"

#include <chrono>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

static int g_failures = 0;

#define EXPECT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_TRUE failed: " << #cond << "\n";                          \
    }                                                                                                                \
  } while (0)

#define EXPECT_FALSE(cond) EXPECT_TRUE(!(cond))

#define EXPECT_EQ(a, b)                                                                                              \
  do {                                                                                                               \
    const auto _a = (a);                                                                                             \
    const auto _b = (b);                                                                                             \
    if (!(_a == _b)) {                                                                                               \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " EXPECT_EQ failed: " << #a << " == " << #b << "\n";              \
    }                                                                                                                \
  } while (0)

#define ASSERT_TRUE(cond)                                                                                            \
  do {                                                                                                               \
    if (!(cond)) {                                                                                                   \
      ++g_failures;                                                                                                  \
      std::cerr << __FILE__ << ":" << __LINE__ << " ASSERT_TRUE failed: " << #cond << "\n";                          \
      return;                                                                                                        \
    }                                                                                                                \
  } while (0)

static fs::path MakeTempPath(const std::string& prefix)
{
  static std::uint64_t counter = 0;
  ++counter;

  std::error_code ec;
  fs::path root = fs::temp_directory_path(ec);
  if (ec || root.empty()) root = fs::path(".");

  const auto stamp = static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  return root / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter));
}

static bool ParseText(const std::string& text, geocity::JsonValue& out)
{
  std::string err;
  return geocity::ParseJson(text, out, err);
}

static void TestCombinedConfigRoundTrip()
{
  using namespace geocity;

  WorldGenConfig wg;
  wg.seaLevel = 3.25f;
  wg.noise.river.frequency = 0.037f;
  wg.highGround.patchSize = 11;
  wg.classifier.riverWidth = 0.02f;
  wg.treeChance = 0.35f;
  wg.waterFeatures.enabled = true;
  wg.waterFeatures.pondRadiusMax = 5;

  GeologyConfig geo;
  geo.periods = {{"Short Thaw", 3, 4.75f}, {"Long Freeze", 9, 1.25f}};
  geo.changeRate = 0.05f;
  geo.updateIntervalYears = 25;
  geo.enabled = false;

  JsonValue root;
  ASSERT_TRUE(ParseText(CombinedConfigToJson(wg, geo), root));

  CombinedConfig cfg;
  std::string err;
  ASSERT_TRUE(ParseCombinedConfigJson(root, cfg, err));
  EXPECT_TRUE(cfg.hasWorldGen);
  EXPECT_TRUE(cfg.hasGeology);

  EXPECT_EQ(cfg.worldgen.seaLevel, 3.25f);
  EXPECT_EQ(cfg.worldgen.noise.river.frequency, 0.037f);
  EXPECT_EQ(cfg.worldgen.noise.ocean.offset, 2500.0f);
  EXPECT_EQ(cfg.worldgen.highGround.patchSize, 11);
  EXPECT_EQ(cfg.worldgen.classifier.riverWidth, 0.02f);
  EXPECT_EQ(cfg.worldgen.treeChance, 0.35f);
  EXPECT_TRUE(cfg.worldgen.waterFeatures.enabled);
  EXPECT_EQ(cfg.worldgen.waterFeatures.pondRadiusMax, 5);

  ASSERT_TRUE(cfg.geology.periods.size() == 2);
  EXPECT_EQ(cfg.geology.periods[1].name, std::string("Long Freeze"));
  EXPECT_EQ(cfg.geology.periods[1].duration, 9);
  EXPECT_EQ(cfg.geology.periods[0].targetSeaLevel, 4.75f);
  EXPECT_EQ(cfg.geology.changeRate, 0.05f);
  EXPECT_EQ(cfg.geology.updateIntervalYears, 25);
  EXPECT_FALSE(cfg.geology.enabled);
}

static void TestMergeKeepsMissingKeys()
{
  using namespace geocity;

  JsonValue root;
  ASSERT_TRUE(ParseText(R"({"sea_level": 4, "classifier": {"grass_max": 6.5}, "high_ground": {"min_patches": 3}})",
                        root));

  WorldGenConfig cfg;
  cfg.treeChance = 0.5f;
  std::string err;
  ASSERT_TRUE(ApplyWorldGenConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.seaLevel, 4.0f);
  EXPECT_EQ(cfg.classifier.grassMax, 6.5f);
  EXPECT_EQ(cfg.classifier.forestMax, 8.0f);
  EXPECT_EQ(cfg.highGround.minPatches, 3);
  EXPECT_EQ(cfg.highGround.patchSize, 8);
  EXPECT_EQ(cfg.treeChance, 0.5f);

  // Geology: no "periods" key keeps the default cycle.
  JsonValue geoRoot;
  ASSERT_TRUE(ParseText(R"({"sea_level_max": 7.5})", geoRoot));
  GeologyConfig geo;
  ASSERT_TRUE(ApplyGeologyConfigJson(geoRoot, geo, err));
  EXPECT_EQ(geo.seaLevelMax, 7.5f);
  EXPECT_EQ(geo.periods.size(), static_cast<std::size_t>(6));

  // An empty combined object yields defaults and no sections.
  JsonValue emptyRoot;
  ASSERT_TRUE(ParseText("{}", emptyRoot));
  CombinedConfig combined;
  ASSERT_TRUE(ParseCombinedConfigJson(emptyRoot, combined, err));
  EXPECT_FALSE(combined.hasWorldGen);
  EXPECT_FALSE(combined.hasGeology);
  EXPECT_EQ(combined.geology.updateIntervalYears, 100);
}

static void TestWrongTypesAreErrors()
{
  using namespace geocity;

  std::string err;

  JsonValue root;
  ASSERT_TRUE(ParseText(R"({"sea_level": "high"})", root));
  WorldGenConfig cfg;
  cfg.seaLevel = 2.0f;
  EXPECT_FALSE(ApplyWorldGenConfigJson(root, cfg, err));
  EXPECT_TRUE(err.find("sea_level") != std::string::npos);
  EXPECT_TRUE(err.find("got string") != std::string::npos);
  EXPECT_EQ(cfg.seaLevel, 2.0f);

  // A failure part-way through leaves the target untouched.
  ASSERT_TRUE(ParseText(R"({"tree_chance": 0.9, "water_features": {"enabled": 1}})", root));
  EXPECT_FALSE(ApplyWorldGenConfigJson(root, cfg, err));
  EXPECT_EQ(cfg.treeChance, 0.2f);

  ASSERT_TRUE(ParseText(R"({"periods": {"name": "x"}})", root));
  GeologyConfig geo;
  EXPECT_FALSE(ApplyGeologyConfigJson(root, geo, err));

  ASSERT_TRUE(ParseText(R"({"periods": [{"name": 3}]})", root));
  EXPECT_FALSE(ApplyGeologyConfigJson(root, geo, err));
  EXPECT_EQ(geo.periods.size(), static_cast<std::size_t>(6));

  ASSERT_TRUE(ParseText(R"({"worldgen": []})", root));
  CombinedConfig combined;
  EXPECT_FALSE(ParseCombinedConfigJson(root, combined, err));

  ASSERT_TRUE(ParseText(R"({"periods": [{"name": "Thaw", "duration": 2.5}]})", root));
  EXPECT_FALSE(ApplyGeologyConfigJson(root, geo, err));
  EXPECT_TRUE(err.find("duration") != std::string::npos);
  EXPECT_EQ(geo.periods.size(), static_cast<std::size_t>(6));

  ASSERT_TRUE(ParseText(R"({"update_interval_years": 50.0})", root));
  ASSERT_TRUE(ApplyGeologyConfigJson(root, geo, err));
  EXPECT_EQ(geo.updateIntervalYears, 50);

  // An empty period list parses but does not validate.
  ASSERT_TRUE(ParseText(R"({"periods": []})", root));
  ASSERT_TRUE(ApplyGeologyConfigJson(root, geo, err));
  EXPECT_TRUE(geo.periods.empty());
  EXPECT_FALSE(ValidateGeologyConfig(geo, err));
}

static void TestGeologyStateRoundTripsExactly()
{
  using namespace geocity;

  GeologyState s;
  s.periodIndex = 4;
  s.centuriesInPeriod = 17;
  s.lastUpdateYear = 123400;
  s.tilesFlooded = 321;
  s.tilesDrained = 77;
  s.populationDrowned = 1500;

  // Accumulated float steps do not land on round decimals.
  float lvl = 1.0f;
  for (int i = 0; i < 13; ++i) lvl += 0.1f;
  s.currentSeaLevel = lvl;

  const fs::path path = MakeTempPath("geocity_state") / "state.json";
  std::error_code ec;
  fs::create_directories(path.parent_path(), ec);

  std::string err;
  ASSERT_TRUE(WriteGeologyStateJsonFile(path.string(), s, err));

  GeologyState loaded;
  ASSERT_TRUE(LoadGeologyStateJsonFile(path.string(), loaded, err));
  EXPECT_TRUE(loaded == s);
  EXPECT_EQ(loaded.currentSeaLevel, lvl);

  fs::remove_all(path.parent_path(), ec);

  // Every key is required.
  JsonValue root = GeologyStateToJsonValue(s);
  JsonValue partial = JsonValue::MakeObject();
  for (const auto& kv : root.objectValue) {
    if (kv.first != "tiles_drained") partial.set(kv.first, kv.second);
  }
  GeologyState out;
  EXPECT_FALSE(ParseGeologyStateJson(partial, out, err));
  EXPECT_TRUE(err.find("tiles_drained") != std::string::npos);

  // Integer fields take whole numbers only.
  JsonValue fractional = root;
  fractional.set("period_index", JsonValue::MakeNumber(0.6));
  EXPECT_FALSE(ParseGeologyStateJson(fractional, out, err));
  EXPECT_TRUE(err.find("period_index") != std::string::npos);
  fractional.set("period_index", JsonValue::MakeNumber(3.0));
  ASSERT_TRUE(ParseGeologyStateJson(fractional, out, err));
  EXPECT_EQ(out.periodIndex, 3);

  // A snapshot that does not fit the configured cycle is refused by the clock.
  GeologyClock clock;
  ASSERT_TRUE(clock.configure(GeologyConfig{}, err));
  GeologyState bad = s;
  bad.periodIndex = 6;
  EXPECT_FALSE(clock.restore(bad, err));
  EXPECT_TRUE(clock.restore(s, err));
}

static void TestCombinedConfigFile()
{
  using namespace geocity;

  const fs::path dir = MakeTempPath("geocity_cfg");
  std::error_code ec;
  fs::create_directories(dir, ec);

  WorldGenConfig wg;
  wg.elevation.oceanDepth = 30.0f;
  GeologyConfig geo;
  geo.floodWarningMargin = 1.5f;

  std::string err;
  const std::string path = (dir / "cfg.json").string();
  ASSERT_TRUE(WriteCombinedConfigJsonFile(path, wg, geo, err));

  CombinedConfig loaded;
  ASSERT_TRUE(LoadCombinedConfigJsonFile(path, loaded, err));
  EXPECT_EQ(loaded.worldgen.elevation.oceanDepth, 30.0f);
  EXPECT_EQ(loaded.geology.floodWarningMargin, 1.5f);

  EXPECT_FALSE(LoadCombinedConfigJsonFile((dir / "missing.json").string(), loaded, err));
  EXPECT_FALSE(err.empty());

  fs::remove_all(dir, ec);
}

static void TestJsonParser()
{
  using namespace geocity;

  JsonValue v;
  std::string err;

  EXPECT_TRUE(ParseJson(R"({"a": [1, 2.5, -3e2], "b": {"c": null, "d": true}, "e": "x\u00e9\n"})", v, err));
  ASSERT_TRUE(v.isObject());
  const JsonValue* a = FindJsonMember(v, "a");
  ASSERT_TRUE(a && a->isArray() && a->arrayValue.size() == 3);
  EXPECT_EQ(a->arrayValue[2].numberValue, -300.0);
  const JsonValue* e = FindJsonMember(v, "e");
  ASSERT_TRUE(e && e->isString());
  EXPECT_EQ(e->stringValue, std::string("x\xC3\xA9\n"));

  EXPECT_FALSE(ParseJson("[1, 2,]", v, err));
  EXPECT_FALSE(err.empty());
  EXPECT_FALSE(ParseJson("{\"a\": 1} // note", v, err));
  EXPECT_FALSE(ParseJson("{\"a\" 1}", v, err));
  EXPECT_FALSE(ParseJson("\"open", v, err));
  EXPECT_FALSE(ParseJson("01", v, err));
  EXPECT_FALSE(ParseJson("", v, err));

  std::string deep;
  for (int i = 0; i < 200; ++i) deep += "[";
  for (int i = 0; i < 200; ++i) deep += "]";
  EXPECT_FALSE(ParseJson(deep, v, err));

  // Writer: integers stay integral, non-finite numbers are rejected.
  JsonValue obj = JsonValue::MakeObject();
  obj.set("n", JsonValue::MakeNumber(42.0));
  obj.set("s", JsonValue::MakeString("q\"t"));
  JsonWriteOptions compact;
  compact.pretty = false;
  EXPECT_EQ(JsonStringify(obj, compact), std::string("{\"n\":42,\"s\":\"q\\\"t\"}"));

  obj.set("n", JsonValue::MakeNumber(7.0));
  EXPECT_EQ(obj.objectValue.size(), static_cast<std::size_t>(2));

  JsonValue inf = JsonValue::MakeNumber(std::numeric_limits<double>::infinity());
  std::ostringstream oss;
  EXPECT_FALSE(WriteJson(oss, inf, err));
}

int main()
{
  TestCombinedConfigRoundTrip();
  TestMergeKeepsMissingKeys();
  TestWrongTypesAreErrors();
  TestGeologyStateRoundTripsExactly();
  TestCombinedConfigFile();
  TestJsonParser();

  if (g_failures == 0) {
    std::cout << "geocity_configio_lite_tests: OK\n";
    return 0;
  }

  std::cerr << "geocity_configio_lite_tests: FAILED (" << g_failures << ")\n";
  return 1;
}
