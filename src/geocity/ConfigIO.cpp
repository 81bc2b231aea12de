#include "geocity/ConfigIO.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace geocity {

namespace {

bool ApplyBool(const JsonValue& root, const char* key, bool& io, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  if (!v) return true; // missing => keep
  if (!v->isBool()) {
    err = std::string("expected boolean for key '") + key + "' (got " + JsonTypeName(v->type) + ")";
    return false;
  }
  io = v->boolValue;
  return true;
}

bool ApplyNumber(const JsonValue& root, const char* key, double& out, bool& present, std::string& err)
{
  const JsonValue* v = FindJsonMember(root, key);
  present = v != nullptr;
  if (!v) return true;
  if (!v->isNumber()) {
    err = std::string("expected number for key '") + key + "' (got " + JsonTypeName(v->type) + ")";
    return false;
  }
  if (!std::isfinite(v->numberValue)) {
    err = std::string("non-finite number for key '") + key + "'";
    return false;
  }
  out = v->numberValue;
  return true;
}

bool ApplyI32(const JsonValue& root, const char* key, int& io, std::string& err)
{
  double dv = 0.0;
  bool present = false;
  if (!ApplyNumber(root, key, dv, present, err)) return false;
  if (!present) return true;
  if (dv < static_cast<double>(std::numeric_limits<int>::min()) ||
      dv > static_cast<double>(std::numeric_limits<int>::max())) {
    err = std::string("out-of-range integer for key '") + key + "'";
    return false;
  }
  if (dv != std::floor(dv)) {
    err = std::string("expected integer for key '") + key + "'";
    return false;
  }
  io = static_cast<int>(dv);
  return true;
}

bool ApplyF32(const JsonValue& root, const char* key, float& io, std::string& err)
{
  double dv = 0.0;
  bool present = false;
  if (!ApplyNumber(root, key, dv, present, err)) return false;
  if (!present) return true;
  if (dv < -static_cast<double>(std::numeric_limits<float>::max()) ||
      dv > static_cast<double>(std::numeric_limits<float>::max())) {
    err = std::string("out-of-range float for key '") + key + "'";
    return false;
  }
  io = static_cast<float>(dv);
  return true;
}

// Optional nested object. Sets *out to nullptr when missing.
bool GetSection(const JsonValue& root, const char* key, const JsonValue** out, std::string& err)
{
  *out = FindJsonMember(root, key);
  if (*out && !(*out)->isObject()) {
    err = std::string("expected object for key '") + key + "' (got " + JsonTypeName((*out)->type) + ")";
    return false;
  }
  return true;
}

JsonValue Num(float v) { return JsonValue::MakeNumber(static_cast<double>(v)); }
JsonValue Num(int v) { return JsonValue::MakeNumber(static_cast<double>(v)); }

JsonValue LayerToJson(const NoiseLayer& l)
{
  JsonValue o = JsonValue::MakeObject();
  o.set("frequency", Num(l.frequency));
  o.set("offset", Num(l.offset));
  o.set("octaves", Num(l.octaves));
  return o;
}

bool ApplyLayer(const JsonValue& noise, const char* key, NoiseLayer& io, std::string& err)
{
  const JsonValue* l = nullptr;
  if (!GetSection(noise, key, &l, err)) return false;
  if (!l) return true;
  if (!ApplyF32(*l, "frequency", io.frequency, err) || !ApplyF32(*l, "offset", io.offset, err) ||
      !ApplyI32(*l, "octaves", io.octaves, err)) {
    err = std::string("noise.") + key + ": " + err;
    return false;
  }
  return true;
}

std::string Stringify(const JsonValue& v, int indentSpaces)
{
  JsonWriteOptions opt;
  opt.pretty = indentSpaces > 0;
  opt.indent = indentSpaces;
  return JsonStringify(v, opt);
}

bool RequireI32(const JsonValue& root, const char* key, int& out, std::string& err)
{
  if (!FindJsonMember(root, key)) {
    err = std::string("missing key '") + key + "'";
    return false;
  }
  return ApplyI32(root, key, out, err);
}

} // namespace

JsonValue WorldGenConfigToJsonValue(const WorldGenConfig& cfg)
{
  JsonValue root = JsonValue::MakeObject();

  JsonValue noise = JsonValue::MakeObject();
  noise.set("terrain", LayerToJson(cfg.noise.terrain));
  noise.set("ocean", LayerToJson(cfg.noise.ocean));
  noise.set("lake", LayerToJson(cfg.noise.lake));
  noise.set("mountain", LayerToJson(cfg.noise.mountain));
  noise.set("river", LayerToJson(cfg.noise.river));
  root.set("noise", std::move(noise));

  root.set("sea_level", Num(cfg.seaLevel));

  JsonValue elev = JsonValue::MakeObject();
  elev.set("bias", Num(cfg.elevation.bias));
  elev.set("ceiling", Num(cfg.elevation.ceiling));
  elev.set("ocean_threshold", Num(cfg.elevation.oceanThreshold));
  elev.set("ocean_depth", Num(cfg.elevation.oceanDepth));
  root.set("elevation", std::move(elev));

  JsonValue hg = JsonValue::MakeObject();
  hg.set("patch_size", Num(cfg.highGround.patchSize));
  hg.set("tiles_per_patch", Num(cfg.highGround.tilesPerPatch));
  hg.set("min_patches", Num(cfg.highGround.minPatches));
  hg.set("edge_margin", Num(cfg.highGround.edgeMargin));
  hg.set("elevation_min", Num(cfg.highGround.elevationMin));
  hg.set("elevation_max", Num(cfg.highGround.elevationMax));
  root.set("high_ground", std::move(hg));

  const ClassifierConfig& c = cfg.classifier;
  JsonValue cls = JsonValue::MakeObject();
  cls.set("mountain_threshold", Num(c.mountainThreshold));
  cls.set("mountain_height_min", Num(c.mountainHeightMin));
  cls.set("mountain_elevation_min", Num(c.mountainElevationMin));
  cls.set("mountain_elevation_span", Num(c.mountainElevationSpan));
  cls.set("deep_below_sea", Num(c.deepBelowSea));
  cls.set("water_below_sea", Num(c.waterBelowSea));
  cls.set("lake_threshold", Num(c.lakeThreshold));
  cls.set("lake_band", Num(c.lakeBand));
  cls.set("river_width", Num(c.riverWidth));
  cls.set("grass_max", Num(c.grassMax));
  cls.set("forest_max", Num(c.forestMax));
  cls.set("rock_max", Num(c.rockMax));
  root.set("classifier", std::move(cls));

  root.set("tree_chance", Num(cfg.treeChance));
  root.set("stone_deposit_min", Num(cfg.stoneDepositMin));
  root.set("stone_deposit_max", Num(cfg.stoneDepositMax));
  root.set("stone_metal_yield", Num(cfg.stoneMetalYield));

  const WaterFeaturesConfig& wf = cfg.waterFeatures;
  JsonValue water = JsonValue::MakeObject();
  water.set("enabled", JsonValue::MakeBool(wf.enabled));
  water.set("lakes_per_tile", Num(wf.lakesPerTile));
  water.set("lake_radius_min", Num(wf.lakeRadiusMin));
  water.set("lake_radius_max", Num(wf.lakeRadiusMax));
  water.set("lake_rim_noise", Num(wf.lakeRimNoise));
  water.set("ponds_per_tile", Num(wf.pondsPerTile));
  water.set("pond_radius_min", Num(wf.pondRadiusMin));
  water.set("pond_radius_max", Num(wf.pondRadiusMax));
  root.set("water_features", std::move(water));

  return root;
}

JsonValue GeologyConfigToJsonValue(const GeologyConfig& cfg)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("enabled", JsonValue::MakeBool(cfg.enabled));

  JsonValue periods = JsonValue::MakeArray();
  for (const GeologicalPeriod& p : cfg.periods) {
    JsonValue o = JsonValue::MakeObject();
    o.set("name", JsonValue::MakeString(p.name));
    o.set("duration", Num(p.duration));
    o.set("target_sea_level", Num(p.targetSeaLevel));
    periods.push(std::move(o));
  }
  root.set("periods", std::move(periods));

  root.set("sea_level_min", Num(cfg.seaLevelMin));
  root.set("sea_level_max", Num(cfg.seaLevelMax));
  root.set("change_rate", Num(cfg.changeRate));
  root.set("update_interval_years", Num(cfg.updateIntervalYears));
  root.set("flood_warning_margin", Num(cfg.floodWarningMargin));
  root.set("cost_threshold", Num(cfg.costThreshold));
  root.set("cost_increase_per_level", Num(cfg.costIncreasePerLevel));
  return root;
}

std::string WorldGenConfigToJson(const WorldGenConfig& cfg, int indentSpaces)
{
  return Stringify(WorldGenConfigToJsonValue(cfg), indentSpaces);
}

std::string GeologyConfigToJson(const GeologyConfig& cfg, int indentSpaces)
{
  return Stringify(GeologyConfigToJsonValue(cfg), indentSpaces);
}

std::string CombinedConfigToJson(const WorldGenConfig& worldgen, const GeologyConfig& geology, int indentSpaces)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("worldgen", WorldGenConfigToJsonValue(worldgen));
  root.set("geology", GeologyConfigToJsonValue(geology));
  return Stringify(root, indentSpaces);
}

bool ApplyWorldGenConfigJson(const JsonValue& root, WorldGenConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "worldgen config JSON must be an object";
    return false;
  }

  // Merge into a copy so a failure leaves ioCfg untouched.
  WorldGenConfig cfg = ioCfg;
  std::string err;

  const JsonValue* noise = nullptr;
  if (!GetSection(root, "noise", &noise, err)) {
    outError = err;
    return false;
  }
  if (noise) {
    if (!ApplyLayer(*noise, "terrain", cfg.noise.terrain, err) || !ApplyLayer(*noise, "ocean", cfg.noise.ocean, err) ||
        !ApplyLayer(*noise, "lake", cfg.noise.lake, err) || !ApplyLayer(*noise, "mountain", cfg.noise.mountain, err) ||
        !ApplyLayer(*noise, "river", cfg.noise.river, err)) {
      outError = err;
      return false;
    }
  }

  if (!ApplyF32(root, "sea_level", cfg.seaLevel, err)) {
    outError = err;
    return false;
  }

  const JsonValue* elev = nullptr;
  if (!GetSection(root, "elevation", &elev, err)) {
    outError = err;
    return false;
  }
  if (elev) {
    if (!ApplyF32(*elev, "bias", cfg.elevation.bias, err) || !ApplyF32(*elev, "ceiling", cfg.elevation.ceiling, err) ||
        !ApplyF32(*elev, "ocean_threshold", cfg.elevation.oceanThreshold, err) ||
        !ApplyF32(*elev, "ocean_depth", cfg.elevation.oceanDepth, err)) {
      outError = "elevation: " + err;
      return false;
    }
  }

  const JsonValue* hg = nullptr;
  if (!GetSection(root, "high_ground", &hg, err)) {
    outError = err;
    return false;
  }
  if (hg) {
    HighGroundConfig& h = cfg.highGround;
    if (!ApplyI32(*hg, "patch_size", h.patchSize, err) || !ApplyI32(*hg, "tiles_per_patch", h.tilesPerPatch, err) ||
        !ApplyI32(*hg, "min_patches", h.minPatches, err) || !ApplyI32(*hg, "edge_margin", h.edgeMargin, err) ||
        !ApplyF32(*hg, "elevation_min", h.elevationMin, err) ||
        !ApplyF32(*hg, "elevation_max", h.elevationMax, err)) {
      outError = "high_ground: " + err;
      return false;
    }
  }

  const JsonValue* cls = nullptr;
  if (!GetSection(root, "classifier", &cls, err)) {
    outError = err;
    return false;
  }
  if (cls) {
    ClassifierConfig& c = cfg.classifier;
    if (!ApplyF32(*cls, "mountain_threshold", c.mountainThreshold, err) ||
        !ApplyF32(*cls, "mountain_height_min", c.mountainHeightMin, err) ||
        !ApplyF32(*cls, "mountain_elevation_min", c.mountainElevationMin, err) ||
        !ApplyF32(*cls, "mountain_elevation_span", c.mountainElevationSpan, err) ||
        !ApplyF32(*cls, "deep_below_sea", c.deepBelowSea, err) ||
        !ApplyF32(*cls, "water_below_sea", c.waterBelowSea, err) ||
        !ApplyF32(*cls, "lake_threshold", c.lakeThreshold, err) || !ApplyF32(*cls, "lake_band", c.lakeBand, err) ||
        !ApplyF32(*cls, "river_width", c.riverWidth, err) || !ApplyF32(*cls, "grass_max", c.grassMax, err) ||
        !ApplyF32(*cls, "forest_max", c.forestMax, err) || !ApplyF32(*cls, "rock_max", c.rockMax, err)) {
      outError = "classifier: " + err;
      return false;
    }
  }

  if (!ApplyF32(root, "tree_chance", cfg.treeChance, err) ||
      !ApplyI32(root, "stone_deposit_min", cfg.stoneDepositMin, err) ||
      !ApplyI32(root, "stone_deposit_max", cfg.stoneDepositMax, err) ||
      !ApplyF32(root, "stone_metal_yield", cfg.stoneMetalYield, err)) {
    outError = err;
    return false;
  }

  const JsonValue* water = nullptr;
  if (!GetSection(root, "water_features", &water, err)) {
    outError = err;
    return false;
  }
  if (water) {
    WaterFeaturesConfig& w = cfg.waterFeatures;
    if (!ApplyBool(*water, "enabled", w.enabled, err) || !ApplyF32(*water, "lakes_per_tile", w.lakesPerTile, err) ||
        !ApplyI32(*water, "lake_radius_min", w.lakeRadiusMin, err) ||
        !ApplyI32(*water, "lake_radius_max", w.lakeRadiusMax, err) ||
        !ApplyF32(*water, "lake_rim_noise", w.lakeRimNoise, err) ||
        !ApplyF32(*water, "ponds_per_tile", w.pondsPerTile, err) ||
        !ApplyI32(*water, "pond_radius_min", w.pondRadiusMin, err) ||
        !ApplyI32(*water, "pond_radius_max", w.pondRadiusMax, err)) {
      outError = "water_features: " + err;
      return false;
    }
  }

  ioCfg = cfg;
  outError.clear();
  return true;
}

bool ApplyGeologyConfigJson(const JsonValue& root, GeologyConfig& ioCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "geology config JSON must be an object";
    return false;
  }

  GeologyConfig cfg = ioCfg;
  std::string err;

  if (!ApplyBool(root, "enabled", cfg.enabled, err)) {
    outError = err;
    return false;
  }

  if (const JsonValue* periods = FindJsonMember(root, "periods")) {
    if (!periods->isArray()) {
      outError = "expected array for key 'periods'";
      return false;
    }
    std::vector<GeologicalPeriod> list;
    for (std::size_t i = 0; i < periods->arrayValue.size(); ++i) {
      const JsonValue& p = periods->arrayValue[i];
      std::ostringstream where;
      where << "periods[" << i << "]";
      if (!p.isObject()) {
        outError = where.str() + " must be an object";
        return false;
      }
      GeologicalPeriod gp;
      const JsonValue* name = FindJsonMember(p, "name");
      if (name) {
        if (!name->isString()) {
          outError = where.str() + ": expected string for key 'name'";
          return false;
        }
        gp.name = name->stringValue;
      }
      if (!ApplyI32(p, "duration", gp.duration, err) || !ApplyF32(p, "target_sea_level", gp.targetSeaLevel, err)) {
        outError = where.str() + ": " + err;
        return false;
      }
      list.push_back(std::move(gp));
    }
    cfg.periods = std::move(list);
  }

  if (!ApplyF32(root, "sea_level_min", cfg.seaLevelMin, err) || !ApplyF32(root, "sea_level_max", cfg.seaLevelMax, err) ||
      !ApplyF32(root, "change_rate", cfg.changeRate, err) ||
      !ApplyI32(root, "update_interval_years", cfg.updateIntervalYears, err) ||
      !ApplyF32(root, "flood_warning_margin", cfg.floodWarningMargin, err) ||
      !ApplyF32(root, "cost_threshold", cfg.costThreshold, err) ||
      !ApplyF32(root, "cost_increase_per_level", cfg.costIncreasePerLevel, err)) {
    outError = err;
    return false;
  }

  ioCfg = std::move(cfg);
  outError.clear();
  return true;
}

bool ParseCombinedConfigJson(const JsonValue& root, CombinedConfig& outCfg, std::string& outError)
{
  if (!root.isObject()) {
    outError = "combined config JSON must be an object";
    return false;
  }

  outCfg = CombinedConfig{};
  std::string err;

  const JsonValue* worldgen = nullptr;
  if (!GetSection(root, "worldgen", &worldgen, err)) {
    outError = err;
    return false;
  }
  if (worldgen) {
    outCfg.hasWorldGen = true;
    if (!ApplyWorldGenConfigJson(*worldgen, outCfg.worldgen, err)) {
      outError = "worldgen: " + err;
      return false;
    }
  }

  const JsonValue* geology = nullptr;
  if (!GetSection(root, "geology", &geology, err)) {
    outError = err;
    return false;
  }
  if (geology) {
    outCfg.hasGeology = true;
    if (!ApplyGeologyConfigJson(*geology, outCfg.geology, err)) {
      outError = "geology: " + err;
      return false;
    }
  }

  outError.clear();
  return true;
}

bool LoadCombinedConfigJsonFile(const std::string& path, CombinedConfig& outCfg, std::string& outError)
{
  JsonValue root;
  if (!ReadJsonFile(path, root, outError)) return false;
  return ParseCombinedConfigJson(root, outCfg, outError);
}

bool WriteCombinedConfigJsonFile(const std::string& path, const WorldGenConfig& worldgen, const GeologyConfig& geology,
                                 std::string& outError)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("worldgen", WorldGenConfigToJsonValue(worldgen));
  root.set("geology", GeologyConfigToJsonValue(geology));
  return WriteJsonFile(path, root, outError);
}

JsonValue GeologyStateToJsonValue(const GeologyState& s)
{
  JsonValue root = JsonValue::MakeObject();
  root.set("current_sea_level", Num(s.currentSeaLevel));
  root.set("period_index", Num(s.periodIndex));
  root.set("centuries_in_period", Num(s.centuriesInPeriod));
  root.set("last_update_year", Num(s.lastUpdateYear));
  root.set("tiles_flooded", Num(s.tilesFlooded));
  root.set("tiles_drained", Num(s.tilesDrained));
  root.set("population_drowned", Num(s.populationDrowned));
  return root;
}

bool ParseGeologyStateJson(const JsonValue& root, GeologyState& outState, std::string& outError)
{
  if (!root.isObject()) {
    outError = "geology state JSON must be an object";
    return false;
  }

  GeologyState s;
  std::string err;

  if (!FindJsonMember(root, "current_sea_level")) {
    outError = "missing key 'current_sea_level'";
    return false;
  }
  if (!ApplyF32(root, "current_sea_level", s.currentSeaLevel, err) ||
      !RequireI32(root, "period_index", s.periodIndex, err) ||
      !RequireI32(root, "centuries_in_period", s.centuriesInPeriod, err) ||
      !RequireI32(root, "last_update_year", s.lastUpdateYear, err) ||
      !RequireI32(root, "tiles_flooded", s.tilesFlooded, err) ||
      !RequireI32(root, "tiles_drained", s.tilesDrained, err) ||
      !RequireI32(root, "population_drowned", s.populationDrowned, err)) {
    outError = err;
    return false;
  }

  outState = s;
  outError.clear();
  return true;
}

bool WriteGeologyStateJsonFile(const std::string& path, const GeologyState& state, std::string& outError)
{
  return WriteJsonFile(path, GeologyStateToJsonValue(state), outError);
}

bool LoadGeologyStateJsonFile(const std::string& path, GeologyState& outState, std::string& outError)
{
  JsonValue root;
  if (!ReadJsonFile(path, root, outError)) return false;
  if (!ParseGeologyStateJson(root, outState, outError)) {
    outError = path + ": " + outError;
    return false;
  }
  return true;
}

} // namespace geocity
