#include "geocity/ProcGen.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace geocity {

namespace {

constexpr std::uint64_t kSaltPatches = 0x5041544348ULL;

struct Disc {
  int x = 0;
  int y = 0;
  int radius = 0;
};

std::vector<Disc> ScatterDiscs(int w, int h, float perTile, int rMin, int rMax, RNG& rng)
{
  std::vector<Disc> out;
  const int count = static_cast<int>(std::floor(static_cast<double>(w) * static_cast<double>(h) * perTile));
  for (int i = 0; i < count; ++i) {
    Disc d;
    d.x = rng.rangeInt(0, w - 1);
    d.y = rng.rangeInt(0, h - 1);
    d.radius = rng.rangeInt(rMin, rMax);
    out.push_back(d);
  }
  return out;
}

float Dist(int x, int y, const Disc& d)
{
  const float dx = static_cast<float>(x - d.x);
  const float dy = static_cast<float>(y - d.y);
  return std::sqrt(dx * dx + dy * dy);
}

void CarveWaterFeatures(World& world, const TerrainNoise& noise, const std::vector<HighGroundPatch>& patches,
                        const WorldGenConfig& cfg, RNG& rng)
{
  const WaterFeaturesConfig& wf = cfg.waterFeatures;
  const int w = world.width();
  const int h = world.height();

  const std::vector<Disc> lakes = ScatterDiscs(w, h, wf.lakesPerTile, wf.lakeRadiusMin, wf.lakeRadiusMax, rng);
  const std::vector<Disc> ponds = ScatterDiscs(w, h, wf.pondsPerTile, wf.pondRadiusMin, wf.pondRadiusMax, rng);
  if (lakes.empty() && ponds.empty()) return;

  const float lakeElevation = std::max(0.0f, cfg.seaLevel - cfg.classifier.waterBelowSea);

  for (int y = 0; y < h; ++y) {
    for (int x = 0; x < w; ++x) {
      Tile& t = world.at(x, y);
      if (IsStandingWater(t.terrain) || t.terrain == Terrain::Stone) continue;
      if (IsInHighGroundPatch(x, y, patches)) continue;

      bool wet = false;
      if (!lakes.empty()) {
        const float rim = noise.terrain(x * 3, y * 3) * wf.lakeRimNoise;
        for (const Disc& d : lakes) {
          if (Dist(x, y, d) < static_cast<float>(d.radius) + rim) {
            wet = true;
            break;
          }
        }
      }
      if (!wet && t.terrain != Terrain::Rock) {
        for (const Disc& d : ponds) {
          if (Dist(x, y, d) < static_cast<float>(d.radius)) {
            wet = true;
            break;
          }
        }
      }
      if (!wet) continue;

      t.terrain = Terrain::Water;
      t.original = Terrain::Sand;
      t.elevation = lakeElevation;
      t.tree = false;
      t.resource.reset();
    }
  }
}

} // namespace

bool ValidateWorldGenConfig(const WorldGenConfig& cfg, std::string& outError)
{
  std::ostringstream oss;
  auto fail = [&](const std::string& msg) {
    outError = msg;
    return false;
  };

  auto layerOk = [&](const NoiseLayer& l, const char* name) {
    if (!(l.frequency > 0.0f) || l.octaves < 1 || l.octaves > 16) {
      oss << "noise layer '" << name << "' needs frequency > 0 and 1..16 octaves";
      return false;
    }
    return true;
  };

  if (!layerOk(cfg.noise.terrain, "terrain") || !layerOk(cfg.noise.ocean, "ocean") ||
      !layerOk(cfg.noise.lake, "lake") || !layerOk(cfg.noise.mountain, "mountain") ||
      !layerOk(cfg.noise.river, "river")) {
    return fail(oss.str());
  }

  if (cfg.seaLevel < 0.0f || cfg.seaLevel > 10.0f) return fail("sea_level must be in [0, 10]");
  if (cfg.elevation.ceiling < 0.0f || cfg.elevation.ceiling > 10.0f) return fail("terrain_ceiling must be in [0, 10]");
  if (cfg.elevation.oceanDepth < 0.0f) return fail("ocean_depth must be >= 0");

  const HighGroundConfig& hg = cfg.highGround;
  if (hg.patchSize < 1) return fail("high_ground.patch_size must be >= 1");
  if (hg.tilesPerPatch < 1) return fail("high_ground.tiles_per_patch must be >= 1");
  if (hg.minPatches < 0) return fail("high_ground.min_patches must be >= 0");
  if (hg.edgeMargin < 0) return fail("high_ground.edge_margin must be >= 0");
  if (hg.elevationMin > hg.elevationMax) return fail("high_ground.elevation_min must be <= elevation_max");
  if (hg.elevationMin < 0.0f || hg.elevationMax > 10.0f) return fail("high_ground elevations must be in [0, 10]");

  const ClassifierConfig& c = cfg.classifier;
  if (!(c.grassMax <= c.forestMax && c.forestMax <= c.rockMax)) {
    return fail("classifier bands must satisfy grass_max <= forest_max <= rock_max");
  }
  if (c.deepBelowSea < c.waterBelowSea) return fail("classifier.deep_below_sea must be >= water_below_sea");
  if (c.riverWidth < 0.0f) return fail("classifier.river_width must be >= 0");
  if (c.mountainElevationSpan < 0.0f) return fail("classifier.mountain_elevation_span must be >= 0");

  if (cfg.treeChance < 0.0f || cfg.treeChance > 1.0f) return fail("tree_chance must be in [0, 1]");
  if (cfg.stoneDepositMin < 0 || cfg.stoneDepositMax < cfg.stoneDepositMin) {
    return fail("stone deposit range must satisfy 0 <= min <= max");
  }

  const WaterFeaturesConfig& wf = cfg.waterFeatures;
  if (wf.lakesPerTile < 0.0f || wf.pondsPerTile < 0.0f) return fail("water feature densities must be >= 0");
  if (wf.lakeRadiusMin < 0 || wf.lakeRadiusMax < wf.lakeRadiusMin) return fail("invalid lake radius range");
  if (wf.pondRadiusMin < 0 || wf.pondRadiusMax < wf.pondRadiusMin) return fail("invalid pond radius range");

  return true;
}

World GenerateWorld(int width, int height, std::uint64_t seed, const WorldGenConfig& cfg,
                    std::vector<HighGroundPatch>* outPatches)
{
  if (outPatches) outPatches->clear();
  if (width <= 0 || height <= 0) return World(0, 0, seed);

  World world(width, height, seed);

  const TerrainNoise noise(seed, cfg.noise);
  const TerrainClassifier classifier(noise, cfg.classifier);
  const std::uint32_t seed32 = FoldSeed32(seed);

  RNG rng(DeriveSeed(seed, kSaltPatches));
  const std::vector<HighGroundPatch> patches = PlanHighGround(width, height, cfg.highGround, rng);

  const int depositSpan = std::max(0, cfg.stoneDepositMax - cfg.stoneDepositMin);

  for (int y = 0; y < height; ++y) {
    for (int x = 0; x < width; ++x) {
      const float heightNoise = noise.terrain(x, y);
      const bool high = IsInHighGroundPatch(x, y, patches);

      float elevation = ElevationFromNoise(heightNoise, noise.ocean(x, y), cfg.elevation);
      if (high) elevation = HighGroundElevation(TileUniform01(x, y, seed32, kSaltHighGround), cfg.highGround);

      const TerrainClass cls = classifier.classify(x, y, elevation, cfg.seaLevel, heightNoise, high);

      Tile& t = world.at(x, y);
      t.terrain = cls.terrain;
      t.original = IsStandingWater(cls.terrain) ? Terrain::Sand : cls.terrain;
      t.elevation = std::clamp(cls.elevation, 0.0f, 10.0f);

      if (cls.terrain == Terrain::Grass || cls.terrain == Terrain::Forest || cls.terrain == Terrain::Snow) {
        t.tree = TileUniform01(x, y, seed32, kSaltTree) < cfg.treeChance;
      }

      if (cls.terrain == Terrain::Stone) {
        ResourceDeposit dep;
        dep.kind = ResourceKind::Stone;
        dep.amount = cfg.stoneDepositMin +
                     static_cast<int>(std::floor(TileUniform01(x, y, seed32, kSaltStoneDeposit) * static_cast<float>(depositSpan)));
        dep.metalYield = cfg.stoneMetalYield;
        t.resource = dep;
      }
    }
  }

  if (cfg.waterFeatures.enabled) CarveWaterFeatures(world, noise, patches, cfg, rng);

  if (outPatches) *outPatches = patches;
  return world;
}

} // namespace geocity
