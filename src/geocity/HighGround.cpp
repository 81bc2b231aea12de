#include "geocity/HighGround.hpp"

#include <algorithm>

namespace geocity {

int HighGroundQuota(int width, int height, const HighGroundConfig& cfg)
{
  if (width <= 0 || height <= 0) return 0;
  const long long area = static_cast<long long>(width) * static_cast<long long>(height);
  const long long perPatch = std::max(1, cfg.tilesPerPatch);
  const long long byArea = area / perPatch;
  return static_cast<int>(std::max<long long>(std::max(0, cfg.minPatches), byArea));
}

namespace {

int PlaceAxis(int extent, int size, int margin, RNG& rng)
{
  const int span = extent - size - 2 * margin;
  if (span > 0) return margin + static_cast<int>(rng.rangeU32(static_cast<std::uint32_t>(span)));
  return rng.rangeInt(0, std::max(0, extent - size));
}

} // namespace

std::vector<HighGroundPatch> PlanHighGround(int width, int height, const HighGroundConfig& cfg, RNG& rng)
{
  std::vector<HighGroundPatch> patches;
  const int quota = HighGroundQuota(width, height, cfg);
  if (quota <= 0) return patches;

  const int size = std::max(1, std::min({cfg.patchSize, width, height}));
  const int margin = std::max(0, cfg.edgeMargin);

  patches.reserve(static_cast<std::size_t>(quota));
  for (int i = 0; i < quota; ++i) {
    HighGroundPatch p;
    p.size = size;
    p.x = PlaceAxis(width, size, margin, rng);
    p.y = PlaceAxis(height, size, margin, rng);
    patches.push_back(p);
  }
  return patches;
}

bool IsInHighGroundPatch(int x, int y, const std::vector<HighGroundPatch>& patches)
{
  for (const HighGroundPatch& p : patches) {
    if (p.contains(x, y)) return true;
  }
  return false;
}

} // namespace geocity
