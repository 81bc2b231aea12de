#include "geocity/Noise.hpp"

#include <algorithm>
#include <cmath>

namespace geocity {

float NoiseField::hash(int ix, int iy) const
{
  const std::uint32_t h = HashCoords32(ix, iy, m_seed32);
  // 24 bits keep the value strictly below 1.0f.
  return static_cast<float>((h >> 8) & 0x00FFFFFFu) / 16777216.0f;
}

float NoiseField::valueNoise(float x, float y) const
{
  const float fx0 = std::floor(x);
  const float fy0 = std::floor(y);
  const int x0 = static_cast<int>(fx0);
  const int y0 = static_cast<int>(fy0);

  const float tx = SmoothStep(x - fx0);
  const float ty = SmoothStep(y - fy0);

  const float v00 = hash(x0, y0);
  const float v10 = hash(x0 + 1, y0);
  const float v01 = hash(x0, y0 + 1);
  const float v11 = hash(x0 + 1, y0 + 1);

  return Lerp(Lerp(v00, v10, tx), Lerp(v01, v11, tx), ty);
}

float NoiseField::fbm(float x, float y, int octaves) const
{
  float sum = 0.0f;
  float amp = 1.0f;
  float freq = 1.0f;

  for (int i = 0; i < octaves; ++i) {
    sum += valueNoise(x * freq, y * freq) * amp;
    freq *= 2.0f;
    amp *= 0.5f;
  }

  return sum;
}

float NoiseField::fbmNormalized(float x, float y, int octaves) const
{
  return std::clamp(fbm(x, y, octaves) / kFbmAmplitudeCeiling, 0.0f, 1.0f);
}

float NoiseField::sample(float x, float y, const NoiseLayer& layer) const
{
  return fbmNormalized(x * layer.frequency + layer.offset, y * layer.frequency + layer.offset, layer.octaves);
}

bool TerrainNoise::isRiverAt(int x, int y, float width) const
{
  return std::fabs(river(x, y) - 0.5f) < width;
}

} // namespace geocity
