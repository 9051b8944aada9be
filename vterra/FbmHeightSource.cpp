#include "FbmHeightSource.hpp"
#include "TerrainError.hpp"
#include <cstdint>
#include <string>

using namespace vterra;

FbmHeightSource::FbmHeightSource()
  : FbmHeightSource(Settings {})
{
}

FbmHeightSource::FbmHeightSource(const Settings& settings)
  : settings(settings)
{
  if (settings.octaves < 1)
    throw InvalidInputError("Fractal noise needs at least one octave, got " + std::to_string(settings.octaves));

  auto perlin = FastNoise::New<FastNoise::Perlin>();
  fbm = FastNoise::New<FastNoise::FractalFBm>();
  fbm->SetSource(perlin);
  fbm->SetOctaveCount(settings.octaves);
  fbm->SetLacunarity(settings.lacunarity);
  fbm->SetGain(settings.gain);
}

int FbmHeightSource::foldSeed(size_t seed)
{
  const uint64_t wide = static_cast<uint64_t>(seed);
  return static_cast<int>(static_cast<uint32_t>(wide ^ (wide >> 32)));
}

double FbmHeightSource::height(size_t seed, double x, double y) const
{
  const float fx = static_cast<float>(x * settings.frequency);
  const float fy = static_cast<float>(y * settings.frequency);
  return static_cast<double>(fbm->GenSingle2D(fx, fy, foldSeed(seed)));
}
