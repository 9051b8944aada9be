#pragma once
#include "HeightSource.hpp"
#include <FastNoise/FastNoise.h>

namespace vterra
{

/**
 * \brief Fractal Brownian motion over Perlin noise, evaluated with FastNoise2.
 *
 * The noise graph is built once in the constructor and only read afterwards, so one instance can be shared between
 * concurrent builds.
 */
class FbmHeightSource : public HeightSource
{
 public:
  struct Settings
  {
    int octaves = 6;
    float frequency = 1.0f;
    float lacunarity = 2.0f;
    float gain = 0.5f;
  };

  FbmHeightSource();
  explicit FbmHeightSource(const Settings& settings);

  double height(size_t seed, double x, double y) const override;

  const Settings& getSettings() const { return settings; }

  // FastNoise2 takes 32 bit seeds
  static int foldSeed(size_t seed);

 private:
  Settings settings;
  FastNoise::SmartNode<FastNoise::FractalFBm> fbm;
};
}
