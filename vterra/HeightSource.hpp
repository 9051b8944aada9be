#pragma once
#include <cstddef>

namespace vterra
{
// Seeded deterministic height function over the plane
class HeightSource
{
 public:
  virtual ~HeightSource() = default;

  // Must return the same value for the same seed and coordinates
  virtual double height(size_t seed, double x, double y) const = 0;
};
}
