#pragma once
#include <cstdint>
#include <mutex>
#include <random>

namespace vterra
{

/**
 * \brief Thread-safe generator for terrain seeds.
 *
 * Constructed either from a fixed seed, which makes the sequence of drawn seeds reproducible, or from
 * std::random_device. Several builders may share one source.
 */
class SeedSource
{
 public:
  SeedSource();
  explicit SeedSource(uint64_t seed);

  SeedSource(const SeedSource&) = delete;
  SeedSource& operator=(const SeedSource&) = delete;

  size_t next();

 private:
  std::mutex mutex;
  std::mt19937_64 engine;
};
}
