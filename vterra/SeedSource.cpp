#include "SeedSource.hpp"

using namespace vterra;

SeedSource::SeedSource()
{
  std::random_device device;
  std::seed_seq sequence { device(), device(), device(), device() };
  engine.seed(sequence);
}

SeedSource::SeedSource(uint64_t seed)
  : engine(seed)
{
}

size_t SeedSource::next()
{
  std::lock_guard<std::mutex> lock(mutex);
  return static_cast<size_t>(engine());
}
