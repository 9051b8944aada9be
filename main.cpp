#include "vterra/Logger.hpp"
#include "vterra/TerrainError.hpp"
#include "vterra/VoronoiTerrain.hpp"
#include <algorithm>
#include <iostream>
#include <limits>
#include <random>
#include <string>

static std::vector<vterra::Point<2>> randomSites(size_t count, size_t seed, double extent)
{
  std::mt19937_64 engine(seed);
  std::uniform_real_distribution<double> coordinate(0.0, extent);

  std::vector<vterra::Point<2>> sites;
  sites.reserve(count);
  for (size_t i = 0; i < count; ++i)
  {
    sites.push_back({ coordinate(engine), coordinate(engine) });
  }
  return sites;
}

static void printSummary(const vterra::VoronoiTerrain& terrain)
{
  const auto& terrain_graph = terrain.getTerrainGraph();
  const auto& region_graph = terrain.getRegionGraph();

  double min_height = std::numeric_limits<double>::infinity();
  double max_height = -std::numeric_limits<double>::infinity();
  size_t submerged = 0;
  for (const auto& vertex : terrain_graph.vertices)
  {
    double height = vertex.position.z();
    min_height = std::min(min_height, height);
    max_height = std::max(max_height, height);

    // noise lies in [-1, 1], map it onto [0, height scale] before comparing with the water level
    double scaled = 0.5 * (height + 1.0) * terrain.getHeightScale();
    if (scaled < terrain.getWaterLevel())
      submerged++;
  }

  size_t boundary_edges = terrain_graph.edgeCount() - region_graph.edgeCount();

  std::cout << "seed:            " << terrain.getSeed() << "\n";
  std::cout << "terrain vertices: " << terrain_graph.vertexCount() << "\n";
  std::cout << "terrain edges:    " << terrain_graph.edgeCount() << " (" << boundary_edges << " on the boundary)\n";
  std::cout << "regions:          " << region_graph.vertexCount() << "\n";
  std::cout << "region edges:     " << region_graph.edgeCount() << "\n";
  std::cout << "height range:     [" << min_height << ", " << max_height << "]\n";
  std::cout << "submerged:        " << submerged << " of " << terrain_graph.vertexCount() << " vertices below water level "
            << terrain.getWaterLevel() << std::endl;
}

int main(int argc, char** argv)
{
  size_t site_count = 100;
  size_t seed = 42;

  try
  {
    if (argc > 1)
      site_count = std::stoul(argv[1]);
    if (argc > 2)
      seed = std::stoul(argv[2]);
  }
  catch (const std::exception&)
  {
    std::cerr << "usage: " << argv[0] << " [site_count] [seed]" << std::endl;
    return 1;
  }

  vterra::logger.setLogLevel(vterra::LogLevel::Debug, false);

  try
  {
    vterra::VoronoiTerrain terrain = vterra::VoronoiTerrain::builder()
                                       .setSeed(seed)
                                       .setSites(randomSites(site_count, seed, 100.0))
                                       .setWaterLevel(50)
                                       .setHeight(100)
                                       .build();
    printSummary(terrain);
  }
  catch (const vterra::TerrainError& e)
  {
    std::cerr << "terrain generation failed (" << vterra::toString(e.kind()) << "): " << e.what() << std::endl;
    return 2;
  }

  return 0;
}
