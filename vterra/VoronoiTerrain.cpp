#include "VoronoiTerrain.hpp"
#include "EdgeBuilder.hpp"
#include "FbmHeightSource.hpp"
#include "HeightSynthesizer.hpp"
#include "Logger.hpp"
#include "TerrainError.hpp"
#include "VoronoiDiagram2D.hpp"
#include <algorithm>

using namespace vterra;

namespace
{
// Runs a step that calls into an injected capability, failures other than our own are reported as dependency failures
template<typename F>
auto callDependency(const char* what, F&& step) -> decltype(step())
{
  try
  {
    return step();
  }
  catch (const TerrainError&)
  {
    throw;
  }
  catch (const std::exception& e)
  {
    throw DependencyFailureError(std::string(what) + " failed: " + e.what());
  }
}
}

VoronoiTerrain::VoronoiTerrain(Graph<TerrainVertex> terrain_graph,
  Graph<Region> region_graph,
  uint32_t water_level,
  uint32_t height_scale,
  size_t seed)
  : terrain_graph(std::move(terrain_graph))
  , region_graph(std::move(region_graph))
  , water_level(water_level)
  , height_scale(height_scale)
  , seed(seed)
{
}

VoronoiTerrain::Builder VoronoiTerrain::builder()
{
  return Builder();
}

VoronoiTerrain::Builder::Builder()
  : seed_source(std::make_shared<SeedSource>())
{
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setSeed(size_t seed)
{
  this->seed = seed;
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setSites(std::vector<Point<2>> sites)
{
  this->sites = std::move(sites);
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setWaterLevel(uint32_t water_level)
{
  this->water_level = water_level;
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setHeight(uint32_t height)
{
  this->height = height;
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setBounds(const Point<2>& center, double radius)
{
  this->center = center;
  this->radius = radius;
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setTessellator(std::shared_ptr<const Tessellator> tessellator)
{
  this->tessellator = std::move(tessellator);
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setHeightSource(std::shared_ptr<const HeightSource> height_source)
{
  this->height_source = std::move(height_source);
  return *this;
}

VoronoiTerrain::Builder& VoronoiTerrain::Builder::setSeedSource(std::shared_ptr<SeedSource> seed_source)
{
  if (!seed_source)
    throw InvalidInputError("Seed source must not be null");
  this->seed_source = std::move(seed_source);
  return *this;
}

void VoronoiTerrain::Builder::validateSites() const
{
  if (sites.size() < 3)
  {
    throw InvalidInputError(
      "At least 3 sites are needed for a Voronoi terrain, got " + std::to_string(sites.size()));
  }

  for (const auto& site : sites)
  {
    if (!site.isFinite())
      throw InvalidInputError("Site " + site.toString() + " is not finite");
  }

  std::vector<Point<2>> sorted(sites);
  std::sort(sorted.begin(), sorted.end());
  auto duplicate = std::adjacent_find(sorted.begin(), sorted.end());
  if (duplicate != sorted.end())
    throw InvalidInputError("Site " + duplicate->toString() + " appears more than once");
}

VoronoiTerrain VoronoiTerrain::Builder::build() const
{
  try
  {
    const size_t terrain_seed = seed ? *seed : seed_source->next();
    VTERRA_INFO("Building Voronoi terrain from " << sites.size() << " sites with seed " << terrain_seed
                                                 << (seed ? "" : " (generated)"));

    std::shared_ptr<const Tessellator> engine = tessellator;
    if (!engine)
      engine = std::make_shared<VoronoiDiagram2D>(center, radius);

    std::shared_ptr<const HeightSource> source = height_source;
    if (!source)
      source = std::make_shared<FbmHeightSource>();

    validateSites();

    Tessellation tessellation
      = callDependency("Tessellation", [&]() { return engine->decompose(sites); });
    validateTessellation(tessellation, sites.size());

    EdgeTopology topology = buildEdgeTopology(tessellation.cells, tessellation.vertices.size());

    SynthesizedTerrain synthesized = callDependency("Height synthesis",
      [&]() { return synthesize(tessellation.vertices, tessellation.cells, *source, terrain_seed); });

    Graph<TerrainVertex> terrain_graph;
    terrain_graph.vertices.reserve(tessellation.vertices.size());
    for (size_t i = 0; i < tessellation.vertices.size(); ++i)
    {
      TerrainVertex vertex;
      vertex.position = synthesized.positions[i];
      vertex.normal = synthesized.vertex_normals[i];
      vertex.edges = std::move(topology.edges_by_vertex[i]);
      terrain_graph.vertices.push_back(std::move(vertex));
    }
    terrain_graph.edges = std::move(topology.terrain_edges);

    Graph<Region> region_graph;
    region_graph.vertices.reserve(tessellation.cells.size());
    for (size_t i = 0; i < tessellation.cells.size(); ++i)
    {
      Region region;
      region.center = synthesized.region_centers[i];
      region.normal = synthesized.region_normals[i];
      region.edges = std::move(topology.edges_by_region[i]);
      region.boundary = std::move(topology.boundary_by_region[i]);
      region.vertices = std::move(tessellation.cells[i]);
      region_graph.vertices.push_back(std::move(region));
    }
    region_graph.edges = std::move(topology.region_edges);

    VTERRA_INFO("Voronoi terrain has " << terrain_graph.vertexCount() << " vertices, " << terrain_graph.edgeCount()
                                       << " terrain edges, " << region_graph.vertexCount() << " regions and "
                                       << region_graph.edgeCount() << " region edges");

    return VoronoiTerrain(std::move(terrain_graph), std::move(region_graph), water_level, height, terrain_seed);
  }
  catch (const TerrainError& e)
  {
    VTERRA_ERROR("Building Voronoi terrain failed with " << toString(e.kind()) << ": " << e.what());
    throw;
  }
}
