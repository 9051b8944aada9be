#pragma once
#include "Graph.hpp"
#include "HeightSource.hpp"
#include "Point.hpp"
#include "SeedSource.hpp"
#include "Tessellator.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

namespace vterra
{

/**
 * \brief Terrain built from a Voronoi decomposition of a set of sites.
 *
 * The terrain graph holds the vertices and edges of the decomposition lifted to 3D by a height field. The region
 * graph holds one vertex per cell and an edge between every pair of cells sharing a boundary edge. Both graphs are
 * dual to each other except along the exterior boundary of the decomposition.
 *
 * Instances are created through VoronoiTerrain::builder() and are read-only afterwards.
 */
class VoronoiTerrain
{
 public:
  class Builder
  {
   public:
    Builder();

    Builder& setSeed(size_t seed);
    Builder& setSites(std::vector<Point<2>> sites);
    Builder& setWaterLevel(uint32_t water_level);
    // Height scale handed to consumers of the terrain, heights themselves stay raw noise values
    Builder& setHeight(uint32_t height);
    // Square frame around all sites, see VoronoiDiagram2D
    Builder& setBounds(const Point<2>& center, double radius);
    Builder& setTessellator(std::shared_ptr<const Tessellator> tessellator);
    Builder& setHeightSource(std::shared_ptr<const HeightSource> height_source);
    Builder& setSeedSource(std::shared_ptr<SeedSource> seed_source);

    /**
     * \brief Builds the terrain.
     *
     * Throws InvalidInputError for fewer than 3 sites, duplicate or non finite sites and sites outside of the frame,
     * TopologyInconsistencyError if the cells are not wound consistently and DependencyFailureError if the
     * tessellation or the height source fails.
     */
    VoronoiTerrain build() const;

   private:
    std::optional<size_t> seed;
    std::vector<Point<2>> sites;
    uint32_t water_level = 50;
    uint32_t height = 100;
    Point<2> center { 0.0, 0.0 };
    double radius = 9999.0;
    std::shared_ptr<const Tessellator> tessellator;
    std::shared_ptr<const HeightSource> height_source;
    std::shared_ptr<SeedSource> seed_source;

    void validateSites() const;
  };

  static Builder builder();

  const Graph<TerrainVertex>& getTerrainGraph() const { return terrain_graph; }
  const Graph<Region>& getRegionGraph() const { return region_graph; }
  uint32_t getWaterLevel() const { return water_level; }
  uint32_t getHeightScale() const { return height_scale; }
  size_t getSeed() const { return seed; }

 private:
  VoronoiTerrain(Graph<TerrainVertex> terrain_graph,
    Graph<Region> region_graph,
    uint32_t water_level,
    uint32_t height_scale,
    size_t seed);

  Graph<TerrainVertex> terrain_graph;
  Graph<Region> region_graph;
  uint32_t water_level;
  uint32_t height_scale;
  size_t seed;
};
}
