#include "vterra/EdgeBuilder.hpp"
#include "vterra/TerrainError.hpp"

#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <set>

using namespace vterra;

// 3x3 grid of vertices, index = row * 3 + column, forming 2x2 counter-clockwise squares
static std::vector<Cell> gridCells()
{
  std::vector<Cell> cells;
  for (size_t row = 0; row < 2; ++row)
  {
    for (size_t column = 0; column < 2; ++column)
    {
      size_t v = row * 3 + column;
      cells.push_back({ v, v + 1, v + 4, v + 3 });
    }
  }
  return cells;
}

TEST_CASE("Two triangles share one edge", "[EdgeBuilder]")
{
  // 3 --- 2
  // | B / |
  // | / A |
  // 0 --- 1
  std::vector<Cell> cells = { { 0, 1, 2 }, { 0, 2, 3 } };
  EdgeTopology topology = buildEdgeTopology(cells, 4);

  REQUIRE(topology.terrain_edges == std::vector<Edge> { { 0, 1 }, { 1, 2 }, { 2, 0 }, { 2, 3 }, { 3, 0 } });
  REQUIRE(topology.region_edges == std::vector<Edge> { { 1, 0 } });

  // the diagonal is stored once, in the direction cell A traversed it
  REQUIRE(topology.edges_by_vertex[0] == std::vector<size_t> { 0, 2 });
  REQUIRE(topology.edges_by_vertex[1] == std::vector<size_t> { 1 });
  REQUIRE(topology.edges_by_vertex[2] == std::vector<size_t> { 2, 3 });
  REQUIRE(topology.edges_by_vertex[3] == std::vector<size_t> { 4 });

  REQUIRE(topology.boundary_by_region[0] == std::vector<size_t> { 0, 1, 2 });
  REQUIRE(topology.boundary_by_region[1] == std::vector<size_t> { 2, 3, 4 });
  REQUIRE(topology.edges_by_region[0] == std::vector<size_t> { 0 });
  REQUIRE(topology.edges_by_region[1] == std::vector<size_t> { 0 });
}

TEST_CASE("A single cell has only exterior edges", "[EdgeBuilder]")
{
  EdgeTopology topology = buildEdgeTopology({ { 0, 1, 2 } }, 3);

  REQUIRE(topology.terrain_edges.size() == 3);
  REQUIRE(topology.region_edges.empty());
  REQUIRE(topology.edges_by_region[0].empty());
}

TEST_CASE("Grid of squares is dual to its adjacency graph", "[EdgeBuilder]")
{
  std::vector<Cell> cells = gridCells();
  EdgeTopology topology = buildEdgeTopology(cells, 9);

  REQUIRE(topology.terrain_edges.size() == 12);
  REQUIRE(topology.region_edges.size() == 4);

  // V - E + F for a disk
  REQUIRE(9 - 12 + 4 == 1);

  std::set<std::pair<size_t, size_t>> adjacency;
  for (const auto& [a, b] : topology.region_edges)
  {
    REQUIRE(a != b);
    adjacency.insert({ std::min(a, b), std::max(a, b) });
  }
  REQUIRE(adjacency == std::set<std::pair<size_t, size_t>> { { 0, 1 }, { 0, 2 }, { 1, 3 }, { 2, 3 } });

  // interior edges are the ones listed by two cells
  std::vector<size_t> cells_per_edge(topology.terrain_edges.size(), 0);
  for (const auto& boundary : topology.boundary_by_region)
  {
    for (size_t edge_index : boundary)
      cells_per_edge[edge_index]++;
  }
  size_t interior = std::count(cells_per_edge.begin(), cells_per_edge.end(), 2);
  size_t exterior = std::count(cells_per_edge.begin(), cells_per_edge.end(), 1);
  REQUIRE(interior == topology.region_edges.size());
  REQUIRE(exterior == 8);
}

TEST_CASE("No undirected edge is stored twice", "[EdgeBuilder]")
{
  EdgeTopology topology = buildEdgeTopology(gridCells(), 9);

  std::set<std::pair<size_t, size_t>> seen;
  for (const auto& [a, b] : topology.terrain_edges)
  {
    REQUIRE(seen.insert({ std::min(a, b), std::max(a, b) }).second);
  }
}

TEST_CASE("All indices are in range", "[EdgeBuilder]")
{
  EdgeTopology topology = buildEdgeTopology(gridCells(), 9);

  for (const auto& [a, b] : topology.terrain_edges)
  {
    REQUIRE(a < 9);
    REQUIRE(b < 9);
  }
  for (const auto& edges : topology.edges_by_vertex)
  {
    for (size_t edge_index : edges)
      REQUIRE(edge_index < topology.terrain_edges.size());
  }
  for (const auto& edges : topology.edges_by_region)
  {
    for (size_t edge_index : edges)
      REQUIRE(edge_index < topology.region_edges.size());
  }
}

TEST_CASE("Vertices without cells have no edges", "[EdgeBuilder]")
{
  EdgeTopology topology = buildEdgeTopology({ { 0, 1, 2 } }, 5);

  REQUIRE(topology.edges_by_vertex.size() == 5);
  REQUIRE(topology.edges_by_vertex[3].empty());
  REQUIRE(topology.edges_by_vertex[4].empty());
}

TEST_CASE("Inconsistent winding is reported", "[EdgeBuilder]")
{
  // B is wound clockwise and traverses the diagonal in the same direction as A
  std::vector<Cell> cells = { { 0, 1, 2 }, { 2, 0, 3 } };

  REQUIRE_THROWS_AS(buildEdgeTopology(cells, 4), TopologyInconsistencyError);

  try
  {
    buildEdgeTopology(cells, 4);
  }
  catch (const TerrainError& e)
  {
    REQUIRE(e.kind() == TerrainError::Kind::TopologyInconsistency);
  }
}

TEST_CASE("An edge shared by three cells is reported", "[EdgeBuilder]")
{
  std::vector<Cell> cells = { { 0, 1, 2 }, { 2, 1, 3 }, { 2, 1, 4 } };

  REQUIRE_THROWS_AS(buildEdgeTopology(cells, 5), TopologyInconsistencyError);
}

TEST_CASE("A cell traversing an edge in both directions is reported", "[EdgeBuilder]")
{
  std::vector<Cell> cells = { { 0, 1, 2, 1 } };

  REQUIRE_THROWS_AS(buildEdgeTopology(cells, 3), TopologyInconsistencyError);
}

TEST_CASE("Malformed cells are reported", "[EdgeBuilder]")
{
  SECTION("Vertex index out of range")
  {
    REQUIRE_THROWS_AS(buildEdgeTopology({ { 0, 1, 5 } }, 3), TopologyInconsistencyError);
  }

  SECTION("Edge with equal endpoints")
  {
    REQUIRE_THROWS_AS(buildEdgeTopology({ { 0, 0, 1 } }, 3), TopologyInconsistencyError);
  }
}
