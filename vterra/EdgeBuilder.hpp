#pragma once
#include "Graph.hpp"
#include "Tessellator.hpp"
#include <vector>

namespace vterra
{

struct EdgeTopology
{
  // Deduplicated undirected edges between tessellation vertices, stored in the direction first traversed
  std::vector<Edge> terrain_edges;
  // Undirected adjacency edges between cells
  std::vector<Edge> region_edges;
  // For each vertex the terrain edges leaving it in the winding order of some cell
  std::vector<std::vector<size_t>> edges_by_vertex;
  // For each cell the region edges it takes part in
  std::vector<std::vector<size_t>> edges_by_region;
  // For each cell the terrain edges of its polygon in winding order
  std::vector<std::vector<size_t>> boundary_by_region;
};

/**
 * \brief Derives the terrain edges and the dual region adjacency from a list of cells.
 *
 * Every cell is traversed in its winding order. Since all cells are wound the same way, an edge shared by two cells
 * is traversed once in each direction, so looking up the reverse of every directed edge detects sharing without any
 * geometric comparison. Edges on the exterior of the tessellation are never traversed in reverse and produce no
 * region edge.
 *
 * Throws TopologyInconsistencyError if a directed edge is traversed twice (inconsistent winding), if an edge is shared
 * by more than two cells, if a cell is adjacent to itself or if a cell contains an edge with equal endpoints or an
 * index that is out of range.
 *
 * @param cells polygons as indices into the tessellation vertices.
 * @param vertex_count number of tessellation vertices.
 */
EdgeTopology buildEdgeTopology(const std::vector<Cell>& cells, size_t vertex_count);
}
