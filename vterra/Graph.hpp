#pragma once
#include <Eigen/Dense>
#include <utility>
#include <vector>

namespace vterra
{
// Undirected edge stored as a pair of indices into the vertex list of its graph
using Edge = std::pair<size_t, size_t>;

/**
 * \brief Generic index based graph.
 *
 * Edges and the edge lists held by vertices refer to other elements by index only, the graph owns both sequences.
 */
template<typename T>
struct Graph
{
  std::vector<T> vertices;
  std::vector<Edge> edges;

  size_t vertexCount() const { return vertices.size(); }
  size_t edgeCount() const { return edges.size(); }

  // Returns the index of the vertex at the other end of an edge
  size_t opposite(size_t edge_index, size_t vertex_index) const
  {
    const Edge& edge = edges[edge_index];
    return edge.first == vertex_index ? edge.second : edge.first;
  }
};

struct TerrainVertex
{
  Eigen::Vector3d position = Eigen::Vector3d::Zero();
  Eigen::Vector3d normal = Eigen::Vector3d::Zero();

  // Indices into the terrain edges
  std::vector<size_t> edges;
};

struct Region
{
  Eigen::Vector3d center = Eigen::Vector3d::Zero();
  Eigen::Vector3d normal = Eigen::Vector3d::Zero();

  // Indices into the region edges
  std::vector<size_t> edges;

  // Indices into the terrain edges forming the polygon of this region, in winding order
  std::vector<size_t> boundary;

  // Indices into the terrain vertices, in winding order
  std::vector<size_t> vertices;
};
}
