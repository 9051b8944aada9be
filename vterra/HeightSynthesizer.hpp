#pragma once
#include "HeightSource.hpp"
#include "Tessellator.hpp"
#include <Eigen/Dense>
#include <vector>

namespace vterra
{

struct SynthesizedTerrain
{
  std::vector<Eigen::Vector3d> positions; // one per tessellation vertex
  std::vector<Eigen::Vector3d> vertex_normals; // one per tessellation vertex
  std::vector<Eigen::Vector3d> region_normals; // one per cell
  std::vector<Eigen::Vector3d> region_centers; // one per cell
};

/**
 * \brief Lifts the tessellation into 3D using a height source and computes normals and centers.
 *
 * The height of a vertex is the value of the height source at its 2D position. The normal of a region is computed
 * from the first three vertices of its cell only. This is exact for triangles and an approximation for larger
 * cells, whose vertices are in general not coplanar once displaced. The normal of a vertex is the normalized mean of
 * the normals of the regions containing it (zero if it belongs to no region). The center of a region is the mean of
 * its vertex positions.
 *
 * Throws DependencyFailureError if the height source returns a non finite value and TopologyInconsistencyError if
 * the first three vertices of a cell are collinear in 3D.
 */
SynthesizedTerrain synthesize(const std::vector<Point<2>>& vertices,
  const std::vector<Cell>& cells,
  const HeightSource& height_source,
  size_t seed);

// Unit normal of the triangle p0, p1, p2, throws std::runtime_error if the triangle is degenerate
Eigen::Vector3d faceNormal(const Eigen::Vector3d& p0, const Eigen::Vector3d& p1, const Eigen::Vector3d& p2);
}
