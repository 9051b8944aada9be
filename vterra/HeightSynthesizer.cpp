#include "HeightSynthesizer.hpp"
#include "Logger.hpp"
#include "TerrainError.hpp"
#include <cmath>
#include <stdexcept>

using namespace vterra;

Eigen::Vector3d vterra::faceNormal(const Eigen::Vector3d& p0, const Eigen::Vector3d& p1, const Eigen::Vector3d& p2)
{
  Eigen::Vector3d normal = (p1 - p0).cross(p2 - p0);
  double length = normal.norm();
  if (!(length > 1e-300) || !std::isfinite(length))
  {
    throw std::runtime_error("Cannot normalize a zero-length vector");
  }
  return normal / length;
}

SynthesizedTerrain vterra::synthesize(const std::vector<Point<2>>& vertices,
  const std::vector<Cell>& cells,
  const HeightSource& height_source,
  size_t seed)
{
  SynthesizedTerrain result;
  result.positions.reserve(vertices.size());

  for (size_t i = 0; i < vertices.size(); ++i)
  {
    const Point<2>& vertex = vertices[i];
    double height = height_source.height(seed, vertex[0], vertex[1]);
    if (!std::isfinite(height))
    {
      throw DependencyFailureError("Height source returned " + std::to_string(height) + " at vertex "
        + std::to_string(i) + " " + vertex.toString());
    }
    result.positions.emplace_back(vertex[0], vertex[1], height);
  }

  result.region_normals.reserve(cells.size());
  result.region_centers.reserve(cells.size());
  result.vertex_normals.assign(vertices.size(), Eigen::Vector3d::Zero());

  for (size_t region_index = 0; region_index < cells.size(); ++region_index)
  {
    const Cell& cell = cells[region_index];
    if (cell.size() < 3)
    {
      throw TopologyInconsistencyError(
        "Cell " + std::to_string(region_index) + " has fewer than 3 vertices, no normal can be computed");
    }

    for (size_t vertex_index : cell)
    {
      if (vertex_index >= vertices.size())
      {
        throw TopologyInconsistencyError("Cell " + std::to_string(region_index) + " references vertex "
          + std::to_string(vertex_index) + " outside of the " + std::to_string(vertices.size()) + " vertices");
      }
    }

    Eigen::Vector3d normal;
    try
    {
      normal = faceNormal(result.positions[cell[0]], result.positions[cell[1]], result.positions[cell[2]]);
    }
    catch (const std::runtime_error& e)
    {
      throw TopologyInconsistencyError("Cell " + std::to_string(region_index)
        + " starts with three collinear vertices: " + e.what());
    }
    result.region_normals.push_back(normal);

    Eigen::Vector3d center = Eigen::Vector3d::Zero();
    for (size_t vertex_index : cell)
    {
      center += result.positions[vertex_index];
      result.vertex_normals[vertex_index] += normal;
    }
    result.region_centers.push_back(center / static_cast<double>(cell.size()));
  }

  for (auto& normal : result.vertex_normals)
  {
    double length = normal.norm();
    // stays zero for vertices that belong to no region
    if (length > 0.0)
      normal /= length;
  }

  VTERRA_DEBUG("Synthesized heights for " << vertices.size() << " vertices and normals for " << cells.size()
                                          << " regions with seed " << seed);

  return result;
}
