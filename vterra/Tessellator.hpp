#pragma once
#include "Point.hpp"
#include <vector>

namespace vterra
{
// Polygon given as indices into the vertex list of a tessellation
using Cell = std::vector<size_t>;

struct Tessellation
{
  std::vector<Point<2>> vertices;
  std::vector<Cell> cells;
};

/**
 * \brief Capability that decomposes the plane into one polygonal cell per site.
 *
 * Implementations must return one cell per site in site order, wind all cells the same way (either all
 * counter-clockwise or all clockwise), give every cell at least 3 vertices and only use indices into the returned
 * vertex list. Vertex positions are unique.
 */
class Tessellator
{
 public:
  virtual ~Tessellator() = default;

  virtual Tessellation decompose(const std::vector<Point<2>>& sites) const = 0;
};

/**
 * \brief Checks a tessellation against the contract of Tessellator.
 *
 * Throws DependencyFailureError for invalid indices, cells with fewer than 3 vertices or repeated consecutive
 * vertices, and TopologyInconsistencyError for cells with zero signed area or a winding that differs from the first
 * cell.
 *
 * @param tessellation the engine result to check.
 * @param site_count number of sites passed to the engine, the number of cells must match.
 */
void validateTessellation(const Tessellation& tessellation, size_t site_count);
}
