#include "Tessellator.hpp"
#include "Logger.hpp"
#include "TerrainError.hpp"
#include <cmath>
#include <sstream>

namespace vterra
{
void validateTessellation(const Tessellation& tessellation, size_t site_count)
{
  const size_t vertex_count = tessellation.vertices.size();

  if (tessellation.cells.size() != site_count)
  {
    std::ostringstream message;
    message << "Tessellation returned " << tessellation.cells.size() << " cells for " << site_count << " sites";
    throw DependencyFailureError(message.str());
  }

  for (size_t vertex_index = 0; vertex_index < vertex_count; ++vertex_index)
  {
    if (!tessellation.vertices[vertex_index].isFinite())
    {
      throw DependencyFailureError("Tessellation vertex " + std::to_string(vertex_index) + " is not finite");
    }
  }

  // sign of the signed area all cells share, taken from the first cell
  double orientation = 0.0;
  for (size_t cell_index = 0; cell_index < tessellation.cells.size(); ++cell_index)
  {
    const Cell& cell = tessellation.cells[cell_index];
    if (cell.size() < 3)
    {
      std::ostringstream message;
      message << "Cell " << cell_index << " has " << cell.size() << " vertices, at least 3 are required";
      throw DependencyFailureError(message.str());
    }

    for (size_t i = 0; i < cell.size(); ++i)
    {
      if (cell[i] >= vertex_count)
      {
        std::ostringstream message;
        message << "Cell " << cell_index << " references vertex " << cell[i] << " but only " << vertex_count
                << " vertices exist";
        throw DependencyFailureError(message.str());
      }
      if (cell[i] == cell[(i + 1) % cell.size()])
      {
        std::ostringstream message;
        message << "Cell " << cell_index << " repeats vertex " << cell[i];
        throw DependencyFailureError(message.str());
      }
    }

    double area = signedArea(tessellation.vertices, cell);
    if (!(area != 0.0) || !std::isfinite(area))
    {
      std::ostringstream message;
      message << "Cell " << cell_index << " has degenerate winding (signed area " << area << ")";
      throw TopologyInconsistencyError(message.str());
    }
    if (cell_index == 0)
    {
      orientation = area > 0.0 ? 1.0 : -1.0;
    }
    else if (area * orientation < 0.0)
    {
      std::ostringstream message;
      message << "Cell " << cell_index << " is wound " << (area > 0.0 ? "counter-clockwise" : "clockwise")
              << " but cell 0 is wound " << (orientation > 0.0 ? "counter-clockwise" : "clockwise");
      throw TopologyInconsistencyError(message.str());
    }
  }

  VTERRA_DEBUG("Tessellation with " << vertex_count << " vertices and " << tessellation.cells.size()
                                    << " cells passed validation");
}
}
