#include "EdgeBuilder.hpp"
#include "Logger.hpp"
#include "TerrainError.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>

using namespace vterra;

namespace
{
struct DirectedEdgeHash
{
  std::size_t operator()(const Edge& edge) const noexcept
  {
    std::size_t h1 = std::hash<size_t> {}(edge.first);
    std::size_t h2 = std::hash<size_t> {}(edge.second);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

// What is known about a directed edge the first time it is traversed
struct EdgeRecord
{
  size_t terrain_edge; // index into terrain_edges
  size_t region; // cell that traversed the edge in this direction
  bool matched = false; // set once another cell traversed the reverse direction
};

std::string describe(const Edge& edge)
{
  return "(" + std::to_string(edge.first) + ", " + std::to_string(edge.second) + ")";
}
}

EdgeTopology vterra::buildEdgeTopology(const std::vector<Cell>& cells, size_t vertex_count)
{
  EdgeTopology topology;
  topology.edges_by_vertex.resize(vertex_count);
  topology.edges_by_region.resize(cells.size());
  topology.boundary_by_region.resize(cells.size());

  // Cells have fewer than 6 edges on average and each interior edge is shared by 2 cells
  topology.terrain_edges.reserve(vertex_count * 2);
  topology.region_edges.reserve(vertex_count * 2);

  std::unordered_map<Edge, EdgeRecord, DirectedEdgeHash> records;
  records.reserve(vertex_count * 2);
  std::unordered_map<Edge, size_t, DirectedEdgeHash> region_edge_by_pair;

  for (size_t region_index = 0; region_index < cells.size(); ++region_index)
  {
    const Cell& cell = cells[region_index];
    topology.boundary_by_region[region_index].reserve(cell.size());

    for (size_t i = 0; i < cell.size(); ++i)
    {
      const size_t current = cell[i];
      const size_t next = cell[(i + 1) % cell.size()];
      const Edge edge { current, next };

      if (current >= vertex_count || next >= vertex_count)
      {
        std::ostringstream message;
        message << "Cell " << region_index << " has edge " << describe(edge) << " outside of the " << vertex_count
                << " tessellation vertices";
        throw TopologyInconsistencyError(message.str());
      }
      if (current == next)
      {
        throw TopologyInconsistencyError(
          "Cell " + std::to_string(region_index) + " has a degenerate edge " + describe(edge));
      }

      if (records.count(edge))
      {
        std::ostringstream message;
        message << "Edge " << describe(edge) << " is traversed in the same direction by cells "
                << records.at(edge).region << " and " << region_index << ", cells are not wound consistently";
        throw TopologyInconsistencyError(message.str());
      }

      size_t edge_index;
      auto reverse = records.find({ next, current });
      if (reverse != records.end())
      {
        EdgeRecord& record = reverse->second;
        if (record.matched)
        {
          std::ostringstream message;
          message << "Edge " << describe(edge) << " of cell " << region_index
                  << " is shared by more than two cells";
          throw TopologyInconsistencyError(message.str());
        }
        if (record.region == region_index)
        {
          std::ostringstream message;
          message << "Cell " << region_index << " traverses edge " << describe(edge) << " in both directions";
          throw TopologyInconsistencyError(message.str());
        }
        record.matched = true;

        // non-convex cells may share more than one boundary edge, the adjacency is still stored once
        const Edge region_pair { std::min(region_index, record.region), std::max(region_index, record.region) };
        if (!region_edge_by_pair.count(region_pair))
        {
          const size_t region_edge_index = topology.region_edges.size();
          region_edge_by_pair.emplace(region_pair, region_edge_index);
          topology.region_edges.emplace_back(region_index, record.region);
          topology.edges_by_region[region_index].push_back(region_edge_index);
          topology.edges_by_region[record.region].push_back(region_edge_index);
        }

        edge_index = record.terrain_edge;
      }
      else
      {
        edge_index = topology.terrain_edges.size();
        topology.terrain_edges.push_back(edge);
        records.emplace(edge, EdgeRecord { edge_index, region_index });
      }

      topology.edges_by_vertex[current].push_back(edge_index);
      topology.boundary_by_region[region_index].push_back(edge_index);
    }
  }

  VTERRA_DEBUG("Built " << topology.terrain_edges.size() << " terrain edges and " << topology.region_edges.size()
                        << " region edges from " << cells.size() << " cells");

  return topology;
}
