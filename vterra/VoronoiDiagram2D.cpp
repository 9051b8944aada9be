#include "VoronoiDiagram2D.hpp"
#include "Logger.hpp"
#include "TerrainError.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <unordered_map>

extern "C"
{
#include <libqhull_r/qhull_ra.h>
}

using namespace vterra;

namespace
{
// Owns a reentrant qhull context for the duration of one triangulation
class QhullContext
{
 public:
  QhullContext() { qh_zero(&qh_context, stderr); }

  ~QhullContext()
  {
    qh_freeqhull(&qh_context, !qh_ALL);
    int curlong, totlong;
    qh_memfreeshort(&qh_context, &curlong, &totlong);
    if (curlong || totlong)
    {
      VTERRA_WARNING("Qhull: memory not fully freed: " << curlong << " blocks remaining, " << totlong
                                                       << " bytes in total");
    }
  }

  QhullContext(const QhullContext&) = delete;
  QhullContext& operator=(const QhullContext&) = delete;

  qhT* get() { return &qh_context; }

 private:
  qhT qh_context;
};

struct GridKey
{
  long long x;
  long long y;

  bool operator==(const GridKey& other) const { return x == other.x && y == other.y; }
};

struct GridKeyHash
{
  std::size_t operator()(const GridKey& key) const noexcept
  {
    std::size_t h1 = std::hash<long long> {}(key.x);
    std::size_t h2 = std::hash<long long> {}(key.y);
    return h1 ^ (h2 << 1);
  }
};

// Assigns one index to all points closer than epsilon, found through a quantized grid with cells of at least epsilon
class VertexWelder
{
 public:
  VertexWelder(double epsilon, double cell_size)
    : epsilon(epsilon)
    , inv_eps(1.0 / std::max(epsilon, cell_size))
  {
  }

  size_t insert(const Point<2>& p)
  {
    GridKey key { std::llround(p[0] * inv_eps), std::llround(p[1] * inv_eps) };

    // a point close to a cell border may have its twin in the neighboring cell
    for (long long dx = -1; dx <= 1; ++dx)
    {
      for (long long dy = -1; dy <= 1; ++dy)
      {
        auto it = grid.find({ key.x + dx, key.y + dy });
        if (it == grid.end())
          continue;
        for (size_t index : it->second)
        {
          if (vertices[index].dist_sqr(p) <= epsilon * epsilon)
            return index;
        }
      }
    }

    size_t index = vertices.size();
    vertices.push_back(p);
    grid[key].push_back(index);
    return index;
  }

  std::vector<Point<2>> extract() { return std::move(vertices); }

 private:
  double epsilon;
  double inv_eps;
  std::vector<Point<2>> vertices;
  std::unordered_map<GridKey, std::vector<size_t>, GridKeyHash> grid;
};
}

VoronoiDiagram2D::VoronoiDiagram2D(const Point<2>& center, double radius)
  : center(center)
  , radius(radius)
{
  if (!center.isFinite() || !std::isfinite(radius) || radius <= 0.0)
  {
    throw InvalidInputError("Voronoi frame needs a finite center and a positive radius, got center "
      + center.toString() + " and radius " + std::to_string(radius));
  }
}

bool VoronoiDiagram2D::contains(const Point<2>& site) const
{
  return std::abs(site[0] - center[0]) < radius && std::abs(site[1] - center[1]) < radius;
}

std::vector<VoronoiDiagram2D::Triangle> VoronoiDiagram2D::triangulate(const std::vector<Point<2>>& points) const
{
  const int dim = 2;
  const int num_points = static_cast<int>(points.size());
  std::vector<coordT> coords(dim * points.size());
  for (size_t i = 0; i < points.size(); ++i)
  {
    coords[2 * i] = points[i][0];
    coords[2 * i + 1] = points[i][1];
  }

  QhullContext context;
  qhT* qh = context.get();

  // d=Delaunay, Qt=triangulated output, Qbb=scale the paraboloid, Qz=point at infinity for cocircular input
  char options[] = "qhull d Qt Qbb Qz";
  int exitcode = qh_new_qhull(qh, dim, num_points, coords.data(), False, options, nullptr, stderr);
  if (exitcode != 0)
  {
    throw DependencyFailureError("Qhull failed to compute the Delaunay triangulation (exit code "
      + std::to_string(exitcode) + ")");
  }

  std::vector<Triangle> triangles;
  facetT* facet;
  vertexT *vertex, **vertexp;
  FORALLfacets
  {
    if (facet->upperdelaunay)
      continue;

    Triangle triangle {};
    size_t corner = 0;
    bool valid = true;
    FOREACHvertex_(facet->vertices)
    {
      int point_id = qh_pointid(qh, vertex->point);
      if (corner >= 3 || point_id < 0 || point_id >= num_points)
      {
        valid = false;
        break;
      }
      triangle[corner++] = static_cast<size_t>(point_id);
    }

    if (!valid || corner != 3)
    {
      throw DependencyFailureError("Qhull returned a Delaunay facet that is not a triangle of input points");
    }
    triangles.push_back(triangle);
  }

  return triangles;
}

Tessellation VoronoiDiagram2D::decompose(const std::vector<Point<2>>& sites) const
{
  if (sites.size() < 3)
    throw InvalidInputError("At least 3 points are needed for a Voronoi diagram");

  for (const auto& site : sites)
  {
    if (!contains(site))
      throw InvalidInputError("Site " + site.toString() + " is not strictly inside the Voronoi frame");
  }

  std::vector<Point<2>> points(sites);
  points.push_back({ center[0] - radius, center[1] - radius });
  points.push_back({ center[0] + radius, center[1] - radius });
  points.push_back({ center[0] + radius, center[1] + radius });
  points.push_back({ center[0] - radius, center[1] + radius });

  std::vector<Triangle> triangles = triangulate(points);
  VTERRA_DEBUG("Delaunay triangulation of " << sites.size() << " sites has " << triangles.size() << " triangles");

  return fromTriangulation(points, triangles, sites.size());
}

double VoronoiDiagram2D::weldEpsilon(const std::vector<Point<2>>& sites)
{
  double extent = 0.0;
  if (!sites.empty())
  {
    Point<2> lower = sites.front();
    Point<2> upper = sites.front();
    for (const auto& site : sites)
    {
      lower = { std::min(lower[0], site[0]), std::min(lower[1], site[1]) };
      upper = { std::max(upper[0], site[0]), std::max(upper[1], site[1]) };
    }
    extent = std::max(upper[0] - lower[0], upper[1] - lower[1]);
  }

  // a single site or coinciding sites have no extent to scale with
  if (!(extent > 0.0) || !std::isfinite(extent))
    return 1e-9;
  return 1e-9 * extent;
}

Tessellation VoronoiDiagram2D::fromTriangulation(
  const std::vector<Point<2>>& points, const std::vector<Triangle>& triangles, size_t site_count)
{
  if (site_count > points.size())
  {
    throw InvalidInputError("Cannot build " + std::to_string(site_count) + " cells from "
      + std::to_string(points.size()) + " triangulated points");
  }
  const std::vector<Point<2>> sites(points.begin(), points.begin() + site_count);
  std::vector<std::vector<size_t>> vertices_by_site(site_count);

  std::vector<Point<2>> centers;
  centers.reserve(triangles.size());
  double magnitude = 0.0;
  for (const auto& triangle : triangles)
  {
    for (size_t point_index : triangle)
    {
      if (point_index >= points.size())
      {
        throw DependencyFailureError("Delaunay triangle references point " + std::to_string(point_index)
          + " but only " + std::to_string(points.size()) + " points were triangulated");
      }
    }

    Point<2> center_point = circumcenter(points[triangle[0]], points[triangle[1]], points[triangle[2]]);
    if (!center_point.isFinite())
    {
      throw DependencyFailureError("Delaunay triangle (" + std::to_string(triangle[0]) + ", "
        + std::to_string(triangle[1]) + ", " + std::to_string(triangle[2])
        + ") is degenerate and has no circumcenter");
    }
    magnitude = std::max({ magnitude, std::abs(center_point[0]), std::abs(center_point[1]) });
    centers.push_back(center_point);
  }

  // grid keys must stay representable for circumcenters far away from tightly packed sites
  VertexWelder welder(weldEpsilon(sites), magnitude * 1e-15);
  for (size_t triangle_index = 0; triangle_index < triangles.size(); ++triangle_index)
  {
    size_t vertex_index = welder.insert(centers[triangle_index]);
    for (size_t point_index : triangles[triangle_index])
    {
      if (point_index < site_count)
        vertices_by_site[point_index].push_back(vertex_index);
    }
  }

  Tessellation tessellation;
  tessellation.vertices = welder.extract();
  tessellation.cells.resize(site_count);

  for (size_t site_index = 0; site_index < site_count; ++site_index)
  {
    const Point<2>& site = sites[site_index];
    std::vector<size_t> ring = vertices_by_site[site_index];

    // the site lies inside its convex cell, so sorting by angle around it yields counter-clockwise order
    std::sort(ring.begin(), ring.end(),
      [&](size_t a, size_t b)
      {
        const Point<2> da = tessellation.vertices[a] - site;
        const Point<2> db = tessellation.vertices[b] - site;
        return std::atan2(da[1], da[0]) < std::atan2(db[1], db[0]);
      });

    // merged circumcenters appear several times in a row
    ring.erase(std::unique(ring.begin(), ring.end()), ring.end());
    while (ring.size() > 1 && ring.front() == ring.back())
      ring.pop_back();

    tessellation.cells[site_index] = std::move(ring);
  }

  return tessellation;
}
