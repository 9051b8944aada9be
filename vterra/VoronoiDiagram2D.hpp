#pragma once
#include "Tessellator.hpp"

namespace vterra
{

/**
 * \brief Voronoi decomposition of a set of sites computed from the Delaunay triangulation produced by qhull.
 *
 * The four corners of a square frame around `center` are triangulated together with the sites. Their cells are not
 * returned, they only close the cells of sites on the convex hull so that every returned cell is a bounded polygon.
 * Voronoi vertices are the circumcenters of the Delaunay triangles. Coinciding circumcenters (cocircular sites) are
 * merged into a single vertex.
 */
class VoronoiDiagram2D : public Tessellator
{
 public:
  static constexpr double default_radius = 9999.0;

  VoronoiDiagram2D() = default;
  VoronoiDiagram2D(const Point<2>& center, double radius);

  // Indices of the three corners of a Delaunay triangle
  using Triangle = std::array<size_t, 3>;

  Tessellation decompose(const std::vector<Point<2>>& sites) const override;

  /**
   * \brief Builds the Voronoi cells of the first `site_count` points from a Delaunay triangulation of `points`.
   *
   * Points past `site_count` only close the cells of the sites, they get no cell of their own. Throws
   * DependencyFailureError for a triangle without a finite circumcenter.
   */
  static Tessellation fromTriangulation(
    const std::vector<Point<2>>& points, const std::vector<Triangle>& triangles, size_t site_count);

  // Distance below which circumcenters are merged, relative to the extent of the sites
  static double weldEpsilon(const std::vector<Point<2>>& sites);

  const Point<2>& getCenter() const { return center; }
  double getRadius() const { return radius; }

  // True if the site lies strictly inside the frame
  bool contains(const Point<2>& site) const;

 private:
  Point<2> center { 0.0, 0.0 };
  double radius = default_radius;

  std::vector<Triangle> triangulate(const std::vector<Point<2>>& points) const;
};
}
