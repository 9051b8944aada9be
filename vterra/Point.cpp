#include "Point.hpp"
#include <limits>

namespace vterra
{
double operator%(const Point<2>& a, const Point<2>& b)
{
  return a[0] * b[1] - a[1] * b[0];
}

Point<2> circumcenter(const Point<2>& a, const Point<2>& b, const Point<2>& c)
{
  double D = 2 * (a[0] * (b[1] - c[1]) + b[0] * (c[1] - a[1]) + c[0] * (a[1] - b[1]));
  if (D == 0)
  {
    return Point<2> { std::numeric_limits<double>::infinity(), std::numeric_limits<double>::infinity() };
  }
  double Ux = ((a[0] * a[0] + a[1] * a[1]) * (b[1] - c[1]) + (b[0] * b[0] + b[1] * b[1]) * (c[1] - a[1])
                + (c[0] * c[0] + c[1] * c[1]) * (a[1] - b[1]))
    / D;
  double Uy = ((a[0] * a[0] + a[1] * a[1]) * (c[0] - b[0]) + (b[0] * b[0] + b[1] * b[1]) * (a[0] - c[0])
                + (c[0] * c[0] + c[1] * c[1]) * (b[0] - a[0]))
    / D;
  return { Ux, Uy };
}

double signedArea(const std::vector<Point<2>>& vertices, const std::vector<size_t>& polygon)
{
  double twice_area = 0.0;
  for (size_t i = 0; i < polygon.size(); ++i)
  {
    const Point<2>& current = vertices[polygon[i]];
    const Point<2>& next = vertices[polygon[(i + 1) % polygon.size()]];
    twice_area += current % next;
  }
  return 0.5 * twice_area;
}
}
