#pragma once
#include <array>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

namespace vterra
{
template<size_t dim>
class Point : public std::array<double, dim>
{
 public:
  // String representation for debugging
  std::string toString() const
  {
    std::string result = "(";
    for (size_t i = 0; i < dim; ++i)
    {
      result += std::to_string((*this)[i]);
      if (i < dim - 1)
        result += ", ";
    }
    result += ")";
    return result;
  }

  double operator*(const Point<dim>& other) const
  {
    double result = 0.0;
    for (size_t i = 0; i < dim; ++i)
    {
      result += (*this)[i] * other[i];
    }
    return result;
  }

  double len_sqr() const
  {
    return (*this) * (*this);
  }

  double len() const
  {
    return std::sqrt(len_sqr());
  }

  double dist_sqr(const Point<dim>& other) const
  {
    return ((*this) - other).len_sqr();
  }

  double dist(const Point<dim>& other) const
  {
    return std::sqrt(dist_sqr(other));
  }

  bool isFinite() const
  {
    for (size_t i = 0; i < dim; ++i)
    {
      if (!std::isfinite((*this)[i]))
        return false;
    }
    return true;
  }
};

template<size_t dim>
Point<dim> operator+(const Point<dim>& a, const Point<dim>& b)
{
  Point<dim> result {};
  for (size_t i = 0; i < dim; ++i)
  {
    result[i] = a[i] + b[i];
  }
  return result;
}

template<size_t dim>
Point<dim> operator-(const Point<dim>& a, const Point<dim>& b)
{
  Point<dim> result {};
  for (size_t i = 0; i < dim; ++i)
  {
    result[i] = a[i] - b[i];
  }
  return result;
}

template<size_t dim>
Point<dim> operator*(const Point<dim>& a, double scalar)
{
  Point<dim> result {};
  for (size_t i = 0; i < dim; ++i)
  {
    result[i] = a[i] * scalar;
  }
  return result;
}

template<size_t dim>
Point<dim> operator*(double scalar, const Point<dim>& a)
{
  return a * scalar;
}

// z component of the cross product of two 2D vectors
double operator%(const Point<2>& a, const Point<2>& b);

/**
 * \brief Circumcenter of the triangle a, b, c.
 *
 * Returns a point at infinity if the points are collinear.
 */
Point<2> circumcenter(const Point<2>& a, const Point<2>& b, const Point<2>& c);

/**
 * \brief Signed area of a polygon given by indices into a vertex list (shoelace formula).
 *
 * Positive for counter-clockwise winding.
 */
double signedArea(const std::vector<Point<2>>& vertices, const std::vector<size_t>& polygon);
}
