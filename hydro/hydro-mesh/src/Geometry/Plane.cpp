#include "hydro-mesh/src/Geometry/Plane.hpp"

#include <stdexcept>

namespace hydro_mesh
{

namespace
{

Vector3D normalizedOrThrow(const Vector3D& normal)
{
  const double norm = normal.norm();
  if (norm == 0.0)
  {
    throw std::invalid_argument("Plane normal must have a non-zero length");
  }
  return normal / norm;
}

}  // namespace

Plane::Plane() : normal_{0.0, 0.0, 1.0}, offset_{0.0}
{
}

Plane::Plane(const Vector3D& normal, double offset)
  : normal_{normalizedOrThrow(normal)}, offset_{offset}
{
}

const Vector3D& Plane::getNormal() const
{
  return normal_;
}

double Plane::getOffset() const
{
  return offset_;
}

void Plane::setNormal(const Vector3D& normal)
{
  normal_ = normalizedOrThrow(normal);
}

void Plane::setOffset(double offset)
{
  offset_ = offset;
}

double Plane::distanceTo(const Coordinate& point) const
{
  return normal_.dot(point) - offset_;
}

Coordinate Plane::orthogonalProjection(const Coordinate& point) const
{
  return point - distanceTo(point) * normal_;
}

std::vector<Coordinate> Plane::orthogonalProjection(
  const std::vector<Coordinate>& points) const
{
  std::vector<Coordinate> projected;
  projected.reserve(points.size());
  for (const auto& point : points)
  {
    projected.push_back(orthogonalProjection(point));
  }
  return projected;
}

Coordinate Plane::reflect(const Coordinate& point) const
{
  return point - 2.0 * distanceTo(point) * normal_;
}

}  // namespace hydro_mesh
